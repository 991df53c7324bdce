//++
// Decoder.hpp -> MSP430 instruction decoder interface
//
//   COPYRIGHT (C) 2015-2026 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the MSP430DIS disassembler project.  MSP430DIS is
// free software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    MSP430DIS is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with MSP430DIS.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   Decode() turns the first 2, 4 or 6 bytes of a buffer into one
// CInstruction.  Any bytes after the instruction are ignored.  If the bytes
// don't make a valid instruction then it returns false, fills in the
// CDecodeError, and leaves the CInstruction alone.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <stddef.h>             // size_t ...
#include <vector>               // C++ std::vector template
using std::vector;              // ...
class CInstruction;             // ...
class CDecodeError;             // ...

// Decode one instruction from a buffer ...
extern bool Decode (const uint8_t *pabData, size_t cbData, CInstruction &Inst, CDecodeError &Error);
extern bool Decode (const vector<uint8_t> &abData, CInstruction &Inst, CDecodeError &Error);
