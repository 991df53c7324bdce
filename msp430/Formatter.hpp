//++
// Formatter.hpp -> MSP430 assembly language text formatter
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
//   These routines turn a decoded CInstruction (or just one COperand) back
// into assembly language text, e.g. "MOV.B @R5+, 2(R6)" or "JNE $-14".  They
// depend only on the decoded values, so you can format an instruction that
// you built yourself without ever calling Decode().
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <string>               // C++ std::string class, et al ...
#include "MSP430.hpp"           // global declarations for this project
using std::string;              // ...
class COperand;                 // ...
class CInstruction;             // ...


class CFormatOptions {
  //++
  // Run time options for the formatter ...
  //--
public:
  CFormatOptions()
    : fEmulated(false), fRegisterAliases(REGISTER_ALIASES != 0), fLowerCase(false), nRadix(DEFAULT_RADIX)
      {};
public:
  bool     fEmulated;           // show emulated mnemonics (CLR, RET, etc)
  bool     fRegisterAliases;    // show R0, R1, R2 as PC, SP, SR
  bool     fLowerCase;          // lower case mnemonics and registers
  unsigned nRadix;              // 10 or 16 for offsets, addresses and immediates
};

// Format one operand, one instruction, or one listing line ...
extern string FormatOperand (const COperand &Operand, const CFormatOptions &Options = CFormatOptions());
extern string FormatInstruction (const CInstruction &Inst, const CFormatOptions &Options = CFormatOptions());
extern string FormatListing (const CInstruction &Inst, const CFormatOptions &Options = CFormatOptions());
extern string FormatListing (address_t wLoc, const CInstruction &Inst, const CFormatOptions &Options = CFormatOptions());
