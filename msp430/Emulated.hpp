//++
// Emulated.hpp -> MSP430 emulated instruction recognizer
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
//   The MSP430 assembler has two dozen "emulated" instructions which are
// really just core instructions with a particular operand, usually one of
// the constant generators.  CLR R5, for example, is really MOV #0,R5 and RET
// is MOV @SP+,PC.  FindEmulation() recognizes these so that the formatter
// can show them the way a programmer would have written them.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
class CInstruction;             // ...

// Which of the core operands an emulated instruction shows ...
enum _EMULATED_OPERANDS {
  EMU_NONE,             // no operand (NOP, RET, CLRC, etc)
  EMU_SOURCE,           // the core source (BR)
  EMU_DESTINATION,      // the core destination (CLR, INC, POP, etc)
};
typedef enum _EMULATED_OPERANDS EMULATED_OPERAND;

// One emulated instruction ...
struct _EMULATION {
  const char       *pszName;    // emulated mnemonic
  EMULATED_OPERAND  nOperand;   // which operand to show
  bool              fSized;     // TRUE if ".B" is allowed
};
typedef struct _EMULATION EMULATION;

// Find the emulated form of a core instruction, if it has one ...
extern bool FindEmulation (const CInstruction &Inst, EMULATION &Emulation);
