//++
// MSP430opcodes.hpp -> MSP430 opcodes, mnemonics and register names
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
//   This file contains MSP430 opcode tables, mnemonics and register names for
// the disassembler.  The MSP430 has only three instruction formats, and they
// partition the opcode space by the number of leading bits -
//
//    0 0 1 c c c o o o o o o o o o o                 conditional jump
//    0 0 0 1 0 0 o o o b a a r r r r                 single operand
//    o o o o s s s s d b a a r r r r  (oooo >= 4)    double operand
//
// Anything else (e.g. 0x0000..0x0FFF, or 0x1380..0x1FFF) is not a valid
// MSP430 opcode.
//
// REVISION HISTORY:
// 19-OCT-26        New file, based on the PDP11 opcode tables.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include "EMULIB.hpp"           // MASK10(), etc ...
#include "MSP430.hpp"           // global declarations for this project

// Instruction formats ...
enum _INSTRUCTION_FORMATS {
  FORMAT_NONE,          // not a valid instruction (yet)
  FORMAT_DOUBLE,        // double operand (source and destination)
  FORMAT_SINGLE,        // single operand
  FORMAT_JUMP,          // conditional (or unconditional) jump
};
typedef enum _INSTRUCTION_FORMATS INSTRUCTION_FORMAT;

// Jump conditions (these are the actual values of the condition field!) ...
enum _JUMP_CONDITIONS {
  COND_NE     = 0,      // JNE/JNZ - not equal or not zero
  COND_EQ     = 1,      // JEQ/JZ  - equal or zero
  COND_NC     = 2,      // JNC/JLO - no carry or lower (unsigned)
  COND_C      = 3,      // JC/JHS  - carry or higher or same (unsigned)
  COND_N      = 4,      // JN      - negative
  COND_GE     = 5,      // JGE     - greater or equal (signed)
  COND_L      = 6,      // JL      - less (signed)
  COND_ALWAYS = 7,      // JMP     - unconditional
  COND_NONE   = 8,      // not a jump at all
};
typedef enum _JUMP_CONDITIONS JUMP_CONDITION;

// Opcode definitions for the disassembler ...
struct _OP_CODE {
  const char   *pszName;        // the mnemonic for the opcode
  uint16_t      wOpcode;        // the actual opcode
  uint16_t      wMask;          // mask of significant bits
  uint8_t       nOperands;      // number of operands (0, 1 or 2)
  bool          fSized;         // TRUE if the B/W bit is significant
};
typedef struct _OP_CODE OP_CODE;

// Instruction word fields (masks and shifts) ...
#define JUMP_PREFIX_MASK    0xE000    // top three bits of a jump
#define JUMP_PREFIX         0x2000    //   ... must be 001
#define JUMP_COND_FIELD(w)  ((JUMP_CONDITION) (((w) >> 10) & 7))
#define JUMP_OFFSET(w)      MASK10(w)
#define SINGLE_PREFIX_MASK  0xFF80    // top nine bits of a single operand
#define DOUBLE_OPCODE(w)    (((w) >> 12) & 0xF)
#define SRC_REGISTER(w)     ((uint4_t) (((w) >> 8) & 0xF))
#define DST_AD(w)           ((uint1_t) (((w) >> 7) & 1))
#define BW_BIT(w)           ((uint1_t) (((w) >> 6) & 1))
#define AS_FIELD(w)         ((uint2_t) (((w) >> 4) & 3))
#define DST_REGISTER(w)     ((uint4_t) ( (w)       & 0xF))

// Opcode table lookups, one for each format ...
extern const OP_CODE *LookupDoubleOperand (uint16_t wOpcode);
extern const OP_CODE *LookupSingleOperand (uint16_t wOpcode);
extern const OP_CODE *LookupJump (uint16_t wOpcode);
// Return the name of a register, with or without the PC/SP/SR aliases ...
extern const char *RegisterName (uint4_t nRegister, bool fAliases=true);
