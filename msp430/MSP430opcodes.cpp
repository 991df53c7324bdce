//++
// MSP430opcodes.cpp -> MSP430 opcode tables
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
//   This file contains tables of ASCII mnemonics for MSP430 opcodes, one for
// each of the three instruction formats.  The tables are searched the same
// way the PDP11 tables are - the first entry where (opcode & mask) == value
// wins.  Only the core (non-emulated) instructions appear here; the emulated
// ones (CLR, RET, NOP, etc) are recognized separately in Emulated.cpp.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include "EMULIB.hpp"           // emulator library definitions
#include "MSP430.hpp"           // global declarations for this project
#include "MSP430opcodes.hpp"    // declarations for this module

// Double operand instructions - the opcode is the top nibble ...
PRIVATE const OP_CODE g_aDoubleOperand[] = {
  {"MOV",   0x4000, 0xF000, 2, true},
  {"ADD",   0x5000, 0xF000, 2, true},
  {"ADDC",  0x6000, 0xF000, 2, true},
  {"SUBC",  0x7000, 0xF000, 2, true},
  {"SUB",   0x8000, 0xF000, 2, true},
  {"CMP",   0x9000, 0xF000, 2, true},
  {"DADD",  0xA000, 0xF000, 2, true},
  {"BIT",   0xB000, 0xF000, 2, true},
  {"BIC",   0xC000, 0xF000, 2, true},
  {"BIS",   0xD000, 0xF000, 2, true},
  {"XOR",   0xE000, 0xF000, 2, true},
  {"AND",   0xF000, 0xF000, 2, true},
};
#define DOUBLE_COUNT (sizeof(g_aDoubleOperand)/sizeof(OP_CODE))

//   Single operand instructions - the opcode is the top nine bits.  SWPB, SXT
// and CALL always operate on words and ignore the B/W bit.  RETI has no
// operand at all, and the rest of its bits are don't cares ...
PRIVATE const OP_CODE g_aSingleOperand[] = {
  {"RRC",   0x1000, 0xFF80, 1, true },
  {"SWPB",  0x1080, 0xFF80, 1, false},
  {"RRA",   0x1100, 0xFF80, 1, true },
  {"SXT",   0x1180, 0xFF80, 1, false},
  {"PUSH",  0x1200, 0xFF80, 1, true },
  {"CALL",  0x1280, 0xFF80, 1, false},
  {"RETI",  0x1300, 0xFF80, 0, false},
};
#define SINGLE_COUNT (sizeof(g_aSingleOperand)/sizeof(OP_CODE))

//   Jumps - the condition is bits 10..12.  Note that the order here MUST
// match the JUMP_CONDITION enumeration!
PRIVATE const OP_CODE g_aJumps[] = {
  {"JNE",   0x2000, 0xFC00, 0, false},
  {"JEQ",   0x2400, 0xFC00, 0, false},
  {"JNC",   0x2800, 0xFC00, 0, false},
  {"JC",    0x2C00, 0xFC00, 0, false},
  {"JN",    0x3000, 0xFC00, 0, false},
  {"JGE",   0x3400, 0xFC00, 0, false},
  {"JL",    0x3800, 0xFC00, 0, false},
  {"JMP",   0x3C00, 0xFC00, 0, false},
};
#define JUMP_COUNT (sizeof(g_aJumps)/sizeof(OP_CODE))

// MSP430 register names, with and without aliases ...
PRIVATE const char *g_apszRegisters[MAXREG] = {
  "PC", "SP", "SR", "R3",  "R4",  "R5",  "R6",  "R7",
  "R8", "R9", "R10", "R11", "R12", "R13", "R14", "R15"
};
PRIVATE const char *g_apszRegisterNumbers[MAXREG] = {
  "R0", "R1", "R2", "R3",  "R4",  "R5",  "R6",  "R7",
  "R8", "R9", "R10", "R11", "R12", "R13", "R14", "R15"
};


PRIVATE const OP_CODE *SearchTable (const OP_CODE *paTable, size_t nCount, uint16_t wOpcode)
{
  //++
  //   Search an opcode table for the first entry that matches this opcode,
  // and return a pointer to it.  If nothing matches, return NULL ...
  //--
  for (size_t i = 0;  i < nCount;  ++i) {
    if ((wOpcode & paTable[i].wMask) == paTable[i].wOpcode) return &paTable[i];
  }
  return NULL;
}

PUBLIC const OP_CODE *LookupDoubleOperand (uint16_t wOpcode)
  {return SearchTable(g_aDoubleOperand, DOUBLE_COUNT, wOpcode);}
PUBLIC const OP_CODE *LookupSingleOperand (uint16_t wOpcode)
  {return SearchTable(g_aSingleOperand, SINGLE_COUNT, wOpcode);}
PUBLIC const OP_CODE *LookupJump (uint16_t wOpcode)
  {return SearchTable(g_aJumps, JUMP_COUNT, wOpcode);}

PUBLIC const char *RegisterName (uint4_t nRegister, bool fAliases)
{
  //++
  // Return the name of a register (and only the low four bits count!) ...
  //--
  return fAliases ? g_apszRegisters[MASK4(nRegister)] : g_apszRegisterNumbers[MASK4(nRegister)];
}
