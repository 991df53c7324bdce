//++
// Emulated.cpp -> MSP430 emulated instruction recognizer
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
//   Every emulated instruction is a double operand instruction, so the
// recognizer is just a table of core mnemonic, source pattern and
// destination pattern.  The table is searched in order and the first match
// wins, which matters in a few places -
//
//   * MOV #0,R3 is NOP, not CLR R3
//   * MOV @SP+,PC is RET, not POP PC or BR @SP+
//   * MOV #0,PC is BR #0, not CLR PC
//
//   Constants must come from the constant generators.  MOV #0,R5 written
// with an immediate extension word (@PC+) is a four byte instruction and is
// NOT a CLR - the assembler would never have generated it that way.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <string.h>             // strcmp() ...
#include "EMULIB.hpp"           // emulator library definitions
#include "MSP430.hpp"           // global declarations for this project
#include "MSP430opcodes.hpp"    // INSTRUCTION_FORMAT, etc ...
#include "Operand.hpp"          // COperand class
#include "Instruction.hpp"      // CInstruction decoded instruction
#include "Emulated.hpp"         // declarations for this module

// Source operand patterns ...
enum _SOURCE_PATTERNS {
  SRC_ANY,              // anything at all
  SRC_CONSTANT,         // a constant generator with a specific value
  SRC_POP,              // @SP+
  SRC_SAME,             // identical to the destination
};
typedef enum _SOURCE_PATTERNS SOURCE_PATTERN;

// Destination operand patterns ...
enum _DESTINATION_PATTERNS {
  DST_ANY,              // anything at all
  DST_PC,               // register PC
  DST_SR,               // register SR
  DST_CG2,              // register R3
};
typedef enum _DESTINATION_PATTERNS DESTINATION_PATTERN;

// One row of the emulation table ...
struct _EMULATION_RULE {
  const char          *pszCore;     // core mnemonic
  SOURCE_PATTERN       nSource;     // source pattern
  int16_t              nConstant;   //  ... and constant for SRC_CONSTANT
  DESTINATION_PATTERN  nDestination;// destination pattern
  bool                 fWordOnly;   // TRUE if byte forms don't match
  EMULATION            Emulation;   // the result
};
typedef struct _EMULATION_RULE EMULATION_RULE;

PRIVATE const EMULATION_RULE g_aEmulations[] = {
  {"MOV",  SRC_CONSTANT, 0,      DST_CG2, true,  {"NOP",  EMU_NONE,        false}},
  {"MOV",  SRC_POP,      0,      DST_PC,  true,  {"RET",  EMU_NONE,        false}},
  {"MOV",  SRC_POP,      0,      DST_ANY, false, {"POP",  EMU_DESTINATION, true }},
  {"MOV",  SRC_ANY,      0,      DST_PC,  true,  {"BR",   EMU_SOURCE,      false}},
  {"MOV",  SRC_CONSTANT, 0,      DST_ANY, false, {"CLR",  EMU_DESTINATION, true }},
  {"ADD",  SRC_CONSTANT, 1,      DST_ANY, false, {"INC",  EMU_DESTINATION, true }},
  {"ADD",  SRC_CONSTANT, 2,      DST_ANY, false, {"INCD", EMU_DESTINATION, true }},
  {"ADD",  SRC_SAME,     0,      DST_ANY, false, {"RLA",  EMU_DESTINATION, true }},
  {"ADDC", SRC_CONSTANT, 0,      DST_ANY, false, {"ADC",  EMU_DESTINATION, true }},
  {"ADDC", SRC_SAME,     0,      DST_ANY, false, {"RLC",  EMU_DESTINATION, true }},
  {"SUB",  SRC_CONSTANT, 1,      DST_ANY, false, {"DEC",  EMU_DESTINATION, true }},
  {"SUB",  SRC_CONSTANT, 2,      DST_ANY, false, {"DECD", EMU_DESTINATION, true }},
  {"SUBC", SRC_CONSTANT, 0,      DST_ANY, false, {"SBC",  EMU_DESTINATION, true }},
  {"DADD", SRC_CONSTANT, 0,      DST_ANY, false, {"DADC", EMU_DESTINATION, true }},
  {"XOR",  SRC_CONSTANT, -1,     DST_ANY, false, {"INV",  EMU_DESTINATION, true }},
  {"CMP",  SRC_CONSTANT, 0,      DST_ANY, false, {"TST",  EMU_DESTINATION, true }},
  {"BIC",  SRC_CONSTANT, SR_C,   DST_SR,  true,  {"CLRC", EMU_NONE,        false}},
  {"BIC",  SRC_CONSTANT, SR_Z,   DST_SR,  true,  {"CLRZ", EMU_NONE,        false}},
  {"BIC",  SRC_CONSTANT, SR_N,   DST_SR,  true,  {"CLRN", EMU_NONE,        false}},
  {"BIC",  SRC_CONSTANT, SR_GIE, DST_SR,  true,  {"DINT", EMU_NONE,        false}},
  {"BIS",  SRC_CONSTANT, SR_C,   DST_SR,  true,  {"SETC", EMU_NONE,        false}},
  {"BIS",  SRC_CONSTANT, SR_Z,   DST_SR,  true,  {"SETZ", EMU_NONE,        false}},
  {"BIS",  SRC_CONSTANT, SR_N,   DST_SR,  true,  {"SETN", EMU_NONE,        false}},
  {"BIS",  SRC_CONSTANT, SR_GIE, DST_SR,  true,  {"EINT", EMU_NONE,        false}},
};
#define EMULATION_COUNT (sizeof(g_aEmulations)/sizeof(EMULATION_RULE))


PRIVATE bool MatchSource (const EMULATION_RULE &Rule, const COperand &src, const COperand &dst)
{
  switch (Rule.nSource) {
    case SRC_ANY:
      return true;
    case SRC_CONSTANT:
      return (src.GetMode() == COperand::MODE_CONSTANT) && (src.GetConstant() == Rule.nConstant);
    case SRC_POP:
      return (src.GetMode() == COperand::MODE_AUTOINCREMENT) && (src.GetRegister() == REG_SP);
    case SRC_SAME:
      return src == dst;
    default:
      return false;
  }
}

PRIVATE bool MatchDestination (const EMULATION_RULE &Rule, const COperand &dst)
{
  if (Rule.nDestination == DST_ANY) return true;
  if (dst.GetMode() != COperand::MODE_REGISTER) return false;
  switch (Rule.nDestination) {
    case DST_PC:  return dst.GetRegister() == REG_PC;
    case DST_SR:  return dst.GetRegister() == REG_SR;
    case DST_CG2: return dst.GetRegister() == REG_CG2;
    default:      return false;
  }
}

PUBLIC bool FindEmulation (const CInstruction &Inst, EMULATION &Emulation)
{
  //++
  //   Search the emulation table for the first rule that matches this
  // instruction.  If one does, fill in Emulation and return true.  If none
  // match (including for every single operand and jump instruction) then
  // return false and leave Emulation alone.
  //--
  if (Inst.GetFormat() != FORMAT_DOUBLE) return false;
  for (size_t i = 0;  i < EMULATION_COUNT;  ++i) {
    const EMULATION_RULE &rule = g_aEmulations[i];
    if (strcmp(rule.pszCore, Inst.GetMnemonic()) != 0) continue;
    if (rule.fWordOnly && Inst.IsByte()) continue;
    if (!MatchDestination(rule, Inst.GetDestination())) continue;
    if (!MatchSource(rule, Inst.GetSource(), Inst.GetDestination())) continue;
    Emulation = rule.Emulation;
    return true;
  }
  return false;
}
