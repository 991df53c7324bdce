//++
// Formatter.cpp -> MSP430 assembly language text formatter
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
//   Operands are formatted like this -
//
//      Rn              register
//      x(Rn)           indexed, and symbolic with Rn = PC
//      &addr           absolute
//      @Rn             indirect
//      @Rn+            indirect autoincrement
//      #n              immediate (@PC+)
//      n               constant generator, always signed decimal
//
//   Offsets, absolute addresses and immediate values use the radix from the
// options.  Indexed offsets are signed (so "-2(R5)", never "65534(R5)") and
// addresses and immediates are unsigned.  Jumps are shown with the signed
// byte offset from the jump, "$+4" or "$-14", always in decimal.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include "EMULIB.hpp"           // emulator library definitions
#include "MSP430.hpp"           // global declarations for this project
#include "MSP430opcodes.hpp"    // RegisterName(), etc ...
#include "Operand.hpp"          // COperand class
#include "Instruction.hpp"      // CInstruction decoded instruction
#include "Emulated.hpp"         // FindEmulation()
#include "Formatter.hpp"        // declarations for this module


PRIVATE string FormatUnsigned (uint16_t wValue, unsigned nRadix)
{
  return (nRadix == 16) ? FormatString("0x%X", wValue) : FormatString("%u", wValue);
}

PRIVATE string FormatSigned (int16_t nValue, unsigned nRadix)
{
  //++
  // Format a signed value, with a leading "-" if it's negative ...
  //--
  if (nRadix != 16) return FormatString("%d", nValue);
  int32_t lValue = nValue;
  return (lValue < 0) ? FormatString("-0x%X", -lValue) : FormatString("0x%X", lValue);
}

PRIVATE string FormatMnemonic (const char *pszName, bool fByte)
{
  return fByte ? FormatString("%s.B", pszName) : string(pszName);
}

PUBLIC string FormatOperand (const COperand &Operand, const CFormatOptions &Options)
{
  //++
  // Format a single operand in standard MSP430 assembler syntax ...
  //--
  const char *pszReg = RegisterName(Operand.GetRegister(), Options.fRegisterAliases);
  string sText;
  switch (Operand.GetMode()) {
    case COperand::MODE_REGISTER:
      sText = pszReg;  break;
    case COperand::MODE_INDEXED:
    case COperand::MODE_SYMBOLIC:
      sText = FormatSigned(Operand.GetOffset(), Options.nRadix) + "(" + pszReg + ")";  break;
    case COperand::MODE_ABSOLUTE:
      sText = "&" + FormatUnsigned(Operand.GetAddress(), Options.nRadix);  break;
    case COperand::MODE_INDIRECT:
      sText = FormatString("@%s", pszReg);  break;
    case COperand::MODE_AUTOINCREMENT:
      sText = FormatString("@%s+", pszReg);  break;
    case COperand::MODE_IMMEDIATE:
      sText = "#" + FormatUnsigned(Operand.GetValue(), Options.nRadix);  break;
    case COperand::MODE_CONSTANT:
      sText = FormatString("%d", Operand.GetConstant());  break;
    default:
      break;
  }
  return Options.fLowerCase ? ToLower(sText) : sText;
}

PRIVATE string FormatEmulated (const CInstruction &Inst, const EMULATION &Emulation, const CFormatOptions &Options)
{
  //++
  // Format an instruction using its emulated mnemonic ...
  //--
  string sText = FormatMnemonic(Emulation.pszName, Emulation.fSized && Inst.IsByte());
  if (Options.fLowerCase) sText = ToLower(sText);
  if (Emulation.nOperand == EMU_SOURCE)
    sText += " " + FormatOperand(Inst.GetSource(), Options);
  else if (Emulation.nOperand == EMU_DESTINATION)
    sText += " " + FormatOperand(Inst.GetDestination(), Options);
  return sText;
}

PUBLIC string FormatInstruction (const CInstruction &Inst, const CFormatOptions &Options)
{
  //++
  //   Format a complete instruction - "MNEMONIC[.B] [src, ]dst" or, for a
  // jump, "MNEMONIC $offset".  An empty (never decoded) instruction gives an
  // empty string.
  //--
  if (!Inst.IsValid()) return string();
  EMULATION emulation;
  if (Options.fEmulated && FindEmulation(Inst, emulation))
    return FormatEmulated(Inst, emulation, Options);

  string sText;
  if (Inst.GetFormat() == FORMAT_JUMP) {
    sText = FormatString("%s $%+d", Inst.GetMnemonic(), Inst.GetByteOffset());
    return Options.fLowerCase ? ToLower(sText) : sText;
  }
  sText = FormatMnemonic(Inst.GetMnemonic(), Inst.IsByte());
  if (Options.fLowerCase) sText = ToLower(sText);
  if (Inst.HasSource())
    sText += " " + FormatOperand(Inst.GetSource(), Options) + ",";
  if (Inst.HasDestination())
    sText += " " + FormatOperand(Inst.GetDestination(), Options);
  return sText;
}

PUBLIC string FormatListing (const CInstruction &Inst, const CFormatOptions &Options)
{
  //++
  //   Format a listing line - the opcode and any extension words in hex,
  // padded to a fixed width, and then the assembly text -
  //
  //    4506            MOV R5, R6
  //    4034 0004       MOV #4, R4
  //--
  string sWords;
  for (size_t i = 0;  i < Inst.GetWordCount();  ++i) {
    if (i > 0) sWords += " ";
    sWords += FormatString("%04X", Inst.GetWord(i));
  }
  return FormatString("%-15s %s", sWords.c_str(), FormatInstruction(Inst, Options).c_str());
}

PUBLIC string FormatListing (address_t wLoc, const CInstruction &Inst, const CFormatOptions &Options)
{
  //++
  //   The same, but with the address first.  For jumps the absolute target is
  // added as a comment, since that's usually what you really want to know.
  //--
  string sText = FormatString("%04X/ %s", wLoc, FormatListing(Inst, Options).c_str());
  if (Inst.GetFormat() == FORMAT_JUMP)
    sText += FormatString("\t; %04X", Inst.GetJumpTarget(wLoc));
  return sText;
}
