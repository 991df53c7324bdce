//++
// test_Emulated.cpp -> emulated instruction recognizer unit tests
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
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#include <stdint.h>             // uint8_t, uint32_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include <gtest/gtest.h>        // GoogleTest framework
#include "EMULIB.hpp"           // emulator library definitions
#include "MSP430.hpp"           // global declarations for this project
#include "DecodeError.hpp"      // CDecodeError failure codes
#include "Instruction.hpp"      // CInstruction decoded instruction
#include "Decoder.hpp"          // Decode()
#include "Emulated.hpp"         // FindEmulation()
#include "Formatter.hpp"        // FormatInstruction()
using std::string;
using std::vector;


// Decode one instruction and format it with emulated mnemonics ...
static string Emulate (uint16_t w1, int w2=-1)
{
  vector<uint8_t> ab;
  ab.push_back(LOBYTE(w1));  ab.push_back(HIBYTE(w1));
  if (w2 >= 0) {ab.push_back(LOBYTE(w2));  ab.push_back(HIBYTE(w2));}
  CInstruction inst;  CDecodeError error;
  if (!Decode(ab, inst, error)) return string();
  CFormatOptions options;  options.fEmulated = true;
  return FormatInstruction(inst, options);
}


TEST(Emulated, NoOperandForms)
{
  EXPECT_EQ("NOP",  Emulate(0x4303));
  EXPECT_EQ("RET",  Emulate(0x4130));
  EXPECT_EQ("CLRC", Emulate(0xC312));
  EXPECT_EQ("CLRZ", Emulate(0xC322));
  EXPECT_EQ("CLRN", Emulate(0xC222));
  EXPECT_EQ("DINT", Emulate(0xC232));
  EXPECT_EQ("SETC", Emulate(0xD312));
  EXPECT_EQ("SETZ", Emulate(0xD322));
  EXPECT_EQ("SETN", Emulate(0xD222));
  EXPECT_EQ("EINT", Emulate(0xD232));
}

TEST(Emulated, DestinationForms)
{
  EXPECT_EQ("CLR R5",   Emulate(0x4305));
  EXPECT_EQ("CLR.B R5", Emulate(0x4345));
  EXPECT_EQ("POP R5",   Emulate(0x4135));
  EXPECT_EQ("POP.B R5", Emulate(0x4175));
  EXPECT_EQ("INC R5",   Emulate(0x5315));
  EXPECT_EQ("INCD R5",  Emulate(0x5325));
  EXPECT_EQ("DEC R5",   Emulate(0x8315));
  EXPECT_EQ("DECD R5",  Emulate(0x8325));
  EXPECT_EQ("ADC R5",   Emulate(0x6305));
  EXPECT_EQ("SBC R5",   Emulate(0x7305));
  EXPECT_EQ("DADC R5",  Emulate(0xA305));
  EXPECT_EQ("INV R5",   Emulate(0xE335));
  EXPECT_EQ("TST R5",   Emulate(0x9305));
  EXPECT_EQ("RLA R5",   Emulate(0x5505));
  EXPECT_EQ("RLC R5",   Emulate(0x6505));
}

TEST(Emulated, BranchShowsSource)
{
  EXPECT_EQ("BR R5", Emulate(0x4500));
  EXPECT_EQ("BR #4660", Emulate(0x4030, 0x1234));
  EXPECT_EQ("BR 0", Emulate(0x4300));
}

TEST(Emulated, NotEmulated)
{
  // Immediate #1 from an extension word is NOT INC ...
  EXPECT_EQ("ADD #1, R5", Emulate(0x5035, 0x0001));
  // RLA needs the same source and destination ...
  EXPECT_EQ("ADD R5, R6", Emulate(0x5506));
  // Byte forms of the status register operations ...
  EXPECT_EQ("BIC.B 1, SR", Emulate(0xC352));
  // Jumps and single operand instructions never have emulated forms ...
  EXPECT_EQ("JNE $-14", Emulate(0x23F9));
  EXPECT_EQ("PUSH R5", Emulate(0x1205));
}

TEST(Emulated, DecodeKeepsCoreMnemonic)
{
  const uint8_t abData[] = {0x30, 0x41};
  CInstruction inst;  CDecodeError error;
  ASSERT_TRUE(Decode(abData, sizeof(abData), inst, error));
  EXPECT_STREQ("MOV", inst.GetMnemonic());
  EXPECT_EQ("MOV @SP+, PC", FormatInstruction(inst));
  EMULATION emulation;
  ASSERT_TRUE(FindEmulation(inst, emulation));
  EXPECT_STREQ("RET", emulation.pszName);
  EXPECT_EQ(EMU_NONE, emulation.nOperand);
}
