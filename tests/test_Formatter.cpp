//++
// test_Formatter.cpp -> assembly language formatter unit tests
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
#include "Operand.hpp"          // COperand class
#include "Instruction.hpp"      // CInstruction decoded instruction
#include "Decoder.hpp"          // Decode()
#include "Formatter.hpp"        // declarations for this module
using std::string;
using std::vector;


// Decode one instruction and return the text, or "" if it fails ...
static string Disassemble (const CFormatOptions &options, uint16_t w1, int w2=-1, int w3=-1)
{
  vector<uint8_t> ab;
  ab.push_back(LOBYTE(w1));  ab.push_back(HIBYTE(w1));
  if (w2 >= 0) {ab.push_back(LOBYTE(w2));  ab.push_back(HIBYTE(w2));}
  if (w3 >= 0) {ab.push_back(LOBYTE(w3));  ab.push_back(HIBYTE(w3));}
  CInstruction inst;  CDecodeError error;
  if (!Decode(ab, inst, error)) return string();
  return FormatInstruction(inst, options);
}

static string Disassemble (uint16_t w1, int w2=-1, int w3=-1)
  {return Disassemble(CFormatOptions(), w1, w2, w3);}


TEST(Formatter, DoubleOperand)
{
  EXPECT_EQ("MOV R5, R6", Disassemble(0x4506));
  EXPECT_EQ("MOV #4, R4", Disassemble(0x4034, 0x0004));
  EXPECT_EQ("MOV.B @R5+, 2(R6)", Disassemble(0x45F6, 0x0002));
  EXPECT_EQ("MOV 2(R5), 4(R6)", Disassemble(0x4596, 0x0002, 0x0004));
  EXPECT_EQ("MOV @R5, R6", Disassemble(0x4526));
  EXPECT_EQ("MOV R5, &512", Disassemble(0x4582, 0x0200));
  EXPECT_EQ("MOV 16(PC), R5", Disassemble(0x4015, 0x0010));
  EXPECT_EQ("ADD -2(R5), R6", Disassemble(0x5516, 0xFFFE));
  EXPECT_EQ("MOV R5, 2(R3)", Disassemble(0x4583, 0x0002));
}

TEST(Formatter, Constants)
{
  EXPECT_EQ("MOV 0, R5", Disassemble(0x4305));
  EXPECT_EQ("MOV -1, R5", Disassemble(0x4335));
  EXPECT_EQ("BIS 8, SR", Disassemble(0xD232));
}

TEST(Formatter, SingleOperand)
{
  EXPECT_EQ("RRC R5", Disassemble(0x1005));
  EXPECT_EQ("RRC.B R5", Disassemble(0x1045));
  EXPECT_EQ("SWPB R5", Disassemble(0x10C5));
  EXPECT_EQ("PUSH #4660", Disassemble(0x1230, 0x1234));
  EXPECT_EQ("CALL #17408", Disassemble(0x12B0, 0x4400));
  EXPECT_EQ("RETI", Disassemble(0x1300));
  EXPECT_EQ("RETI", Disassemble(0x137F));
}

TEST(Formatter, Jumps)
{
  EXPECT_EQ("JNE $-14", Disassemble(0x23F9));
  EXPECT_EQ("JEQ $+4", Disassemble(0x2402));
  EXPECT_EQ("JMP $+0", Disassemble(0x3C00));
  CFormatOptions options;  options.nRadix = 16;
  EXPECT_EQ("JNE $-14", Disassemble(options, 0x23F9));
}

TEST(Formatter, HexRadix)
{
  CFormatOptions options;  options.nRadix = 16;
  EXPECT_EQ("MOV #0x1234, R4", Disassemble(options, 0x4034, 0x1234));
  EXPECT_EQ("ADD -0x2(R5), R6", Disassemble(options, 0x5516, 0xFFFE));
  EXPECT_EQ("MOV R5, &0x200", Disassemble(options, 0x4582, 0x0200));
  EXPECT_EQ("MOV -1, R5", Disassemble(options, 0x4335));
}

TEST(Formatter, LowerCaseAndAliases)
{
  CFormatOptions options;
  options.fLowerCase = true;
  EXPECT_EQ("mov.b @r5+, 2(r6)", Disassemble(options, 0x45F6, 0x0002));
  EXPECT_EQ("jne $-14", Disassemble(options, 0x23F9));
  options.fLowerCase = false;  options.fRegisterAliases = false;
  EXPECT_EQ("MOV @R1+, R0", Disassemble(options, 0x4130));
  options.fRegisterAliases = true;
  EXPECT_EQ("MOV @SP+, PC", Disassemble(options, 0x4130));
}

TEST(Formatter, OperandsWithoutDecoding)
{
  EXPECT_EQ("R15", FormatOperand(COperand::Register(15)));
  EXPECT_EQ("SP", FormatOperand(COperand::Register(REG_SP)));
  EXPECT_EQ("@R7+", FormatOperand(COperand::AutoIncrement(7, SIZE_WORD)));
  EXPECT_EQ("#65535", FormatOperand(COperand::Immediate(0xFFFF)));
  EXPECT_EQ("4", FormatOperand(COperand::Constant(REG_SR, 4)));
  EXPECT_EQ("", FormatOperand(COperand()));
}

TEST(Formatter, InstructionsWithoutDecoding)
{
  uint16_t wOpcode = 0x4506;
  CInstruction inst = CInstruction::DoubleOperand("MOV", SIZE_WORD,
    COperand::Register(5), COperand::Register(6), &wOpcode, 1);
  EXPECT_EQ("MOV R5, R6", FormatInstruction(inst));
  EXPECT_EQ("", FormatInstruction(CInstruction()));
}

TEST(Formatter, Listing)
{
  const uint8_t abMov[] = {0x06, 0x45};
  CInstruction inst;  CDecodeError error;
  ASSERT_TRUE(Decode(abMov, sizeof(abMov), inst, error));
  EXPECT_EQ("4506            MOV R5, R6", FormatListing(inst));

  const uint8_t abIndexed[] = {0x96, 0x45, 0x02, 0x00, 0x04, 0x00};
  ASSERT_TRUE(Decode(abIndexed, sizeof(abIndexed), inst, error));
  EXPECT_EQ("4596 0002 0004  MOV 2(R5), 4(R6)", FormatListing(inst));

  const uint8_t abJump[] = {0xF9, 0x23};
  ASSERT_TRUE(Decode(abJump, sizeof(abJump), inst, error));
  EXPECT_EQ("C000/ 23F9            JNE $-14\t; BFF4", FormatListing(0xC000, inst));
}
