//++
// test_Operand.cpp -> operand resolver unit tests
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
#include <gtest/gtest.h>        // GoogleTest framework
#include "MSP430.hpp"           // global declarations for this project
#include "DecodeError.hpp"      // CDecodeError failure codes
#include "WordCursor.hpp"       // CWordCursor instruction word reader
#include "Operand.hpp"          // COperand and the operand resolver

// One extension word (0x1234) that the resolver may or may not take ...
static const uint8_t g_abExtension[] = {0x34, 0x12};


TEST(Operand, ConstantGeneratorR3)
{
  const int16_t anExpected[4] = {0, 1, 2, -1};
  for (uint2_t as = 0;  as < 4;  ++as) {
    CWordCursor cursor(g_abExtension, sizeof(g_abExtension));
    CDecodeError error;  COperand op;
    ASSERT_TRUE(ResolveOperand(as, REG_CG2, SIZE_WORD, cursor, op, error));
    EXPECT_EQ(COperand::MODE_CONSTANT, op.GetMode());
    EXPECT_EQ(anExpected[as], op.GetConstant());
    EXPECT_EQ(0u, cursor.Consumed()) << "As=" << (int) as;
  }
}

TEST(Operand, ConstantGeneratorR2)
{
  CDecodeError error;  COperand op;
  CWordCursor c1(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveOperand(2, REG_SR, SIZE_WORD, c1, op, error));
  EXPECT_EQ(COperand::Constant(REG_SR, 4), op);
  CWordCursor c2(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveOperand(3, REG_SR, SIZE_WORD, c2, op, error));
  EXPECT_EQ(COperand::Constant(REG_SR, 8), op);
  EXPECT_EQ(0u, c2.Consumed());
}

TEST(Operand, RegisterModes)
{
  CDecodeError error;  COperand op;
  CWordCursor cursor(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveOperand(0, 5, SIZE_WORD, cursor, op, error));
  EXPECT_EQ(COperand::Register(5), op);
  ASSERT_TRUE(ResolveOperand(0, REG_SR, SIZE_WORD, cursor, op, error));
  EXPECT_EQ(COperand::Register(REG_SR), op);
  ASSERT_TRUE(ResolveOperand(2, 7, SIZE_WORD, cursor, op, error));
  EXPECT_EQ(COperand::Indirect(7), op);
  EXPECT_EQ(0u, cursor.Consumed());
}

TEST(Operand, ExtensionWordModes)
{
  CDecodeError error;  COperand op;
  CWordCursor c1(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveOperand(1, 9, SIZE_WORD, c1, op, error));
  EXPECT_EQ(COperand::Indexed(9, 0x1234), op);
  EXPECT_EQ(2u, c1.Consumed());

  CWordCursor c2(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveOperand(1, REG_PC, SIZE_WORD, c2, op, error));
  EXPECT_EQ(COperand::MODE_SYMBOLIC, op.GetMode());
  EXPECT_EQ(REG_PC, op.GetRegister());

  CWordCursor c3(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveOperand(1, REG_SR, SIZE_WORD, c3, op, error));
  EXPECT_EQ(COperand::MODE_ABSOLUTE, op.GetMode());
  EXPECT_EQ(0x1234, op.GetAddress());

  CWordCursor c4(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveOperand(3, REG_PC, SIZE_WORD, c4, op, error));
  EXPECT_EQ(COperand::Immediate(0x1234), op);
  EXPECT_TRUE(op.HasExtension());
}

TEST(Operand, AutoIncrementStep)
{
  CDecodeError error;  COperand op;
  CWordCursor cursor(NULL, 0);
  ASSERT_TRUE(ResolveOperand(3, 5, SIZE_BYTE, cursor, op, error));
  EXPECT_EQ(COperand::MODE_AUTOINCREMENT, op.GetMode());
  EXPECT_EQ(1, op.GetIncrement());
  ASSERT_TRUE(ResolveOperand(3, REG_SP, SIZE_WORD, cursor, op, error));
  EXPECT_EQ(2, op.GetIncrement());
}

TEST(Operand, MissingExtensionWord)
{
  CDecodeError error;  COperand op = COperand::Register(4);
  CWordCursor cursor(NULL, 0);
  EXPECT_FALSE(ResolveOperand(1, 5, SIZE_WORD, cursor, op, error));
  EXPECT_EQ(CDecodeError::TRUNCATED_INPUT, error.GetCode());
  EXPECT_EQ(COperand::Register(4), op);
}

TEST(Operand, DestinationModes)
{
  CDecodeError error;  COperand op;
  CWordCursor c1(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveDestination(0, REG_CG2, c1, op, error));
  EXPECT_EQ(COperand::Register(REG_CG2), op);
  ASSERT_TRUE(ResolveDestination(0, REG_SR, c1, op, error));
  EXPECT_EQ(COperand::Register(REG_SR), op);
  EXPECT_EQ(0u, c1.Consumed());
  ASSERT_TRUE(ResolveDestination(1, REG_SR, c1, op, error));
  EXPECT_EQ(COperand::Absolute(0x1234), op);
}

TEST(Operand, DestinationR3IsNotAConstant)
{
  // The constant generator only applies to sources; 1(R3) is just indexed ...
  CDecodeError error;  COperand op;
  CWordCursor cursor(g_abExtension, sizeof(g_abExtension));
  ASSERT_TRUE(ResolveDestination(1, REG_CG2, cursor, op, error));
  EXPECT_EQ(COperand::Indexed(REG_CG2, 0x1234), op);
  EXPECT_EQ(2u, cursor.Consumed());
  EXPECT_FALSE(error.IsError());
}
