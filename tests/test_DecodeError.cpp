//++
// test_DecodeError.cpp -> CDecodeError unit tests
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
#include <gtest/gtest.h>        // GoogleTest framework
#include "DecodeError.hpp"      // CDecodeError failure codes


TEST(DecodeError, DefaultIsNoError)
{
  CDecodeError error;
  EXPECT_FALSE(error.IsError());
  EXPECT_EQ(CDecodeError::NONE, error.GetCode());
  EXPECT_EQ("no error", error.ToString());
}

TEST(DecodeError, Messages)
{
  CDecodeError error;
  error.SetTruncated(2, 1);
  EXPECT_EQ("truncated input (2 bytes needed, 1 available)", error.ToString());
  error.SetUnknownOpcode(0x0000);
  EXPECT_EQ("unknown opcode 0x0000", error.ToString());
  error.SetReservedEncoding(0xFFFF);
  EXPECT_EQ("reserved encoding 0xFFFF", error.ToString());
  EXPECT_EQ(0xFFFF, error.GetRawWord());
}

TEST(DecodeError, SettersClearOldFields)
{
  CDecodeError error;
  error.SetTruncated(6, 4);
  error.SetUnknownOpcode(0x0ABC);
  EXPECT_EQ(0u, error.GetNeeded());
  EXPECT_EQ(0u, error.GetAvailable());
  CDecodeError other;  other.SetUnknownOpcode(0x0ABC);
  EXPECT_EQ(other, error);
  other.SetUnknownOpcode(0x0ABD);
  EXPECT_NE(other, error);
  error.Clear();
  EXPECT_FALSE(error.IsError());
}
