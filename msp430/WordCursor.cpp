//++
// WordCursor.cpp -> CWordCursor methods
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
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include "EMULIB.hpp"           // emulator library definitions
#include "DecodeError.hpp"      // CDecodeError failure codes
#include "WordCursor.hpp"       // declarations for this module


bool CWordCursor::PeekWord (uint16_t &wData, CDecodeError &Error, size_t cbOffset) const
{
  //++
  //   Fetch the word that starts cbOffset bytes past the current position.
  // Remember that the MSP430 is little endian - the low byte comes first!
  // If there aren't two whole bytes left then fill in a TRUNCATED_INPUT error
  // and return false.  Byte counts in the error are relative to the start of
  // the buffer, which is the start of the instruction.
  //--
  size_t cbStart = m_cbConsumed + cbOffset;
  if ((cbStart > m_cbData) || ((m_cbData - cbStart) < 2)) {
    Error.SetTruncated(cbStart+2, m_cbData);  return false;
  }
  wData = MKWORD(m_pabData[cbStart+1], m_pabData[cbStart]);
  return true;
}

bool CWordCursor::TakeWord (uint16_t &wData, CDecodeError &Error)
{
  //++
  // Fetch the next word and advance past it ...
  //--
  if (!PeekWord(wData, Error)) return false;
  m_cbConsumed += 2;
  return true;
}
