//++
// WordCursor.hpp -> CWordCursor (little endian word reader) class
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
//   A CWordCursor wraps a caller's buffer of instruction bytes and hands out
// 16 bit little endian words from it, one at a time.  It never reads past
// the end of the buffer - a read that would do so fails with TRUNCATED_INPUT
// instead.  The cursor doesn't own the buffer and never modifies it.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <stddef.h>             // size_t ...
class CDecodeError;             // ...


class CWordCursor {
  //++
  // Bounds checked instruction word reader ...
  //--

  // Constructor and destructor ...
public:
  CWordCursor (const uint8_t *pabData, size_t cbData)
    : m_pabData(pabData), m_cbData(cbData), m_cbConsumed(0)
      {};
  virtual ~CWordCursor() {};
private:
  // Disallow copy and assignments!
  CWordCursor (const CWordCursor &) = delete;
  CWordCursor& operator= (CWordCursor const &) = delete;

  // Properties ...
public:
  // Return the number of bytes consumed so far ...
  size_t Consumed() const {return m_cbConsumed;}
  // Return the number of bytes still available ...
  size_t Remaining() const {return m_cbData - m_cbConsumed;}
  // Return the total buffer size ...
  size_t GetLength() const {return m_cbData;}

  // Public methods ...
public:
  // Read a word at the current position plus cbOffset, without advancing ...
  bool PeekWord (uint16_t &wData, CDecodeError &Error, size_t cbOffset=0) const;
  // Read the word at the current position and advance past it ...
  bool TakeWord (uint16_t &wData, CDecodeError &Error);

  // Private member data ...
private:
  const uint8_t  *m_pabData;    // the caller's instruction bytes
  const size_t    m_cbData;     // size of that buffer
  size_t          m_cbConsumed; // number of bytes taken so far
};
