//++
// DecodeError.hpp -> CDecodeError (instruction decode failure) class
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
//   A CDecodeError records the reason why an instruction couldn't be decoded.
// Every failure is an ordinary, expected result for a disassembler that's fed
// arbitrary bytes, and none of them are fatal.  The decoder returns false and
// fills in one of these; it never throws and never aborts.
//
//   RESERVED_ENCODING is for a word that fits a format but that the
// architecture leaves undefined.  Every such word in the base MSP430 set
// (x(R3) destinations, RETI with stray low bits) actually executes, so the
// decoder never reports it today.  It stays in the error set so that callers
// and future extended instruction tables share a single failure vocabulary.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <stddef.h>             // size_t ...
#include <string>               // C++ std::string class, et al ...
using std::string;              // ...


class CDecodeError {
  //++
  // Instruction decode failure ...
  //--

  // Failure codes ...
public:
  enum _ERROR_CODES {
    NONE,                 // no error (yet!)
    TRUNCATED_INPUT,      // the buffer ends before a needed word
    UNKNOWN_OPCODE,       // no format or opcode matches this word
    RESERVED_ENCODING,    // well formed, but undefined by the architecture
  };
  typedef enum _ERROR_CODES ERROR_CODE;

  // Constructors ...
public:
  CDecodeError() {Clear();}
  virtual ~CDecodeError() {};

  // Properties ...
public:
  ERROR_CODE GetCode() const {return m_nCode;}
  bool IsError() const {return m_nCode != NONE;}
  //   For TRUNCATED_INPUT, the number of bytes needed and the number actually
  // available, both counted from the start of the instruction ...
  size_t GetNeeded() const {return m_cbNeeded;}
  size_t GetAvailable() const {return m_cbAvailable;}
  // For UNKNOWN_OPCODE and RESERVED_ENCODING, the offending word ...
  uint16_t GetRawWord() const {return m_wRaw;}

  // Methods ...
public:
  void Clear()
    {m_nCode = NONE;  m_cbNeeded = m_cbAvailable = 0;  m_wRaw = 0;}
  void SetTruncated (size_t cbNeeded, size_t cbAvailable)
    {Clear();  m_nCode = TRUNCATED_INPUT;  m_cbNeeded = cbNeeded;  m_cbAvailable = cbAvailable;}
  void SetUnknownOpcode (uint16_t wRaw)
    {Clear();  m_nCode = UNKNOWN_OPCODE;  m_wRaw = wRaw;}
  void SetReservedEncoding (uint16_t wRaw)
    {Clear();  m_nCode = RESERVED_ENCODING;  m_wRaw = wRaw;}
  // Return a printable message for this error ...
  string ToString() const;
  static const char *CodeToString (ERROR_CODE nCode);

  // Comparison (mostly for the unit tests) ...
public:
  bool operator== (const CDecodeError &e) const
    {return (m_nCode == e.m_nCode) && (m_cbNeeded == e.m_cbNeeded)
         && (m_cbAvailable == e.m_cbAvailable) && (m_wRaw == e.m_wRaw);}
  bool operator!= (const CDecodeError &e) const {return !(*this == e);}

  // Private member data ...
private:
  ERROR_CODE  m_nCode;          // what went wrong
  size_t      m_cbNeeded;       // bytes needed for TRUNCATED_INPUT
  size_t      m_cbAvailable;    // bytes actually available "    "
  uint16_t    m_wRaw;           // offending instruction word
};
