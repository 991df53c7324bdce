//++
// DecodeError.cpp -> CDecodeError methods
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
#include "DecodeError.hpp"      // declarations for this module


/*static*/ const char *CDecodeError::CodeToString (ERROR_CODE nCode)
{
  switch (nCode) {
    case NONE:              return "no error";
    case TRUNCATED_INPUT:   return "truncated input";
    case UNKNOWN_OPCODE:    return "unknown opcode";
    case RESERVED_ENCODING: return "reserved encoding";
    default:                return "unknown error";
  }
}

string CDecodeError::ToString() const
{
  //++
  // Return a message suitable for the log or an error report ...
  //--
  switch (m_nCode) {
    case TRUNCATED_INPUT:
      return FormatString("%s (%zu bytes needed, %zu available)",
        CodeToString(m_nCode), m_cbNeeded, m_cbAvailable);
    case UNKNOWN_OPCODE:
    case RESERVED_ENCODING:
      return FormatString("%s 0x%04X", CodeToString(m_nCode), m_wRaw);
    default:
      return string(CodeToString(m_nCode));
  }
}
