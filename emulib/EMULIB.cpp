//++
// EMULIB.cpp -> emulator library miscellaneous utility routines
//
//   COPYRIGHT (C) 2015-2026 BY SPARE TIME GIZMOS.  ALL RIGHTS RESERVED.
//
// LICENSE:
//    This file is part of the emulator library project.  EMULIB is free
// software; you may redistribute it and/or modify it under the terms of
// the GNU Affero General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any
// later version.
//
//    EMULIB is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE.  See the GNU Affero General Public License
// for more details.  You should have received a copy of the GNU Affero General
// Public License along with EMULIB.  If not, see http://www.gnu.org/licenses/.
//
// DESCRIPTION:
//   This file contains a few general purpose routines, mostly string
// formatting, that don't really belong anywhere else ...
//
// REVISION HISTORY:
// 19-OCT-26        New file for the MSP430 disassembler library.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <stdarg.h>             // va_start(), va_end(), et al ...
#include <stdio.h>              // vsnprintf() ...
#include <ctype.h>              // tolower() ...
#include <vector>               // C++ std::vector template
#include "EMULIB.hpp"           // declarations for this module
using std::vector;              // ...


PRIVATE string FormatStringV (const char *pszFormat, va_list args)
{
  //++
  //   Do the real work for the FormatString() family.  vsnprintf() tells us
  // how much space it really needed, so if the first try doesn't fit we
  // just allocate a bigger buffer and do it again.
  //--
  char szBuffer[256];  va_list args2;
  va_copy(args2, args);
  int cch = vsnprintf(szBuffer, sizeof(szBuffer), pszFormat, args);
  if (cch < 0) {
    va_end(args2);  return string();
  }
  if ((size_t) cch < sizeof(szBuffer)) {
    va_end(args2);  return string(szBuffer, cch);
  }
  vector<char> vBuffer(cch+1);
  vsnprintf(vBuffer.data(), vBuffer.size(), pszFormat, args2);
  va_end(args2);
  return string(vBuffer.data(), cch);
}

PUBLIC string FormatString (const char *pszFormat, ...)
{
  //++
  // Like sprintf(), but returns a C++ string object ...
  //--
  va_list args;
  va_start(args, pszFormat);
  string sResult = FormatStringV(pszFormat, args);
  va_end(args);
  return sResult;
}

PUBLIC string ToLower (const string &s)
{
  string sResult(s);
  for (size_t i = 0;  i < sResult.length();  ++i)
    sResult[i] = (char) tolower((unsigned char) sResult[i]);
  return sResult;
}
