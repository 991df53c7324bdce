//++
// EMULIB.hpp -> Global declarations for the emulator library
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
//   This file contains global constants and universal macros for the emulator
// library.  It's used by all programs, including the MSP430 disassembler.
//
// REVISION HISTORY:
// 20-MAY-15  RLA   New file.
// 19-OCT-26        Cut down to the bit/word macros, FormatString() and
//                    ToLower() for the MSP430 disassembler library.
//--
#pragma once
#include <stdint.h>           // uint8_t, uint16_t, etc ...
#include <stddef.h>           // size_t ...
#include <string>             // C++ std::string class, et al ...
using std::string;            // this is used EVERYWHERE!

//  These macros are used with fuctions that are outside of a class definition.
// "PRIVATE" methods are local to the source file where they live, and "PUBLIC"
// are global...
#define PRIVATE static
#define PUBLIC

// Bit equates (for convenience) ...
#define BIT0    0x0001
#define BIT1    0x0002
#define BIT2    0x0004
#define BIT3    0x0008
#define BIT4    0x0010
#define BIT5    0x0020
#define BIT6    0x0040
#define BIT7    0x0080
#define BIT8    0x0100
#define BIT9    0x0200
#define BIT10   0x0400
#define BIT11   0x0800
#define BIT12   0x1000
#define BIT13   0x2000
#define BIT14   0x4000
#define BIT15   0x8000

//   Sadly, windef.h defines these macros too - fortunately Microsoft's
// definition is compatible with ours, so it's not a fatal problem.
#if !(defined(_WIN32) && defined(LOBYTE))
#define LOBYTE(x) 	((uint8_t)  ((x) & 0xFF))
#define HIBYTE(x) 	((uint8_t)  (((x) >> 8) & 0xFF))
#endif

// Assemble and disassemble nibbles, bytes and words ...
#define MASK1(x)        ((x) & 0x01)
#define MASK2(x)        ((x) & 0x03)
#define MASK4(x)        ((x) & 0x0F)
#define MASK10(x)       ((x) & 0x3FF)
#define MKWORD(h,l)	((uint16_t) ((((h) & 0xFF) << 8) | ((l) & 0xFF)))

// Bit test macro ...
#define ISSET(x,b)	(((x) & (b)) != 0)

// FormatString() is sprintf() for C++ strings ...
extern string FormatString (const char *pszFormat, ...);
// Lower case an entire string ...
extern string ToLower (const string &s);
