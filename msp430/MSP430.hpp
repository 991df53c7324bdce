//++
// MSP430.hpp -> global declarations for the MSP430 disassembler library
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
//   This file contains global constants, register numbers and compile time
// options for the MSP430 disassembler library.  The MSP430 is a 16 bit,
// byte addressable, little endian machine with sixteen registers.  Four of
// those registers are special - R0 is the PC, R1 the SP, R2 the status
// register and R3 is the second constant generator.  R2 also doubles as the
// first constant generator in some addressing modes.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...

// Library version number ...
#define MSP430DIS_VERSION  100

//++
//   The default radix for offsets, addresses and immediate values.  The TI
// assembler listings use decimal, so that's what we use too unless told
// otherwise.  Constants and jump offsets are ALWAYS signed decimal.
//--
#ifndef DEFAULT_RADIX
#define DEFAULT_RADIX      10
#endif

//++
//   If REGISTER_ALIASES is non-zero then R0, R1 and R2 are shown as PC, SP
// and SR.  R3 has no common alias and is always shown as R3.
//--
#ifndef REGISTER_ALIASES
#define REGISTER_ALIASES   1
#endif

//   This type holds a memory address.  It's purposely limited to exactly 16
// bits to ensure that address calculation overflows wrap around as expected!
typedef uint16_t address_t;
#define ADDRESS(x)    ((address_t) ((x) & 0xFFFF))

//   The uint4_t type is used for all four bit fields, uint2_t for the two
// bit As field and uint1_t for the Ad and B/W bits.  All of them behave
// exactly like an 8 bit value and the decoder is responsible for masking.
typedef uint8_t uint1_t;
typedef uint8_t uint2_t;
typedef uint8_t uint4_t;

// MSP430 registers ...
enum _REGISTERS {
  REG_PC    =  0,         // R0 is the program counter
  REG_SP    =  1,         // R1 is the stack pointer
  REG_SR    =  2,         // R2 is the status register (and CG1)
  REG_CG1   =  2,         //   ...
  REG_CG2   =  3,         // R3 is constant generator 2
  MAXREG    = 16,         // number of registers
};

//   Operation sizes.  These are the actual values of the B/W bit, and Word is
// the default for instructions that don't have one ...
enum _OPERATION_SIZES {
  SIZE_WORD = 0,          // 16 bit operation (the default)
  SIZE_BYTE = 1,          //  8 bit operation (".B" suffix)
};
typedef enum _OPERATION_SIZES OPERATION_SIZE;

// Bits in the status register (used to recognize CLRC, SETZ, DINT, etc) ...
enum _SR_BITS {
  SR_C      = 0x0001,     // carry
  SR_Z      = 0x0002,     // zero
  SR_N      = 0x0004,     // negative
  SR_GIE    = 0x0008,     // global interrupt enable
};
