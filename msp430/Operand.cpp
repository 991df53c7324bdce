//++
// Operand.cpp -> MSP430 operand resolver
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
//   This module turns an addressing mode field and a register number into a
// COperand, fetching an extension word from the instruction stream when the
// mode needs one.  This is where all the MSP430 special cases live -
//
//          As=00       As=01        As=10        As=11
//   R0     PC          x(PC) sym    @PC          #n  (@PC+)
//   R2     SR          &addr        #4           #8
//   R3     #0          #1           #2           #-1
//   Rn     Rn          x(Rn)        @Rn          @Rn+
//
//   The constant generator cases never consume an extension word, even if
// there happen to be more bytes in the buffer.  Destinations are different -
// they have only a one bit Ad field, so they can only ever be register or
// indexed (including symbolic and absolute).
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include "EMULIB.hpp"           // emulator library definitions
#include "MSP430.hpp"           // global declarations for this project
#include "DecodeError.hpp"      // CDecodeError failure codes
#include "WordCursor.hpp"       // CWordCursor instruction word reader
#include "Operand.hpp"          // declarations for this module


PUBLIC bool ResolveOperand (uint2_t nAs, uint4_t nRegister, OPERATION_SIZE nSize, CWordCursor &Cursor, COperand &Operand, CDecodeError &Error)
{
  //++
  //   Resolve a two bit As field (a double operand source, or the operand of a
  // single operand instruction) and a register into an operand.  If an
  // extension word is needed it's taken from the cursor, and if it isn't
  // there then we return false with TRUNCATED_INPUT.  Operand is changed
  // only if we succeed.
  //--
  uint16_t wExtension;
  nRegister = MASK4(nRegister);
  switch (MASK2(nAs)) {
    case 0:
      // Register mode - Rn, or the constant 0 for R3 ...
      if (nRegister == REG_CG2)
        Operand = COperand::Constant(nRegister, 0);
      else
        Operand = COperand::Register(nRegister);
      return true;

    case 1:
      // Indexed mode - x(Rn) ...
      //   R3 is the constant 1 and doesn't have an extension word.  For the
      // PC it's symbolic (x is relative to the PC, which points to the word
      // after the extension).  For SR it's absolute, because SR reads as zero
      // in this mode.
      if (nRegister == REG_CG2) {
        Operand = COperand::Constant(nRegister, 1);  return true;
      }
      if (!Cursor.TakeWord(wExtension, Error)) return false;
      if (nRegister == REG_PC)
        Operand = COperand::Symbolic(wExtension);
      else if (nRegister == REG_SR)
        Operand = COperand::Absolute(wExtension);
      else
        Operand = COperand::Indexed(nRegister, wExtension);
      return true;

    case 2:
      // Indirect - @Rn, or the constants 4 (SR) and 2 (R3) ...
      if (nRegister == REG_SR)
        Operand = COperand::Constant(nRegister, 4);
      else if (nRegister == REG_CG2)
        Operand = COperand::Constant(nRegister, 2);
      else
        Operand = COperand::Indirect(nRegister);
      return true;

    case 3:
      // Indirect autoincrement - @Rn+ ...
      //   @PC+ is the only way to get an immediate operand.  SR and R3 are
      // the constants 8 and -1 ...
      if (nRegister == REG_PC) {
        if (!Cursor.TakeWord(wExtension, Error)) return false;
        Operand = COperand::Immediate(wExtension);
      } else if (nRegister == REG_SR)
        Operand = COperand::Constant(nRegister, 8);
      else if (nRegister == REG_CG2)
        Operand = COperand::Constant(nRegister, -1);
      else
        Operand = COperand::AutoIncrement(nRegister, nSize);
      return true;
  }

  // Just to make the compiler happy...
  return false;
}

PUBLIC bool ResolveDestination (uint1_t nAd, uint4_t nRegister, CWordCursor &Cursor, COperand &Operand, CDecodeError &Error)
{
  //++
  //   Resolve the destination of a double operand instruction.  There's only
  // one Ad bit, so the destination can only be register (Ad=0) or indexed
  // (Ad=1), and indexed includes symbolic for the PC and absolute for SR.
  // The destination is NEVER indirect, autoincrement, immediate or constant!
  //
  //   The constant generators only exist on the source side.  R3 as a
  // destination is just another register - writes to it go nowhere, and
  // that's how NOP (MOV #0,R3) works, and x(R3) is plain indexed.
  //--
  uint16_t wExtension;
  nRegister = MASK4(nRegister);
  if (MASK1(nAd) == 0) {
    Operand = COperand::Register(nRegister);  return true;
  }
  if (!Cursor.TakeWord(wExtension, Error)) return false;
  if (nRegister == REG_PC)
    Operand = COperand::Symbolic(wExtension);
  else if (nRegister == REG_SR)
    Operand = COperand::Absolute(wExtension);
  else
    Operand = COperand::Indexed(nRegister, wExtension);
  return true;
}
