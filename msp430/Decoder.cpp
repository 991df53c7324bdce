//++
// Decoder.cpp -> MSP430 instruction decoder
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
//   The MSP430 has only three instruction formats and the first word alone
// tells us which one we have -
//
//    15 14 13 12 11 10  9  8  7  6  5  4  3  2  1  0
//   +-----------+-----------+--+--+-----+-----------+
//   |  opcode   |   Rsrc    |Ad|BW| As  |   Rdst    |  double operand (4..F)
//   +-----------+-----------+--+--+-----+-----------+
//   | 0  0  0  1  0  0| opcode |BW| As  |  Rdst/src |  single operand
//   +--------+--------+--------+--+-----+-----------+
//   | 0  0  1|  cond  |       10 bit word offset    |  jump
//   +--------+--------+-----------------------------+
//
//   Everything else (top nibble zero, and the unused single operand
// prefixes 0x1380 thru 0x1FFF) is an unknown opcode.  The source extension
// word, if there is one, always comes before the destination extension word.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
//000000001111111111222222222233333333334444444444555555555566666666667777777777
//234567890123456789012345678901234567890123456789012345678901234567890123456789
#include <stdlib.h>             // exit(), system(), etc ...
#include <stdint.h>	        // uint8_t, uint32_t, etc ...
#include <string>               // C++ std::string class, et al ...
#include <vector>               // C++ std::vector template
#include "EMULIB.hpp"           // emulator library definitions
#include "LogFile.hpp"          // emulator library message logging facility
#include "MSP430.hpp"           // global declarations for this project
#include "MSP430opcodes.hpp"    // opcode tables and field macros
#include "DecodeError.hpp"      // CDecodeError failure codes
#include "WordCursor.hpp"       // CWordCursor instruction word reader
#include "Operand.hpp"          // COperand and the operand resolver
#include "Instruction.hpp"      // CInstruction decoded instruction
#include "Decoder.hpp"          // declarations for this module


PRIVATE bool DecodeJump (uint16_t wOpcode, CInstruction &Inst)
{
  //++
  //   Decode a jump.  These are always one word, and the only thing we have
  // to do is sign extend the 10 bit offset ...
  //--
  const OP_CODE *pOpcode = LookupJump(wOpcode);
  int16_t nOffset = (int16_t) JUMP_OFFSET(wOpcode);
  if (ISSET(nOffset, BIT9)) nOffset -= 0x400;
  Inst = CInstruction::Jump(pOpcode->pszName, JUMP_COND_FIELD(wOpcode), nOffset, wOpcode);
  return true;
}

PRIVATE bool DecodeDouble (uint16_t wOpcode, CWordCursor &Cursor, CInstruction &Inst, CDecodeError &Error)
{
  //++
  //   Decode a double operand instruction.  The source is resolved first
  // because its extension word comes first ...
  //--
  const OP_CODE *pOpcode = LookupDoubleOperand(wOpcode);
  if (pOpcode == NULL) {
    Error.SetUnknownOpcode(wOpcode);  return false;
  }
  OPERATION_SIZE nSize = (OPERATION_SIZE) BW_BIT(wOpcode);
  COperand src, dst;
  if (!ResolveOperand(AS_FIELD(wOpcode), SRC_REGISTER(wOpcode), nSize, Cursor, src, Error)) return false;
  if (!ResolveDestination(DST_AD(wOpcode), DST_REGISTER(wOpcode), Cursor, dst, Error)) return false;

  // Go back and collect all the words we used ...
  uint16_t awWords[CInstruction::MAXWORDS];  size_t nWords = 0;
  awWords[nWords++] = wOpcode;
  if (src.HasExtension()) awWords[nWords++] = src.GetExtension();
  if (dst.HasExtension()) awWords[nWords++] = dst.GetExtension();
  Inst = CInstruction::DoubleOperand(pOpcode->pszName, nSize, src, dst, awWords, nWords);
  return true;
}

PRIVATE bool DecodeSingle (const OP_CODE *pOpcode, uint16_t wOpcode, CWordCursor &Cursor, CInstruction &Inst, CDecodeError &Error)
{
  //++
  //   Decode a single operand instruction.  RETI is the odd one out - it
  // has no operand, so the bits below the prefix are never looked at and no
  // extension word is fetched.  SWPB, SXT and CALL ignore the B/W bit and
  // are always word operations.
  //--
  if (pOpcode->nOperands == 0) {
    Inst = CInstruction::SingleOperand(pOpcode->pszName, SIZE_WORD, COperand(), &wOpcode, 1);
    return true;
  }

  OPERATION_SIZE nSize = pOpcode->fSized ? (OPERATION_SIZE) BW_BIT(wOpcode) : SIZE_WORD;
  COperand dst;
  if (!ResolveOperand(AS_FIELD(wOpcode), DST_REGISTER(wOpcode), nSize, Cursor, dst, Error)) return false;
  uint16_t awWords[CInstruction::MAXWORDS];  size_t nWords = 0;
  awWords[nWords++] = wOpcode;
  if (dst.HasExtension()) awWords[nWords++] = dst.GetExtension();
  Inst = CInstruction::SingleOperand(pOpcode->pszName, nSize, dst, awWords, nWords);
  return true;
}

PUBLIC bool Decode (const uint8_t *pabData, size_t cbData, CInstruction &Inst, CDecodeError &Error)
{
  //++
  //   Decode the instruction at the start of the buffer.  The result is built
  // in a temporary and only copied to Inst if everything works, so a failure
  // never leaves a partial instruction behind.
  //--
  CWordCursor cursor(pabData, cbData);
  CInstruction inst;  uint16_t wOpcode;  bool fOK;
  Error.Clear();
  if (!cursor.TakeWord(wOpcode, Error)) {
    LOGF(TRACE, "%s", Error.ToString().c_str());  return false;
  }

  if ((wOpcode & JUMP_PREFIX_MASK) == JUMP_PREFIX) {
    fOK = DecodeJump(wOpcode, inst);
  } else if (DOUBLE_OPCODE(wOpcode) >= 4) {
    fOK = DecodeDouble(wOpcode, cursor, inst, Error);
  } else {
    const OP_CODE *pOpcode = LookupSingleOperand(wOpcode);
    if (pOpcode != NULL) {
      fOK = DecodeSingle(pOpcode, wOpcode, cursor, inst, Error);
    } else {
      Error.SetUnknownOpcode(wOpcode);  fOK = false;
    }
  }

  if (!fOK) {
    LOGF(TRACE, "%s", Error.ToString().c_str());  return false;
  }
  Inst = inst;
  return true;
}

PUBLIC bool Decode (const vector<uint8_t> &abData, CInstruction &Inst, CDecodeError &Error)
{
  return Decode(abData.empty() ? NULL : &abData[0], abData.size(), Inst, Error);
}
