//++
// Instruction.cpp -> CInstruction methods
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
#include <string.h>             // strcmp() ...
#include <assert.h>             // assert() (what else??)
#include "EMULIB.hpp"           // emulator library definitions
#include "MSP430.hpp"           // global declarations for this project
#include "Instruction.hpp"      // declarations for this module


CInstruction::CInstruction()
  : m_pszName(""), m_nFormat(FORMAT_NONE), m_nSize(SIZE_WORD),
    m_Source(), m_Destination(), m_nCondition(COND_NONE), m_nOffset(0), m_nWords(0)
{
  for (size_t i = 0;  i < MAXWORDS;  ++i) m_awWords[i] = 0;
}

void CInstruction::SetWords (const uint16_t *pawWords, size_t nWords)
{
  //++
  // Save the opcode and extension words ...
  //--
  assert((nWords >= 1) && (nWords <= MAXWORDS));
  m_nWords = nWords;
  for (size_t i = 0;  i < MAXWORDS;  ++i)
    m_awWords[i] = (i < nWords) ? pawWords[i] : 0;
}

/*static*/ CInstruction CInstruction::DoubleOperand (const char *pszName, OPERATION_SIZE nSize,
  const COperand &Source, const COperand &Destination, const uint16_t *pawWords, size_t nWords)
{
  CInstruction inst;
  inst.m_pszName = pszName;  inst.m_nFormat = FORMAT_DOUBLE;  inst.m_nSize = nSize;
  inst.m_Source = Source;  inst.m_Destination = Destination;
  inst.SetWords(pawWords, nWords);
  return inst;
}

/*static*/ CInstruction CInstruction::SingleOperand (const char *pszName, OPERATION_SIZE nSize,
  const COperand &Destination, const uint16_t *pawWords, size_t nWords)
{
  //++
  //   Note that the single operand goes in the destination, even for PUSH and
  // CALL where it's really a source.  RETI passes an empty operand ...
  //--
  CInstruction inst;
  inst.m_pszName = pszName;  inst.m_nFormat = FORMAT_SINGLE;  inst.m_nSize = nSize;
  inst.m_Destination = Destination;
  inst.SetWords(pawWords, nWords);
  return inst;
}

/*static*/ CInstruction CInstruction::Jump (const char *pszName, JUMP_CONDITION nCondition, int16_t nOffset, uint16_t wOpcode)
{
  //++
  // Jumps are always one word and never have a size or operands ...
  //--
  CInstruction inst;
  inst.m_pszName = pszName;  inst.m_nFormat = FORMAT_JUMP;
  inst.m_nCondition = nCondition;  inst.m_nOffset = nOffset;
  inst.SetWords(&wOpcode, 1);
  return inst;
}

address_t CInstruction::GetJumpTarget (address_t wLoc) const
{
  //++
  //   Compute the target address for a jump that lives at wLoc.  The PC has
  // already been incremented past the jump when the offset is added, and the
  // offset is in words.  Addresses wrap around at 64K!
  //--
  return ADDRESS(wLoc + 2 + GetByteOffset());
}

bool CInstruction::operator== (const CInstruction &i) const
{
  //++
  //   Two instructions are equal if every field that means something for
  // this format is equal.  Mnemonics are compared as strings, not pointers.
  //--
  if ((m_nFormat != i.m_nFormat) || (strcmp(m_pszName, i.m_pszName) != 0)) return false;
  if ((m_nSize != i.m_nSize) || (m_nWords != i.m_nWords)) return false;
  if ((m_Source != i.m_Source) || (m_Destination != i.m_Destination)) return false;
  if ((m_nCondition != i.m_nCondition) || (m_nOffset != i.m_nOffset)) return false;
  for (size_t n = 0;  n < m_nWords;  ++n)
    if (m_awWords[n] != i.m_awWords[n]) return false;
  return true;
}
