//++
// Instruction.hpp -> CInstruction (one decoded MSP430 instruction) class
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
//   A CInstruction is the result of decoding one MSP430 instruction.  All
// three formats share this one class, and the format tells you which of the
// fields mean anything -
//
//   FORMAT_DOUBLE - mnemonic, size, source AND destination
//   FORMAT_SINGLE - mnemonic, size and destination only (RETI has neither)
//   FORMAT_JUMP   - mnemonic, condition and offset; no operands
//
//   The length is always 2 plus 2 for every extension word, so 2, 4 or 6
// bytes, and the raw opcode and extension words are kept too.  Once it's
// been created a CInstruction is never changed.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include <stddef.h>             // size_t ...
#include "MSP430.hpp"           // global declarations for this project
#include "MSP430opcodes.hpp"    // INSTRUCTION_FORMAT, JUMP_CONDITION, etc
#include "Operand.hpp"          // COperand class


class CInstruction {
  //++
  // One decoded MSP430 instruction ...
  //--

  // Magic numbers ...
public:
  enum {
    MAXWORDS  = 3,            // opcode plus at most two extension words
  };

  // Constructors ...
public:
  CInstruction();
  virtual ~CInstruction() {};
  // Create instructions of each format ...
  static CInstruction DoubleOperand (const char *pszName, OPERATION_SIZE nSize, const COperand &Source,
                                     const COperand &Destination, const uint16_t *pawWords, size_t nWords);
  static CInstruction SingleOperand (const char *pszName, OPERATION_SIZE nSize, const COperand &Destination,
                                     const uint16_t *pawWords, size_t nWords);
  static CInstruction Jump (const char *pszName, JUMP_CONDITION nCondition, int16_t nOffset, uint16_t wOpcode);

  // Properties ...
public:
  bool IsValid() const {return m_nFormat != FORMAT_NONE;}
  const char *GetMnemonic() const {return m_pszName;}
  INSTRUCTION_FORMAT GetFormat() const {return m_nFormat;}
  OPERATION_SIZE GetSize() const {return m_nSize;}
  bool IsByte() const {return m_nSize == SIZE_BYTE;}
  // Operands (either may be MODE_NONE) ...
  bool HasSource() const {return m_Source.IsPresent();}
  bool HasDestination() const {return m_Destination.IsPresent();}
  const COperand &GetSource() const {return m_Source;}
  const COperand &GetDestination() const {return m_Destination;}
  // Jumps only - the condition and the offset in words or bytes ...
  JUMP_CONDITION GetCondition() const {return m_nCondition;}
  int16_t GetWordOffset() const {return m_nOffset;}
  int16_t GetByteOffset() const {return (int16_t) (m_nOffset * 2);}
  //   Return the absolute target of a jump, given the address of the jump
  // itself.  The offset is relative to the NEXT instruction ...
  address_t GetJumpTarget (address_t wLoc) const;
  // Return the length in bytes (2, 4 or 6) and the raw words ...
  size_t GetLength() const {return 2*m_nWords;}
  size_t GetWordCount() const {return m_nWords;}
  uint16_t GetWord (size_t nIndex) const {return (nIndex < m_nWords) ? m_awWords[nIndex] : 0;}
  uint16_t GetOpcode() const {return m_awWords[0];}

  // Operators ...
public:
  bool operator== (const CInstruction &i) const;
  bool operator!= (const CInstruction &i) const {return !(*this == i);}

  // Private methods ...
private:
  void SetWords (const uint16_t *pawWords, size_t nWords);

  // Private member data ...
private:
  const char         *m_pszName;        // mnemonic (from the opcode tables)
  INSTRUCTION_FORMAT  m_nFormat;        // double, single or jump
  OPERATION_SIZE      m_nSize;          // byte or word
  COperand            m_Source;         // source operand (double only)
  COperand            m_Destination;    // destination operand
  JUMP_CONDITION      m_nCondition;     // jump condition (jumps only)
  int16_t             m_nOffset;        // signed word offset (jumps only)
  uint16_t            m_awWords[MAXWORDS];  // opcode and extension words
  size_t              m_nWords;         // number of words used
};
