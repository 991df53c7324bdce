//++
// Operand.hpp -> COperand class and the MSP430 operand resolver
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
//   A COperand is one decoded instruction operand - an addressing mode plus
// whatever goes with it (a register, an extension word, a constant, or all
// three).  It's a simple value; it's created once by the resolver and then
// copied into the CInstruction.  The "empty" operand (MODE_NONE) is used for
// operands that an instruction doesn't have.
//
//   The MSP430 has only four real addressing modes (register, indexed,
// indirect and indirect autoincrement) but, depending on the register, the
// hardware reinterprets them as symbolic, absolute, immediate or one of six
// constants.  Those are all separate modes here, so that nobody downstream
// ever has to remember the special cases for R0, R2 and R3.
//
// REVISION HISTORY:
// 19-OCT-26        New file.
//--
#pragma once
#include <stdint.h>             // uint8_t, int32_t, and much more ...
#include "MSP430.hpp"           // global declarations for this project
class CWordCursor;              // ...
class CDecodeError;             // ...


class COperand {
  //++
  // One decoded MSP430 operand ...
  //--

  // Addressing modes ...
public:
  enum _ADDRESSING_MODES {
    MODE_NONE,            // no operand at all
    MODE_REGISTER,        // Rn
    MODE_INDEXED,         // x(Rn)
    MODE_SYMBOLIC,        // x(PC) - indexed relative to the PC
    MODE_ABSOLUTE,        // &addr - indexed with SR (which reads as zero)
    MODE_INDIRECT,        // @Rn
    MODE_AUTOINCREMENT,   // @Rn+
    MODE_IMMEDIATE,       // #n - really @PC+
    MODE_CONSTANT,        // constant generator (R2 or R3)
  };
  typedef enum _ADDRESSING_MODES ADDRESSING_MODE;

  // Constructors ...
public:
  COperand()
    : m_nMode(MODE_NONE), m_nRegister(0), m_wExtension(0), m_nConstant(0), m_nIncrement(0)
      {};
  virtual ~COperand() {};
  // Create operands of each type ...
  static COperand Register (uint4_t nRegister)
    {return COperand(MODE_REGISTER, nRegister);}
  static COperand Indexed (uint4_t nRegister, uint16_t wOffset)
    {return COperand(MODE_INDEXED, nRegister, wOffset);}
  static COperand Symbolic (uint16_t wOffset)
    {return COperand(MODE_SYMBOLIC, REG_PC, wOffset);}
  static COperand Absolute (uint16_t wAddress)
    {return COperand(MODE_ABSOLUTE, REG_SR, wAddress);}
  static COperand Indirect (uint4_t nRegister)
    {return COperand(MODE_INDIRECT, nRegister);}
  static COperand AutoIncrement (uint4_t nRegister, OPERATION_SIZE nSize)
    {COperand op(MODE_AUTOINCREMENT, nRegister);  op.m_nIncrement = (nSize == SIZE_BYTE) ? 1 : 2;  return op;}
  static COperand Immediate (uint16_t wValue)
    {return COperand(MODE_IMMEDIATE, REG_PC, wValue);}
  static COperand Constant (uint4_t nRegister, int16_t nValue)
    {COperand op(MODE_CONSTANT, nRegister);  op.m_nConstant = nValue;  return op;}
private:
  COperand (ADDRESSING_MODE nMode, uint4_t nRegister, uint16_t wExtension=0)
    : m_nMode(nMode), m_nRegister(nRegister), m_wExtension(wExtension), m_nConstant(0), m_nIncrement(0)
      {};

  // Properties ...
public:
  ADDRESSING_MODE GetMode() const {return m_nMode;}
  bool IsPresent() const {return m_nMode != MODE_NONE;}
  //   Return the register.  For the constant generator this is R2 or R3, for
  // symbolic and immediate it's the PC, and for absolute it's the SR ...
  uint4_t GetRegister() const {return m_nRegister;}
  // Return TRUE if this operand used an extension word ...
  bool HasExtension() const
    {return (m_nMode==MODE_INDEXED) || (m_nMode==MODE_SYMBOLIC) || (m_nMode==MODE_ABSOLUTE) || (m_nMode==MODE_IMMEDIATE);}
  // Return the extension word, raw ...
  uint16_t GetExtension() const {return m_wExtension;}
  // Return the extension word as a signed offset (indexed and symbolic) ...
  int16_t GetOffset() const {return (int16_t) m_wExtension;}
  // Return the extension word as an address (absolute) or a value (immediate) ...
  uint16_t GetAddress() const {return m_wExtension;}
  uint16_t GetValue() const {return m_wExtension;}
  // Return the constant generator value (0, 1, 2, 4, 8 or -1) ...
  int16_t GetConstant() const {return m_nConstant;}
  //   Return the autoincrement step (1 for byte operations, 2 for words).
  // This is just recorded for the caller - we're a disassembler, not a
  // simulator, and nothing is actually incremented!
  uint8_t GetIncrement() const {return m_nIncrement;}

  // Operators ...
public:
  bool operator== (const COperand &op) const
    {return (m_nMode == op.m_nMode) && (m_nRegister == op.m_nRegister) && (m_wExtension == op.m_wExtension)
         && (m_nConstant == op.m_nConstant) && (m_nIncrement == op.m_nIncrement);}
  bool operator!= (const COperand &op) const {return !(*this == op);}

  // Private member data ...
private:
  ADDRESSING_MODE m_nMode;      // addressing mode for this operand
  uint4_t         m_nRegister;  // register number
  uint16_t        m_wExtension; // extension word (offset, address or value)
  int16_t         m_nConstant;  // constant generator value
  uint8_t         m_nIncrement; // autoincrement step
};


// Resolve an As (source, or single operand) or Ad (destination) field ...
extern bool ResolveOperand (uint2_t nAs, uint4_t nRegister, OPERATION_SIZE nSize, CWordCursor &Cursor, COperand &Operand, CDecodeError &Error);
extern bool ResolveDestination (uint1_t nAd, uint4_t nRegister, CWordCursor &Cursor, COperand &Operand, CDecodeError &Error);
