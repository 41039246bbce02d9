// **********************************************************************
// cfulab/include/CfuInstruction.hpp
// **********************************************************************
/*
CUSTOM-0 decoder/encoder.  A CFU call is an R-type word on opcode 0x0B where
funct7:funct3 form the 10-bit function selector and rs1/rs2/rd name the CPU
registers holding the operands and receiving the result.

  31      25 24  20 19  15 14  12 11   7 6      0
  | funct7  | rs2  | rs1  |funct3|  rd  | 0001011 |
*/
#pragma once

#include "CfuTypes.hpp"

#include <cstdint>

namespace cfulab {

struct CfuInstruction {
  static constexpr uint32_t OPCODE_CUSTOM0 = 0x0bu;

  explicit CfuInstruction(uint32_t raw_instr); // decode, call it like: CfuInstruction decoded(word)

  static uint32_t encode(uint32_t function_id, uint32_t rd, uint32_t rs1, uint32_t rs2);

  bool is_cfu() const { return opcode == OPCODE_CUSTOM0; }
  uint32_t function_id() const { return (funct7 << 3) | funct3; }

  uint32_t raw    = 0; // full 32b instruction
  uint32_t opcode = 0;
  uint32_t funct3 = 0;
  uint32_t funct7 = 0;
  uint32_t rd     = 0;
  uint32_t rs1    = 0;
  uint32_t rs2    = 0;
};

} // namespace cfulab
