// **********************************************************************
// cfulab/src/CfuInstruction.cpp
// **********************************************************************
/*
Field extraction for CUSTOM-0 words.  Lets callers inspect an instruction
symbolically (decoded.rs1, decoded.function_id()) without bit-twiddling.
*/

#include "CfuInstruction.hpp"

#include <sstream>

namespace cfulab {

CfuInstruction::CfuInstruction(uint32_t raw_instr) : raw(raw_instr) {
  opcode = raw         & 0x7fu; // 7b
  rd     = (raw >>  7) & 0x1fu; // 5b
  funct3 = (raw >> 12) & 0x07u; // 3b
  rs1    = (raw >> 15) & 0x1fu; // 5b
  rs2    = (raw >> 20) & 0x1fu; // 5b
  funct7 = (raw >> 25) & 0x7fu; // 7b
}

uint32_t CfuInstruction::encode(uint32_t function_id, uint32_t rd, uint32_t rs1, uint32_t rs2) {
  if (function_id >= kMaxFunctions || rd > 31u || rs1 > 31u || rs2 > 31u) {
    std::ostringstream oss;
    oss << "cannot encode CFU instruction: function_id=" << function_id
        << " rd=" << rd << " rs1=" << rs1 << " rs2=" << rs2;
    throw ProtocolViolation(oss.str());
  }
  const uint32_t funct3 = function_id & 0x07u;
  const uint32_t funct7 = (function_id >> 3) & 0x7fu;
  return (funct7 << 25) | (rs2 << 20) | (rs1 << 15) | (funct3 << 12) | (rd << 7) | OPCODE_CUSTOM0;
}

} // namespace cfulab
