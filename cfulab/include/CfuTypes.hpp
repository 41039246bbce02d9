// **********************************************************************
// cfulab/include/CfuTypes.hpp
// **********************************************************************
/*
Words, request descriptors and error types shared by every CFU component.
A CFU call carries exactly two operand words in and one result word out.
*/
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cfulab {

typedef uint32_t Word;

static constexpr uint32_t kMaxFunctions = 1024u; // funct7:funct3 selector space

// One custom instruction as seen by the accelerator (operands already staged)
struct CfuRequest {
  uint32_t function_id = 0;
  Word     operand_a   = 0;
  Word     operand_b   = 0;
};

enum class CfuStatus {
  Idle,
  Issued,
  Busy,
  Done,
  Faulted, // watchdog expired, needs reset()
};

const char* status_name(CfuStatus status);

// Programmer error: issue while busy, read before done, mismatched region...
class ProtocolViolation : public std::logic_error {
public:
  explicit ProtocolViolation(const std::string& what) : std::logic_error(what) {}
};

// Setup error: unregistered function ids, bad widths, bad bounds
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Accelerator stayed busy for the whole watchdog window
class WatchdogTimeout : public std::runtime_error {
public:
  WatchdogTimeout(const std::string& what, uint32_t function_id, uint64_t cycles)
    : std::runtime_error(what), function_id_(function_id), cycles_(cycles) {}

  uint32_t function_id() const { return function_id_; }
  uint64_t cycles()      const { return cycles_; }

private:
  uint32_t function_id_;
  uint64_t cycles_;
};

} // namespace cfulab
