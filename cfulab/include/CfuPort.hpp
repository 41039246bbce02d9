// **********************************************************************
// cfulab/include/CfuPort.hpp
// **********************************************************************
/*
Abstract API (not a simulatable object), just a protocol, for talking to a
CFU.  Sims how a CPU pipeline talks to a tightly-coupled accelerator:

  issue()       latch function id + two operand words (the only data path in;
                there are deliberately no memory hooks on this port)
  step_cycle()  advance the port's clock domain by exactly one cycle
  is_done()     the single-bit done line
  read_result() take the one result word and drop done

A concrete backend inherits from this class.  SimCfu declares its timing in
software; CfuUnit is a clocked Cascade component.  For the same inputs every
backend must return the same results, only the cycle counts may differ.
*/

#pragma once

#include "CfuTypes.hpp"

#include <cstdint>

namespace cfulab {

class CfuPort {
public:
  virtual ~CfuPort() = default;

  // Issue a single request.  Throws ProtocolViolation if one is already latched.
  virtual void issue(const CfuRequest& request) = 0;

  virtual void step_cycle() = 0;
  virtual bool is_done() const = 0;

  // Throws ProtocolViolation unless is_done().
  virtual Word read_result() = 0;

  // Drop whatever is latched (the recovery path after a watchdog fault).
  virtual void reset() = 0;

  virtual uint32_t    function_count() const = 0;
  virtual const char* backend_name()   const = 0;
};

} // namespace cfulab
