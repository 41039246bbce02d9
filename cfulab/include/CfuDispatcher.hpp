// **********************************************************************
// cfulab/include/CfuDispatcher.hpp
// **********************************************************************
/*
Per-invocation CFU protocol, as the CPU side sees it:

  Idle --issue()--> Issued --step()--> Busy --step() & done--> Done --read_result()--> Idle
                                        |
                                        +--watchdog bound reached--> Faulted --reset()--> Idle

At most one invocation is in flight per port.  issue() while anything is in
flight, step() with nothing to advance and read_result() before Done throw
ProtocolViolation without touching the in-flight call.  call() is the CPU
stall: it only returns once the result has been read back.

Every completed call is folded into per-function statistics (calls, total /
min / max busy cycles) for profiling which functions the workload leans on.
*/
#pragma once

#include "CfuPort.hpp"
#include "CfuTypes.hpp"

#include <cstdint>
#include <vector>

namespace cfulab {

struct DispatcherConfig {
  uint64_t watchdog_cycles = 1000000; // max cycles a call may stay Busy (>= 1)
  bool     trace_calls     = false;   // log every issue/result to std::cout
};

struct CfuInvocation {
  CfuRequest request{};
  CfuStatus  status         = CfuStatus::Idle;
  bool       has_result     = false;
  Word       result         = 0;
  uint64_t   cycles_elapsed = 0;
};

struct CfuCallStats {
  uint64_t calls        = 0;
  uint64_t total_cycles = 0;
  uint64_t min_cycles   = 0;
  uint64_t max_cycles   = 0;
};

class CfuDispatcher {
public:
  explicit CfuDispatcher(CfuPort& port, DispatcherConfig config = DispatcherConfig());

  void issue(const CfuRequest& request);
  void issue(uint32_t function_id, Word a, Word b);
  void issue_instruction(uint32_t raw_inst, Word rs1_val, Word rs2_val); // CUSTOM-0 word
  void step();
  bool is_done() const;
  Word read_result();

  Word call(const CfuRequest& request); // blocking: issue, step until done, read
  Word call(uint32_t function_id, Word a, Word b);

  void reset(); // leave Faulted (or abandon any call) and reset the port

  CfuStatus status() const { return inflight_.status; }
  bool      idle()   const { return inflight_.status == CfuStatus::Idle; }
  const CfuInvocation& invocation() const { return inflight_; }
  uint64_t  cycles_elapsed() const { return inflight_.cycles_elapsed; }
  uint64_t  last_call_cycles() const { return last_call_cycles_; }

  const CfuCallStats& stats(uint32_t function_id) const;
  void clear_stats();

  CfuPort&                port()   { return port_; }
  const DispatcherConfig& config() const { return config_; }

private:
  void check_function(uint32_t function_id) const;
  void record(const CfuInvocation& done);

  CfuPort&                  port_;
  DispatcherConfig          config_;
  CfuInvocation             inflight_{};
  uint64_t                  last_call_cycles_ = 0;
  std::vector<CfuCallStats> stats_;
};

} // namespace cfulab
