// **********************************************************************
// cfulab/src/CfuDispatcher.cpp
// **********************************************************************

#include "CfuDispatcher.hpp"
#include "CfuInstruction.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace cfulab {

namespace {

std::string hex32(uint32_t value) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(8) << std::setfill('0') << value;
  return oss.str();
}

} // namespace

CfuDispatcher::CfuDispatcher(CfuPort& port, DispatcherConfig config)
  : port_(port), config_(config), stats_(port.function_count()) {
  if (config_.watchdog_cycles == 0) {
    throw ConfigurationError("CFU watchdog bound must be at least 1 cycle");
  }
}

void CfuDispatcher::check_function(uint32_t function_id) const {
  if (function_id >= port_.function_count()) {
    std::ostringstream oss;
    oss << "function id " << function_id << " outside [0, " << port_.function_count() << ")";
    throw ProtocolViolation(oss.str());
  }
}

void CfuDispatcher::issue(const CfuRequest& request) {
  if (inflight_.status != CfuStatus::Idle) {
    std::ostringstream oss;
    oss << "CFU issue of function " << request.function_id << " while "
        << status_name(inflight_.status) << " with function " << inflight_.request.function_id;
    throw ProtocolViolation(oss.str());
  }
  check_function(request.function_id);
  port_.issue(request); // latch first, only then commit our own state

  inflight_ = CfuInvocation();
  inflight_.request = request;
  inflight_.status  = CfuStatus::Issued;

  if (config_.trace_calls) {
    std::cout << "[CFU] " << port_.backend_name()
              << " issue fn=" << request.function_id
              << " a=" << hex32(request.operand_a)
              << " b=" << hex32(request.operand_b) << std::endl;
  }
}

void CfuDispatcher::issue(uint32_t function_id, Word a, Word b) {
  CfuRequest request;
  request.function_id = function_id;
  request.operand_a   = a;
  request.operand_b   = b;
  issue(request);
}

void CfuDispatcher::issue_instruction(uint32_t raw_inst, Word rs1_val, Word rs2_val) {
  const CfuInstruction decoded(raw_inst);
  if (!decoded.is_cfu()) {
    throw ProtocolViolation("not a CUSTOM-0 instruction: " + hex32(raw_inst));
  }
  issue(decoded.function_id(), rs1_val, rs2_val);
}

void CfuDispatcher::step() {
  if (inflight_.status != CfuStatus::Issued && inflight_.status != CfuStatus::Busy) {
    throw ProtocolViolation(std::string("CFU step with nothing in flight (status ")
                            + status_name(inflight_.status) + ")");
  }
  port_.step_cycle();
  ++inflight_.cycles_elapsed;
  if (inflight_.status == CfuStatus::Issued) {
    inflight_.status = CfuStatus::Busy; // unconditional on the first cycle
  }

  if (port_.is_done()) {
    inflight_.result     = port_.read_result(); // held stable here until read_result()
    inflight_.has_result = true;
    inflight_.status     = CfuStatus::Done;
    return;
  }

  if (inflight_.cycles_elapsed >= config_.watchdog_cycles) {
    inflight_.status = CfuStatus::Faulted;
    std::ostringstream oss;
    oss << "CFU watchdog: function " << inflight_.request.function_id
        << " busy for " << inflight_.cycles_elapsed << " cycles (bound "
        << config_.watchdog_cycles << ")";
    std::cerr << "[CFU] " << oss.str() << std::endl;
    throw WatchdogTimeout(oss.str(), inflight_.request.function_id, inflight_.cycles_elapsed);
  }
}

bool CfuDispatcher::is_done() const {
  return inflight_.status == CfuStatus::Done;
}

Word CfuDispatcher::read_result() {
  if (inflight_.status != CfuStatus::Done) {
    throw ProtocolViolation(std::string("CFU result read while ") + status_name(inflight_.status));
  }
  const Word result = inflight_.result;
  record(inflight_);
  last_call_cycles_ = inflight_.cycles_elapsed;

  if (config_.trace_calls) {
    std::cout << "[CFU] " << port_.backend_name()
              << " result fn=" << inflight_.request.function_id
              << " rd=" << hex32(result)
              << " cycles=" << inflight_.cycles_elapsed << std::endl;
  }
  inflight_ = CfuInvocation();
  return result;
}

Word CfuDispatcher::call(const CfuRequest& request) {
  issue(request);
  while (!is_done()) {
    step(); // CPU is stalled here; a watchdog expiry propagates out
  }
  return read_result();
}

Word CfuDispatcher::call(uint32_t function_id, Word a, Word b) {
  CfuRequest request;
  request.function_id = function_id;
  request.operand_a   = a;
  request.operand_b   = b;
  return call(request);
}

void CfuDispatcher::reset() {
  port_.reset();
  inflight_ = CfuInvocation();
}

void CfuDispatcher::record(const CfuInvocation& done) {
  CfuCallStats& s = stats_[done.request.function_id];
  if (s.calls == 0 || done.cycles_elapsed < s.min_cycles) s.min_cycles = done.cycles_elapsed;
  if (done.cycles_elapsed > s.max_cycles) s.max_cycles = done.cycles_elapsed;
  s.total_cycles += done.cycles_elapsed;
  ++s.calls;
}

const CfuCallStats& CfuDispatcher::stats(uint32_t function_id) const {
  check_function(function_id);
  return stats_[function_id];
}

void CfuDispatcher::clear_stats() {
  stats_.assign(stats_.size(), CfuCallStats());
}

} // namespace cfulab
