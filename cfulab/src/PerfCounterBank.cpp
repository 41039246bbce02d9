// **********************************************************************
// cfulab/src/PerfCounterBank.cpp
// **********************************************************************

#include "PerfCounterBank.hpp"
#include "CfuTypes.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace cfulab {

PerfCounterBank::PerfCounterBank(const CycleCounter& counter) : counter_(counter) {
}

const PerfCounterBank::Slot& PerfCounterBank::slot(unsigned idx) const {
  if (idx >= kNumCounters) {
    std::ostringstream oss;
    oss << "perf counter " << idx << " outside [0, " << kNumCounters << ")";
    throw ProtocolViolation(oss.str());
  }
  return slots_[idx];
}

void PerfCounterBank::enable(unsigned idx) {
  if (slot(idx).running) {
    std::ostringstream oss;
    oss << "perf counter " << idx << " enabled twice";
    throw ProtocolViolation(oss.str());
  }
  slots_[idx].running = true;
  slots_[idx].start   = counter_.now();
}

void PerfCounterBank::disable(unsigned idx) {
  if (!slot(idx).running) {
    std::ostringstream oss;
    oss << "perf counter " << idx << " disabled while not running";
    throw ProtocolViolation(oss.str());
  }
  Slot& s = slots_[idx];
  s.total += counter_.elapsed(s.start, counter_.now());
  ++s.windows;
  s.running = false;
}

void PerfCounterBank::reset_all() {
  const CycleSnapshot now = counter_.now();
  for (Slot& s : slots_) {
    s.total   = 0;
    s.windows = 0;
    s.start   = now;
  }
}

uint64_t PerfCounterBank::value(unsigned idx) const {
  return slot(idx).total;
}

uint64_t PerfCounterBank::windows(unsigned idx) const {
  return slot(idx).windows;
}

bool PerfCounterBank::running(unsigned idx) const {
  return slot(idx).running;
}

void PerfCounterBank::print_all(std::ostream& os) const {
  std::ios_base::fmtflags old_flags = os.flags();
  for (unsigned i = 0; i < kNumCounters; ++i) {
    const Slot& s = slots_[i];
    if (s.windows == 0 && !s.running) continue;
    os << "PERF[" << i << "] " << std::setw(12) << s.total << " cycles in "
       << s.windows << " window" << (s.windows == 1 ? "" : "s")
       << (s.running ? " (running)" : "") << std::endl;
  }
  os.flags(old_flags);
}

} // namespace cfulab
