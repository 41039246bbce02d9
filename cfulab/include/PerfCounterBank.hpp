// **********************************************************************
// cfulab/include/PerfCounterBank.hpp
// **********************************************************************
/*
Small bank of accumulating cycle counters built on the cycle counter, for
profiling code that is entered many times (e.g. the inner loop of a conv
kernel).  Each enable()/disable() window adds its elapsed cycles to the
counter; unlike a MeasurementRegion nothing needs to nest.
*/
#pragma once

#include "CycleCounter.hpp"

#include <array>
#include <cstdint>
#include <iosfwd>

namespace cfulab {

class PerfCounterBank {
public:
  static constexpr unsigned kNumCounters = 8;

  explicit PerfCounterBank(const CycleCounter& counter);

  void enable(unsigned idx);   // throws ProtocolViolation if already running
  void disable(unsigned idx);  // throws ProtocolViolation if not running
  void reset_all();            // zero every counter; running windows restart now

  uint64_t value(unsigned idx)   const;
  uint64_t windows(unsigned idx) const;
  bool     running(unsigned idx) const;

  void print_all(std::ostream& os) const;

private:
  struct Slot {
    bool          running = false;
    CycleSnapshot start;
    uint64_t      total   = 0;
    uint64_t      windows = 0;
  };

  const Slot& slot(unsigned idx) const;

  const CycleCounter&             counter_;
  std::array<Slot, kNumCounters>  slots_{};
};

} // namespace cfulab
