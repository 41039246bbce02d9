// **********************************************************************
// cfulab/include/CycleCounter.hpp
// **********************************************************************
/*
Free-running W-bit cycle counter and the clock domain that advances it.

Software only ever reads the counter.  Durations are always taken with
elapsed(), i.e. (end - start) mod 2^W, which survives one wraparound; never
compare two snapshots directly.

ClockDomain is the execution substrate: step() is one clock cycle of whatever
drives the system (a software-stepped SimClock, or the Cascade simulator via
HwClockDomain in CycleCounterUnit.hpp).  Every timing API takes one
explicitly; there is no global clock.
*/
#pragma once

#include <cstdint>

namespace cfulab {

struct CycleSnapshot {
  uint64_t value = 0; // raw counter bits, already reduced mod 2^W
};

uint64_t counter_mask(unsigned width);                                        // 2^W - 1
uint64_t cycles_elapsed(CycleSnapshot start, CycleSnapshot end, unsigned width);

class CycleCounter {
public:
  explicit CycleCounter(unsigned width); // width in [1, 64]
  virtual ~CycleCounter() = default;

  virtual CycleSnapshot now() const = 0;

  unsigned width() const { return width_; }
  uint64_t mask()  const { return mask_; }
  uint64_t elapsed(CycleSnapshot start, CycleSnapshot end) const {
    return (end.value - start.value) & mask_;
  }

private:
  unsigned width_;
  uint64_t mask_;
};

class ClockDomain {
public:
  virtual ~ClockDomain() = default;

  virtual void step() = 0;                          // advance one clock cycle
  virtual const CycleCounter& counter() const = 0;

  void run(uint64_t cycles) {
    for (uint64_t i = 0; i < cycles; ++i) step();
  }
};

// Software-stepped clock domain with its own counter.  The initial value is a
// power-on preset (lets tests start just below the wrap point).
class SimClock : public ClockDomain, public CycleCounter {
public:
  explicit SimClock(unsigned width = 64, uint64_t initial = 0);

  void step() override { value_ = (value_ + 1u) & mask(); ++ticks_; }
  const CycleCounter& counter() const override { return *this; }
  CycleSnapshot now() const override { CycleSnapshot s; s.value = value_; return s; }

  uint64_t ticks() const { return ticks_; } // total steps, never wraps

private:
  uint64_t value_;
  uint64_t ticks_ = 0;
};

} // namespace cfulab
