// **********************************************************************
// cfulab/src/CycleCounter.cpp
// **********************************************************************

#include "CycleCounter.hpp"
#include "CfuTypes.hpp"

#include <sstream>

namespace cfulab {

uint64_t counter_mask(unsigned width) {
  if (width == 0 || width > 64) {
    std::ostringstream oss;
    oss << "cycle counter width " << width << " outside [1, 64]";
    throw ConfigurationError(oss.str());
  }
  return width == 64 ? ~0ull : ((1ull << width) - 1ull);
}

uint64_t cycles_elapsed(CycleSnapshot start, CycleSnapshot end, unsigned width) {
  return (end.value - start.value) & counter_mask(width);
}

CycleCounter::CycleCounter(unsigned width)
  : width_(width), mask_(counter_mask(width)) {
}

SimClock::SimClock(unsigned width, uint64_t initial)
  : CycleCounter(width), value_(initial & counter_mask(width)) {
}

} // namespace cfulab
