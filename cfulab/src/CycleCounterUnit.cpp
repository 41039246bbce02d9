// **********************************************************************
// cfulab/src/CycleCounterUnit.cpp
// **********************************************************************

#include "CycleCounterUnit.hpp"

using namespace Cascade;

CycleCounterUnit::CycleCounterUnit(std::string /*name*/, unsigned width, u64 preset, IMPL_CTOR)
  : cfulab::CycleCounter(width)
  , preset_(preset & mask())
  , value_(preset & mask())
{
  UPDATE(update);
}

cfulab::CycleSnapshot CycleCounterUnit::now() const {
  cfulab::CycleSnapshot s;
  s.value = value_;
  return s;
}

void CycleCounterUnit::update() {
  value_ = (value_ + 1u) & mask();
}

void CycleCounterUnit::reset() {
  value_ = preset_;
}

void HwClockDomain::step() {
  Sim::run();
}
