// **********************************************************************
// cfulab/include/CycleCounterUnit.hpp
// **********************************************************************
/*
Hardware cycle counter (the mcycle-style CSR software reads) as a Cascade
component: W bits, +1 on every clk edge, wraps at 2^W.  The preset is the
value it powers up / resets to; software has no write path.

HwClockDomain presents the Cascade simulator as a cfulab::ClockDomain so the
timing APIs can run against hardware time.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "CycleCounter.hpp"

#include <string>

class CycleCounterUnit : public Component, public cfulab::CycleCounter {
  DECLARE_COMPONENT(CycleCounterUnit);
public:
  CycleCounterUnit(std::string name, unsigned width, u64 preset, COMPONENT_CTOR);
  Clock(clk);

  cfulab::CycleSnapshot now() const override;

  void update();
  void reset();

private:
  u64 preset_ = 0;
  u64 value_  = 0;
};

class HwClockDomain : public cfulab::ClockDomain {
public:
  explicit HwClockDomain(const CycleCounterUnit& counter) : counter_(counter) {}

  void step() override;
  const cfulab::CycleCounter& counter() const override { return counter_; }

private:
  const CycleCounterUnit& counter_;
};
