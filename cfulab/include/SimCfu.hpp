// **********************************************************************
// cfulab/include/SimCfu.hpp
// **********************************************************************
/*
Software CfuPort backend.  Modeled timing holds done low for the latency each
function declares; Functional timing ignores the model and finishes every
call after one cycle (a functional emulator for CI runs where only results
matter).  step_cycle() advances the supplied clock domain, so the cycle
counter keeps ticking exactly once per cycle whether or not a call is busy.
*/
#pragma once

#include "CfuDatapath.hpp"
#include "CfuPort.hpp"
#include "CycleCounter.hpp"

namespace cfulab {

class SimCfu : public CfuPort {
public:
  enum class Timing { Modeled, Functional };

  SimCfu(const FunctionRouter& router, ClockDomain& clock, Timing timing = Timing::Modeled);

  void issue(const CfuRequest& request) override;
  void step_cycle() override;
  bool is_done() const override;
  Word read_result() override;
  void reset() override;

  uint32_t    function_count() const override { return datapath_.router().function_count(); }
  const char* backend_name()   const override;

  Timing timing() const { return timing_; }

private:
  CfuDatapath  datapath_;
  ClockDomain& clock_;
  Timing       timing_;
};

} // namespace cfulab
