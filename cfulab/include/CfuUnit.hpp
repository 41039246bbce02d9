// **********************************************************************
// cfulab/include/CfuUnit.hpp
// **********************************************************************
/*
Clocked CFU model.  A Cascade component whose update() runs on every edge of
clk and counts down the busy window of the latched request, so its timing is
whatever the simulated hardware does rather than a software declaration.

The CfuPort side is the HAL the CPU model uses between clock edges:
issue()/is_done()/read_result() touch the latch, step_cycle() advances the
whole simulator by one clock (Sim::run()), so it only works after Sim::init().

  CPU --issue(fn, a, b)--> [ latch | countdown ] --done--> CPU
                                 ^ clk
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "CfuDatapath.hpp"
#include "CfuPort.hpp"

#include <string>

class CfuUnit : public Component, public cfulab::CfuPort {
  DECLARE_COMPONENT(CfuUnit);
public:
  CfuUnit(std::string name, const cfulab::FunctionRouter& router, COMPONENT_CTOR);
  Clock(clk);

  // HAL / CfuPort
  void         issue(const cfulab::CfuRequest& request) override;
  void         step_cycle() override;
  bool         is_done() const override;
  cfulab::Word read_result() override;
  void         reset() override; // also the simulator reset hook

  void update();

  uint32_t    function_count() const override { return datapath_.router().function_count(); }
  const char* backend_name()   const override { return "hw"; }

  u64 busy_cycles() const { return busy_cycles_; } // edges seen with a request in flight

private:
  cfulab::CfuDatapath datapath_;
  u64 busy_cycles_ = 0;
};
