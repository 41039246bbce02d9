// **********************************************************************
// cfulab/src/CfuUnit.cpp
// **********************************************************************

#include "CfuUnit.hpp"

using namespace Cascade;

CfuUnit::CfuUnit(std::string /*name*/, const cfulab::FunctionRouter& router, IMPL_CTOR)
  : datapath_(router)
{
  UPDATE(update); // registers the update fn (called on every clock cycle)
}

void CfuUnit::issue(const cfulab::CfuRequest& request) {
  datapath_.latch(request, false);
  trace("cfu: issue fn=%u a=0x%08x b=0x%08x lat=%u\n",
        request.function_id, request.operand_a, request.operand_b, datapath_.remaining());
}

void CfuUnit::step_cycle() {
  Sim::run(); // one clock edge for every component, this unit included
}

bool CfuUnit::is_done() const {
  return datapath_.done();
}

cfulab::Word CfuUnit::read_result() {
  const cfulab::Word result = datapath_.take();
  trace("cfu: result 0x%08x\n", result);
  return result;
}

// countdown runs on the clock, not on the HAL calls
void CfuUnit::update() {
  if (!datapath_.busy()) return;
  ++busy_cycles_;
  datapath_.advance();
  if (datapath_.done()) {
    trace("cfu: done fn=%u\n", datapath_.request().function_id);
  }
}

void CfuUnit::reset() {
  datapath_.clear();
  busy_cycles_ = 0;
}
