// **********************************************************************
// cfulab/src/SimCfu.cpp
// **********************************************************************

#include "SimCfu.hpp"

namespace cfulab {

SimCfu::SimCfu(const FunctionRouter& router, ClockDomain& clock, Timing timing)
  : datapath_(router), clock_(clock), timing_(timing) {
}

void SimCfu::issue(const CfuRequest& request) {
  datapath_.latch(request, timing_ == Timing::Functional);
}

void SimCfu::step_cycle() {
  clock_.step();        // substrate clock first, counter moves regardless of CFU state
  datapath_.advance();
}

bool SimCfu::is_done() const {
  return datapath_.done();
}

Word SimCfu::read_result() {
  return datapath_.take();
}

void SimCfu::reset() {
  datapath_.clear();
}

const char* SimCfu::backend_name() const {
  return timing_ == Timing::Functional ? "functional" : "sim";
}

} // namespace cfulab
