// **********************************************************************
// cfulab/src/CfuDatapath.cpp
// **********************************************************************

#include "CfuDatapath.hpp"

#include <sstream>

namespace cfulab {

CfuDatapath::CfuDatapath(const FunctionRouter& router) : router_(router) {
  if (!router_.sealed()) {
    throw ConfigurationError("CFU backend needs a sealed FunctionRouter");
  }
}

void CfuDatapath::latch(const CfuRequest& request, bool single_cycle) {
  if (latched_) {
    std::ostringstream oss;
    oss << "CFU port already holds function " << request_.function_id
        << (done_ ? " (result unread)" : " (busy)");
    throw ProtocolViolation(oss.str());
  }
  const CfuFunction& fn = router_.route(request.function_id);
  result_    = fn.compute(request.operand_a, request.operand_b);
  request_   = request;
  latched_   = true;
  done_      = false;
  hangs_     = !fn.latency.completes() && !single_cycle;
  remaining_ = single_cycle ? 1u : fn.latency.cycles_for(request.operand_a, request.operand_b);
}

void CfuDatapath::advance() {
  if (!latched_ || done_ || hangs_) return;
  if (remaining_ > 0) --remaining_;
  if (remaining_ == 0) done_ = true;
}

Word CfuDatapath::take() {
  if (!done_) {
    throw ProtocolViolation(latched_ ? "CFU result read while busy" : "CFU result read with nothing issued");
  }
  latched_ = false;
  done_    = false;
  return result_;
}

void CfuDatapath::clear() {
  latched_   = false;
  done_      = false;
  hangs_     = false;
  remaining_ = 0;
  result_    = 0;
}

} // namespace cfulab
