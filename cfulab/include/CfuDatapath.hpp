// **********************************************************************
// cfulab/include/CfuDatapath.hpp
// **********************************************************************
/*
Request latch + busy countdown shared by the CFU backends.  latch() computes
the result through the router straight away but holds done low until the
function's latency has been counted down by advance() (one call per cycle).
*/
#pragma once

#include "CfuTypes.hpp"
#include "FunctionRouter.hpp"

#include <cstdint>

namespace cfulab {

class CfuDatapath {
public:
  explicit CfuDatapath(const FunctionRouter& router); // router must be sealed

  void latch(const CfuRequest& request, bool single_cycle);
  void advance();
  Word take();
  void clear();

  bool     busy()      const { return latched_ && !done_; }
  bool     done()      const { return done_; }
  bool     latched()   const { return latched_; }
  uint32_t remaining() const { return remaining_; }
  const CfuRequest& request() const { return request_; }
  const FunctionRouter& router() const { return router_; }

private:
  const FunctionRouter& router_;
  CfuRequest request_{};
  Word     result_    = 0;
  bool     latched_   = false;
  bool     done_      = false;
  bool     hangs_     = false; // LatencyModel::never()
  uint32_t remaining_ = 0;
};

} // namespace cfulab
