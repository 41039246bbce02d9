// **********************************************************************
// cfulab/src/FunctionRouter.cpp
// **********************************************************************

#include "FunctionRouter.hpp"

#include <sstream>
#include <utility>

namespace cfulab {

LatencyModel LatencyModel::fixed(uint32_t cycles) {
  if (cycles == 0) {
    throw ConfigurationError("fixed CFU latency must be at least 1 cycle");
  }
  LatencyModel m;
  m.kind_   = Kind::Fixed;
  m.cycles_ = cycles;
  return m;
}

LatencyModel LatencyModel::data_dependent(CfuLatencyFn fn) {
  if (!fn) {
    throw ConfigurationError("data-dependent CFU latency needs a callable");
  }
  LatencyModel m;
  m.kind_ = Kind::DataDependent;
  m.fn_   = std::move(fn);
  return m;
}

LatencyModel LatencyModel::never() {
  LatencyModel m;
  m.kind_   = Kind::Never;
  m.cycles_ = 0;
  return m;
}

uint32_t LatencyModel::cycles_for(Word a, Word b) const {
  switch (kind_) {
    case Kind::Fixed:         return cycles_;
    case Kind::DataDependent: {
      const uint32_t c = fn_(a, b);
      return c == 0 ? 1u : c; // Busy lasts at least one cycle
    }
    case Kind::Never:         return 0;
  }
  return cycles_;
}

FunctionRouter::FunctionRouter(uint32_t function_count) {
  if (function_count == 0 || function_count > kMaxFunctions) {
    std::ostringstream oss;
    oss << "CFU function count " << function_count << " outside [1, " << kMaxFunctions << "]";
    throw ConfigurationError(oss.str());
  }
  slots_.resize(function_count);
}

void FunctionRouter::register_function(uint32_t function_id,
                                       const std::string& name,
                                       CfuCompute compute,
                                       LatencyModel latency) {
  std::ostringstream oss;
  if (sealed_) {
    oss << "cannot register '" << name << "': router already sealed";
    throw ConfigurationError(oss.str());
  }
  if (function_id >= slots_.size()) {
    oss << "function id " << function_id << " ('" << name << "') outside [0, " << slots_.size() << ")";
    throw ConfigurationError(oss.str());
  }
  if (slots_[function_id].used) {
    oss << "function id " << function_id << " already registered as '" << slots_[function_id].fn.name << "'";
    throw ConfigurationError(oss.str());
  }
  if (!compute) {
    oss << "function id " << function_id << " ('" << name << "') has no compute callable";
    throw ConfigurationError(oss.str());
  }
  Slot& slot = slots_[function_id];
  slot.used       = true;
  slot.fn.name    = name;
  slot.fn.compute = std::move(compute);
  slot.fn.latency = std::move(latency);
}

void FunctionRouter::seal() {
  std::ostringstream missing;
  uint32_t n_missing = 0;
  for (uint32_t id = 0; id < slots_.size(); ++id) {
    if (!slots_[id].used) {
      missing << (n_missing ? ", " : "") << id;
      ++n_missing;
    }
  }
  if (n_missing) {
    throw ConfigurationError("unregistered CFU function ids: " + missing.str());
  }
  sealed_ = true;
}

const CfuFunction& FunctionRouter::route(uint32_t function_id) const {
  if (function_id >= slots_.size()) {
    std::ostringstream oss;
    oss << "function id " << function_id << " outside [0, " << slots_.size() << ")";
    throw ProtocolViolation(oss.str());
  }
  const Slot& slot = slots_[function_id];
  if (!slot.used) {
    std::ostringstream oss;
    oss << "function id " << function_id << " is not registered";
    throw ConfigurationError(oss.str());
  }
  return slot.fn;
}

} // namespace cfulab
