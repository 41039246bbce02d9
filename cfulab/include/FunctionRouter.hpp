// **********************************************************************
// cfulab/include/FunctionRouter.hpp
// **********************************************************************
/*
Static table of the F functions a CFU implements.  Every id in [0, F) must be
registered before seal(); backends refuse an unsealed router, so a missing id
shows up at setup rather than on the first call.  Lookup is a plain index.
*/
#pragma once

#include "CfuTypes.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cfulab {

typedef std::function<Word(Word, Word)>     CfuCompute;
typedef std::function<uint32_t(Word, Word)> CfuLatencyFn;

// How many cycles a function stays Busy for a given operand pair
class LatencyModel {
public:
  enum class Kind { Fixed, DataDependent, Never };

  static LatencyModel fixed(uint32_t cycles);        // cycles >= 1
  static LatencyModel data_dependent(CfuLatencyFn fn);
  static LatencyModel never();                       // never asserts done (fault injection)

  Kind kind()        const { return kind_; }
  bool completes()   const { return kind_ != Kind::Never; }
  uint32_t cycles_for(Word a, Word b) const;         // >= 1; meaningless for Never

private:
  LatencyModel() = default;

  Kind         kind_   = Kind::Fixed;
  uint32_t     cycles_ = 1;
  CfuLatencyFn fn_;
};

struct CfuFunction {
  std::string  name;
  CfuCompute   compute;
  LatencyModel latency = LatencyModel::fixed(1);
};

class FunctionRouter {
public:
  explicit FunctionRouter(uint32_t function_count);

  void register_function(uint32_t function_id,
                         const std::string& name,
                         CfuCompute compute,
                         LatencyModel latency = LatencyModel::fixed(1));
  void seal(); // throws ConfigurationError listing unregistered ids

  const CfuFunction& route(uint32_t function_id) const;

  uint32_t function_count()         const { return static_cast<uint32_t>(slots_.size()); }
  bool     sealed()                 const { return sealed_; }
  bool     registered(uint32_t id)  const { return id < slots_.size() && slots_[id].used; }
  const std::string& name(uint32_t id) const { return route(id).name; }

private:
  struct Slot {
    bool        used = false;
    CfuFunction fn;
  };

  std::vector<Slot> slots_;
  bool sealed_ = false;
};

} // namespace cfulab
