// **********************************************************************
// cfulab/include/MeasurementRegion.hpp
// **********************************************************************
/*
Nestable cycle-measurement scopes on one execution context.

RegionStack::begin() snapshots the counter and pushes; end() must close the
innermost open region, anything else is a ProtocolViolation and the stack is
left as it was.  ScopedRegion is the RAII form and always releases on scope
exit, exceptions included.  If a ScopedRegion finds regions still open above
it (begun by hand and never ended) it unwinds them, logs each one and bumps
faults(); callers such as the benchmark harness check that count.

  begin("outer") ------------------------------------------- end  -> outer
       begin("a") ---- end -> a     begin("b") ---- end -> b
  outer.elapsed >= a.elapsed + b.elapsed
*/
#pragma once

#include "CycleCounter.hpp"

#include <cstddef>
#include <iosfwd>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace cfulab {

struct MeasurementRegion {
  std::string   name;
  CycleSnapshot start;
  CycleSnapshot end;
  uint64_t      elapsed_cycles = 0;
  unsigned      depth          = 0; // 0 = outermost
};

struct RegionHandle {
  uint64_t      id    = 0;
  unsigned      depth = 0;
  std::string   name;
  CycleSnapshot start;
};

class RegionStack {
public:
  static constexpr std::size_t kDefaultHistoryLimit = 4096;

  // history keeps the newest `history_limit` closed regions (0 = keep none)
  explicit RegionStack(const CycleCounter& counter, std::size_t history_limit = kDefaultHistoryLimit);

  RegionHandle      begin(const std::string& name);
  MeasurementRegion end(const RegionHandle& handle);

  // Close handle even if regions above it were leaked; never throws.
  void release(const RegionHandle& handle) noexcept;

  std::size_t depth()  const { return open_.size(); }
  uint64_t    faults() const { return faults_; }
  const CycleCounter& counter() const { return counter_; }

  const std::deque<MeasurementRegion>& history() const { return history_; }
  uint64_t history_dropped() const { return dropped_; }
  std::size_t history_limit() const { return history_limit_; }
  void clear_history() { history_.clear(); dropped_ = 0; }
  void print_history(std::ostream& os) const;

private:
  MeasurementRegion close_top();

  const CycleCounter&            counter_;
  std::vector<RegionHandle>      open_;
  std::deque<MeasurementRegion>  history_;
  std::size_t                    history_limit_;
  uint64_t                       dropped_ = 0;
  uint64_t                       next_id_ = 1;
  uint64_t                       faults_  = 0;
};

class ScopedRegion {
public:
  ScopedRegion(RegionStack& stack, const std::string& name);
  ~ScopedRegion();

  ScopedRegion(const ScopedRegion&) = delete;
  ScopedRegion& operator=(const ScopedRegion&) = delete;

  MeasurementRegion close(); // explicit end; the destructor then does nothing
  bool closed() const { return closed_; }
  const RegionHandle& handle() const { return handle_; }

private:
  RegionStack& stack_;
  RegionHandle handle_;
  bool         closed_ = false;
};

} // namespace cfulab
