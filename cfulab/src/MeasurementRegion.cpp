// **********************************************************************
// cfulab/src/MeasurementRegion.cpp
// **********************************************************************

#include "MeasurementRegion.hpp"
#include "CfuTypes.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace cfulab {

RegionStack::RegionStack(const CycleCounter& counter, std::size_t history_limit)
  : counter_(counter), history_limit_(history_limit) {
}

RegionHandle RegionStack::begin(const std::string& name) {
  RegionHandle h;
  h.id    = next_id_++;
  h.depth = static_cast<unsigned>(open_.size());
  h.name  = name;
  h.start = counter_.now();
  open_.push_back(h);
  return h;
}

MeasurementRegion RegionStack::close_top() {
  const RegionHandle top = open_.back();
  open_.pop_back();
  MeasurementRegion r;
  r.name           = top.name;
  r.start          = top.start;
  r.end            = counter_.now();
  r.elapsed_cycles = counter_.elapsed(r.start, r.end);
  r.depth          = top.depth;
  history_.push_back(r);
  while (history_.size() > history_limit_) {
    history_.pop_front();
    ++dropped_;
  }
  return r;
}

MeasurementRegion RegionStack::end(const RegionHandle& handle) {
  if (open_.empty()) {
    throw ProtocolViolation("end of region '" + handle.name + "' without a matching begin");
  }
  if (open_.back().id != handle.id) {
    throw ProtocolViolation("mismatched region: ending '" + handle.name + "' while '"
                            + open_.back().name + "' is innermost");
  }
  return close_top();
}

void RegionStack::release(const RegionHandle& handle) noexcept {
  bool present = false;
  for (const RegionHandle& h : open_) {
    if (h.id == handle.id) { present = true; break; }
  }
  if (!present) {
    ++faults_;
    std::cerr << "[REGION] release of '" << handle.name << "' which is not open" << std::endl;
    return;
  }
  while (open_.back().id != handle.id) {
    ++faults_;
    std::cerr << "[REGION] '" << open_.back().name << "' left open inside '"
              << handle.name << "', unwinding it" << std::endl;
    close_top();
  }
  close_top();
}

void RegionStack::print_history(std::ostream& os) const {
  std::ios_base::fmtflags old_flags = os.flags();
  if (dropped_) {
    os << "(" << dropped_ << " older regions dropped)" << std::endl;
  }
  for (const MeasurementRegion& r : history_) {
    const std::string label = std::string(2 * r.depth, ' ') + r.name;
    os << std::left << std::setw(32) << label
       << std::right << std::setw(12) << r.elapsed_cycles << " cycles" << std::endl;
  }
  os.flags(old_flags);
}

ScopedRegion::ScopedRegion(RegionStack& stack, const std::string& name)
  : stack_(stack), handle_(stack.begin(name)) {
}

ScopedRegion::~ScopedRegion() {
  if (!closed_) {
    stack_.release(handle_);
  }
}

MeasurementRegion ScopedRegion::close() {
  if (closed_) {
    throw ProtocolViolation("region '" + handle_.name + "' closed twice");
  }
  MeasurementRegion r = stack_.end(handle_);
  closed_ = true;
  return r;
}

} // namespace cfulab
