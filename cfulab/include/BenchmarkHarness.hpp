// **********************************************************************
// cfulab/include/BenchmarkHarness.hpp
// **********************************************************************
/*
Baseline-vs-accelerated comparison.  For each case, in order, the baseline
and then the accelerated variant run inside their own measurement region;
the result carries both cycle counts and baseline/accelerated.

Precondition (not checked): both variants see identical input data.  A
mismatch only shows up as a nonsensical ratio.

Each variant runs once unless repetitions > 1, in which case the minimum over
the repetitions is reported (the steady-state cost, free of one-off noise).

Report line format (CSV, stable field order, one record per line):
  case_name,baseline_cycles,accelerated_cycles,speedup_ratio
speedup_ratio is N/A when accelerated_cycles == 0.
*/
#pragma once

#include "MeasurementRegion.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace cfulab {

struct BenchmarkCase {
  std::string           name;
  std::function<void()> baseline;
  std::function<void()> accelerated;
};

struct BenchmarkResult {
  std::string case_name;
  uint64_t    baseline_cycles    = 0;
  uint64_t    accelerated_cycles = 0;
  bool        has_speedup        = false;
  double      speedup_ratio      = 0.0; // valid only if has_speedup

  static BenchmarkResult make(const std::string& name, uint64_t baseline, uint64_t accelerated);
};

struct HarnessConfig {
  uint32_t repetitions = 1;     // >= 1, minimum is reported
  bool     verbose     = false; // log each measured run to std::cout
};

class BenchmarkHarness {
public:
  explicit BenchmarkHarness(RegionStack& regions, HarnessConfig config = HarnessConfig());

  std::vector<BenchmarkResult> run(const std::vector<BenchmarkCase>& cases);
  BenchmarkResult              run_case(const BenchmarkCase& bench);

  const HarnessConfig& config() const { return config_; }

private:
  uint64_t measure(const std::string& label, const std::function<void()>& fn);

  RegionStack&  regions_;
  HarnessConfig config_;
};

std::string format_speedup(const BenchmarkResult& result); // "10.00" or "N/A"
std::string csv_field(const std::string& text);              // quoted only when needed
void write_csv_report(std::ostream& os, const std::vector<BenchmarkResult>& results);
void print_report_table(std::ostream& os, const std::vector<BenchmarkResult>& results);

} // namespace cfulab
