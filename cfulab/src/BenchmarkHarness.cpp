// **********************************************************************
// cfulab/src/BenchmarkHarness.cpp
// **********************************************************************

#include "BenchmarkHarness.hpp"
#include "CfuTypes.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace cfulab {

BenchmarkResult BenchmarkResult::make(const std::string& name, uint64_t baseline, uint64_t accelerated) {
  BenchmarkResult r;
  r.case_name          = name;
  r.baseline_cycles    = baseline;
  r.accelerated_cycles = accelerated;
  if (accelerated != 0) {
    r.has_speedup   = true;
    r.speedup_ratio = static_cast<double>(baseline) / static_cast<double>(accelerated);
  }
  return r;
}

BenchmarkHarness::BenchmarkHarness(RegionStack& regions, HarnessConfig config)
  : regions_(regions), config_(config) {
  if (config_.repetitions == 0) {
    throw ConfigurationError("benchmark repetitions must be at least 1");
  }
}

uint64_t BenchmarkHarness::measure(const std::string& label, const std::function<void()>& fn) {
  if (!fn) {
    throw ConfigurationError("benchmark variant '" + label + "' has no function");
  }
  const uint64_t faults_before = regions_.faults();
  const std::size_t depth_before = regions_.depth();
  MeasurementRegion region;
  {
    ScopedRegion scope(regions_, label);
    fn();
    region = scope.close(); // throws if the workload left a region of its own open
  }
  if (regions_.faults() != faults_before || regions_.depth() != depth_before) {
    throw ProtocolViolation("benchmark variant '" + label + "' left the region stack unbalanced");
  }
  if (config_.verbose) {
    std::cout << "[BENCH] " << std::left << std::setw(40) << label << std::right
              << std::setw(12) << region.elapsed_cycles << " cycles" << std::endl;
  }
  return region.elapsed_cycles;
}

BenchmarkResult BenchmarkHarness::run_case(const BenchmarkCase& bench) {
  uint64_t best_baseline    = 0;
  uint64_t best_accelerated = 0;
  for (uint32_t rep = 0; rep < config_.repetitions; ++rep) {
    const uint64_t b = measure(bench.name + "/baseline", bench.baseline);
    const uint64_t a = measure(bench.name + "/accelerated", bench.accelerated);
    if (rep == 0 || b < best_baseline)    best_baseline    = b;
    if (rep == 0 || a < best_accelerated) best_accelerated = a;
  }
  return BenchmarkResult::make(bench.name, best_baseline, best_accelerated);
}

std::vector<BenchmarkResult> BenchmarkHarness::run(const std::vector<BenchmarkCase>& cases) {
  std::vector<BenchmarkResult> results;
  results.reserve(cases.size());
  for (const BenchmarkCase& c : cases) {
    results.push_back(run_case(c)); // strictly sequential, never two calls in flight
  }
  return results;
}

// RFC 4180: quote a field holding a separator, quote or line break
std::string csv_field(const std::string& text) {
  if (text.find_first_of(",\"\r\n") == std::string::npos) return text;
  std::string out = "\"";
  for (char c : text) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string format_speedup(const BenchmarkResult& result) {
  if (!result.has_speedup) return "N/A";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << result.speedup_ratio;
  return oss.str();
}

void write_csv_report(std::ostream& os, const std::vector<BenchmarkResult>& results) {
  os << "case_name,baseline_cycles,accelerated_cycles,speedup_ratio\n";
  for (const BenchmarkResult& r : results) {
    os << csv_field(r.case_name) << ','
       << r.baseline_cycles << ','
       << r.accelerated_cycles << ','
       << format_speedup(r) << '\n';
  }
  os.flush();
}

void print_report_table(std::ostream& os, const std::vector<BenchmarkResult>& results) {
  std::ios_base::fmtflags old_flags = os.flags();

  os << "\n=== Benchmark Report ===\n";
  os << std::left  << std::setw(28) << "case"
     << std::right << std::setw(16) << "baseline"
     << std::setw(16) << "accelerated"
     << std::setw(10) << "speedup" << '\n';
  os << std::string(70, '-') << '\n';
  for (const BenchmarkResult& r : results) {
    const std::string speedup = r.has_speedup ? format_speedup(r) + "x" : "N/A";
    os << std::left  << std::setw(28) << r.case_name
       << std::right << std::setw(16) << r.baseline_cycles
       << std::setw(16) << r.accelerated_cycles
       << std::setw(10) << speedup << '\n';
  }
  os << std::endl;

  os.flags(old_flags);
}

} // namespace cfulab
