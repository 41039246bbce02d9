// **********************************************************************
// cfulab/src/tb_bench.cpp
// **********************************************************************
/*
Profiling testbench: cycle counter arithmetic, measurement regions, the
benchmark harness and its reports, the perf counter bank, and the example
workloads end to end on the software backend.

cfulab/build % ./tb_bench -suite=region_nested
cfulab/build % ./tb_bench -suite=all
*/
#include <descore/Parameter.hpp>
#include <cascade/Cascade.hpp>
#include "BenchmarkHarness.hpp"
#include "CfuDispatcher.hpp"
#include "CfuFunctions.hpp"
#include "MeasurementRegion.hpp"
#include "PerfCounterBank.hpp"
#include "SimCfu.hpp"
#include "Workloads.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;
using namespace cfulab;

// **************
// Parameters (CLI flags): name, default value, help text
// **************
StringParameter(suite,  "all", "Suite: all|counter_zero|counter_wrap|region_nested|region_history|region_mismatch|region_unwind|"
                               "bench_speedup|bench_reps|bench_unbalanced|report_csv|perf_bank|workloads");
IntParameter(length,    64,    "Elements per workload kernel (workloads suite)");
BoolParameter(verbose,  false, "Log every measured run");

namespace {

template <typename E, typename Fn>
bool throws(Fn fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

bool counter_zero() {
  SimClock clk(32, 1234);
  const CycleSnapshot s = clk.now();
  assert_always(clk.elapsed(s, s) == 0, "zero: elapsed(s, s) != 0");
  assert_always(cycles_elapsed(s, s, 32) == 0, "zero: free function elapsed(s, s) != 0");
  clk.run(3);
  assert_always(clk.elapsed(s, clk.now()) == 3, "zero: three steps");
  return true;
}

bool counter_wrap() {
  SimClock clk(8, 250);
  const CycleSnapshot s = clk.now();
  clk.run(16);
  const CycleSnapshot e = clk.now();
  assert_always(e.value == 10, "wrap: 8-bit counter did not wrap to 10");
  assert_always(clk.elapsed(s, e) == 16, "wrap: elapsed across wrap");
  assert_always(cycles_elapsed(s, e, 8) == 16, "wrap: free function elapsed across wrap");
  assert_always(clk.ticks() == 16, "wrap: ticks");

  SimClock wide(64, ~0ull - 1);
  const CycleSnapshot ws = wide.now();
  wide.run(3);
  assert_always(wide.now().value == 1, "wrap: 64-bit counter did not wrap");
  assert_always(wide.elapsed(ws, wide.now()) == 3, "wrap: 64-bit elapsed across wrap");

  assert_always(counter_mask(1) == 1, "wrap: mask(1)");
  assert_always(counter_mask(64) == ~0ull, "wrap: mask(64)");
  assert_always(throws<ConfigurationError>([] { counter_mask(0); }), "wrap: width 0 accepted");
  assert_always(throws<ConfigurationError>([] { counter_mask(65); }), "wrap: width 65 accepted");
  assert_always(throws<ConfigurationError>([] { SimClock bad(0); }), "wrap: SimClock width 0 accepted");
  return true;
}

bool region_nested() {
  SimClock clk(8, 250); // outer window crosses the 8-bit wrap
  RegionStack regions(clk);

  const RegionHandle outer = regions.begin("outer");
  clk.run(5);
  const RegionHandle inner = regions.begin("inner");
  assert_always(regions.depth() == 2 && inner.depth == 1, "nested: depth");
  clk.run(7);
  const MeasurementRegion ri = regions.end(inner);
  clk.run(2);
  const RegionHandle sibling = regions.begin("sibling");
  clk.run(3);
  const MeasurementRegion rs = regions.end(sibling);
  const MeasurementRegion ro = regions.end(outer);

  assert_always(ri.elapsed_cycles == 7 && rs.elapsed_cycles == 3, "nested: inner cycles");
  assert_always(ro.elapsed_cycles == 17, "nested: outer cycles");
  assert_always(ro.elapsed_cycles >= ri.elapsed_cycles + rs.elapsed_cycles, "nested: outer shorter than its children");
  assert_always(clk.elapsed(ro.start, ri.start) <= ro.elapsed_cycles
                && clk.elapsed(rs.end, ro.end) <= ro.elapsed_cycles, "nested: children not contained");
  assert_always(ro.end.value < ro.start.value, "nested: window did not cross the wrap");
  assert_always(ri.depth == 1 && rs.depth == 1 && ro.depth == 0, "nested: recorded depth");
  assert_always(regions.history().size() == 3, "nested: history size");
  assert_always(regions.history()[0].name == "inner" && regions.history()[1].name == "sibling"
                && regions.history()[2].name == "outer", "nested: close order");
  assert_always(regions.depth() == 0 && regions.faults() == 0, "nested: stack not clean");

  std::ostringstream os;
  regions.print_history(os);
  assert_always(os.str().find("  inner") != std::string::npos, "nested: inner not indented in history");
  return true;
}

bool region_history() {
  SimClock clk;
  RegionStack regions(clk, 2);
  for (int i = 0; i < 3; ++i) {
    ScopedRegion scope(regions, "r" + std::to_string(i));
    clk.run(i + 1);
    scope.close();
  }
  assert_always(regions.history().size() == 2, "history: limit not applied");
  assert_always(regions.history_dropped() == 1, "history: dropped count");
  assert_always(regions.history()[0].name == "r1" && regions.history()[1].name == "r2", "history: oldest not dropped");
  std::ostringstream os;
  regions.print_history(os);
  assert_always(os.str().find("1 older regions dropped") != std::string::npos, "history: drop not reported");

  // a harness on a zero-limit stack still measures, it just keeps nothing
  RegionStack none(clk, 0);
  HarnessConfig cfg;
  cfg.repetitions = 50;
  BenchmarkHarness harness(none, cfg);
  BenchmarkCase c;
  c.name        = "many";
  c.baseline    = [&] { clk.run(6); };
  c.accelerated = [&] { clk.run(2); };
  assert_always(harness.run_case(c).speedup_ratio == 3.0, "history: measurement with no history");
  assert_always(none.history().empty() && none.history_dropped() == 100, "history: zero limit kept regions");

  regions.clear_history();
  assert_always(regions.history().empty() && regions.history_dropped() == 0, "history: clear");
  return true;
}

bool region_mismatch() {
  SimClock clk;
  RegionStack regions(clk);

  assert_always(throws<ProtocolViolation>([&] {
    RegionHandle stray;
    stray.name = "stray";
    regions.end(stray);
  }), "mismatch: end on an empty stack accepted");

  const RegionHandle outer = regions.begin("outer");
  const RegionHandle inner = regions.begin("inner");
  clk.run(4);
  assert_always(throws<ProtocolViolation>([&] { regions.end(outer); }), "mismatch: end(outer) with inner open");
  assert_always(regions.depth() == 2, "mismatch: failed end changed the stack");
  assert_always(regions.history().empty(), "mismatch: failed end recorded a region");

  assert_always(regions.end(inner).elapsed_cycles == 4, "mismatch: inner after recovery");
  regions.end(outer);
  assert_always(throws<ProtocolViolation>([&] { regions.end(outer); }), "mismatch: double end accepted");

  ScopedRegion scope(regions, "scoped");
  scope.close();
  assert_always(throws<ProtocolViolation>([&] { scope.close(); }), "mismatch: scoped close twice");
  return true;
}

bool region_unwind() {
  SimClock clk;
  RegionStack regions(clk);
  {
    ScopedRegion outer(regions, "outer");
    regions.begin("leaked");
    clk.run(3);
  } // outer's destructor must unwind 'leaked' first
  assert_always(regions.depth() == 0, "unwind: stack not empty after scope exit");
  assert_always(regions.faults() == 1, "unwind: leaked region not counted");
  assert_always(regions.history().size() == 2, "unwind: history size");
  assert_always(regions.history()[0].name == "leaked" && regions.history()[1].name == "outer", "unwind: order");
  assert_always(regions.history()[1].elapsed_cycles == 3, "unwind: outer cycles");

  // an exception inside a scoped region still closes it
  bool caught = false;
  try {
    ScopedRegion scope(regions, "throws");
    clk.run(2);
    throw ProtocolViolation("workload failed");
  } catch (const ProtocolViolation&) {
    caught = true;
  }
  assert_always(caught, "unwind: exception lost");
  assert_always(regions.depth() == 0 && regions.faults() == 1, "unwind: exception path left the stack dirty");

  // releasing a handle that is no longer open is a fault, not a crash
  RegionHandle gone;
  gone.id   = 999;
  gone.name = "gone";
  regions.release(gone);
  assert_always(regions.faults() == 2, "unwind: release of a closed handle not counted");
  return true;
}

bool bench_speedup() {
  SimClock clk;
  RegionStack regions(clk);
  BenchmarkHarness harness(regions);

  BenchmarkCase c;
  c.name        = "tenfold";
  c.baseline    = [&] { clk.run(100); };
  c.accelerated = [&] { clk.run(10); };
  BenchmarkCase free_case;
  free_case.name        = "free";
  free_case.baseline    = [&] { clk.run(50); };
  free_case.accelerated = [] {};

  const vector<BenchmarkResult> rs = harness.run({c, free_case});
  assert_always(rs.size() == 2 && rs[0].case_name == "tenfold" && rs[1].case_name == "free", "speedup: case order");
  assert_always(rs[0].baseline_cycles == 100 && rs[0].accelerated_cycles == 10, "speedup: measured cycles");
  assert_always(rs[0].has_speedup && rs[0].speedup_ratio == 10.0, "speedup: 100 / 10 != 10");
  assert_always(format_speedup(rs[0]) == "10.00", "speedup: format");
  assert_always(rs[1].accelerated_cycles == 0 && !rs[1].has_speedup, "speedup: zero accelerated cycles not undefined");
  assert_always(format_speedup(rs[1]) == "N/A", "speedup: N/A format");

  const BenchmarkResult slower = BenchmarkResult::make("slower", 10, 40);
  assert_always(slower.has_speedup && slower.speedup_ratio == 0.25, "speedup: ratio below one");

  assert_always(regions.history().size() == 4, "speedup: one region per variant run");
  assert_always(regions.history()[0].name == "tenfold/baseline", "speedup: region label");
  return true;
}

bool bench_reps() {
  SimClock clk;
  RegionStack regions(clk);
  HarnessConfig cfg;
  cfg.repetitions = 3;
  cfg.verbose     = verbose;
  BenchmarkHarness harness(regions, cfg);

  const vector<uint64_t> base_costs  = {30, 10, 20};
  const vector<uint64_t> accel_costs = {5, 7, 3};
  size_t base_rep = 0, accel_rep = 0;
  BenchmarkCase c;
  c.name        = "noisy";
  c.baseline    = [&] { clk.run(base_costs[base_rep++]); };
  c.accelerated = [&] { clk.run(accel_costs[accel_rep++]); };

  const BenchmarkResult r = harness.run_case(c);
  assert_always(base_rep == 3 && accel_rep == 3, "reps: variant run count");
  assert_always(r.baseline_cycles == 10, "reps: baseline not the minimum");
  assert_always(r.accelerated_cycles == 3, "reps: accelerated not the minimum");
  assert_always(format_speedup(r) == "3.33", "reps: speedup of the minima");

  assert_always(throws<ConfigurationError>([&] {
    HarnessConfig zero;
    zero.repetitions = 0;
    BenchmarkHarness bad(regions, zero);
  }), "reps: zero repetitions accepted");
  return true;
}

bool bench_unbalanced() {
  SimClock clk;
  RegionStack regions(clk);
  BenchmarkHarness harness(regions);

  BenchmarkCase leaky;
  leaky.name        = "leaky";
  leaky.baseline    = [&] { regions.begin("never_closed"); clk.run(4); };
  leaky.accelerated = [&] { clk.run(1); };
  assert_always(throws<ProtocolViolation>([&] { harness.run_case(leaky); }), "unbalanced: leak not reported");
  assert_always(regions.depth() == 0, "unbalanced: stack left dirty");
  assert_always(regions.faults() == 1, "unbalanced: leak not counted");

  BenchmarkCase missing;
  missing.name     = "missing";
  missing.baseline = [&] { clk.run(1); };
  assert_always(throws<ConfigurationError>([&] { harness.run_case(missing); }), "unbalanced: empty variant accepted");

  // harness keeps working afterwards
  BenchmarkCase ok;
  ok.name        = "ok";
  ok.baseline    = [&] { clk.run(8); };
  ok.accelerated = [&] { clk.run(2); };
  assert_always(harness.run_case(ok).speedup_ratio == 4.0, "unbalanced: harness unusable after a failure");
  return true;
}

bool report_csv() {
  const vector<BenchmarkResult> rs = {
    BenchmarkResult::make("a", 100, 10),
    BenchmarkResult::make("b", 7, 0),
  };
  std::ostringstream os;
  write_csv_report(os, rs);
  const std::string expected =
      "case_name,baseline_cycles,accelerated_cycles,speedup_ratio\n"
      "a,100,10,10.00\n"
      "b,7,0,N/A\n";
  assert_always(os.str() == expected, "csv: unexpected report text");

  // names carrying separators, quotes or line breaks are quoted, so every record keeps 4 fields
  std::ostringstream quoted;
  write_csv_report(quoted, {
    BenchmarkResult::make("conv3x3,int8", 100, 10),
    BenchmarkResult::make("say \"hi\"", 4, 2),
    BenchmarkResult::make("two\nlines", 3, 3),
  });
  const std::string expected_quoted =
      "case_name,baseline_cycles,accelerated_cycles,speedup_ratio\n"
      "\"conv3x3,int8\",100,10,10.00\n"
      "\"say \"\"hi\"\"\",4,2,2.00\n"
      "\"two\nlines\",3,3,1.00\n";
  assert_always(quoted.str() == expected_quoted, "csv: case names not quoted");
  assert_always(csv_field("plain_name") == "plain_name", "csv: plain name quoted");

  std::ostringstream table;
  table << std::hex;
  print_report_table(table, rs);
  assert_always(table.str().find("10.00x") != std::string::npos, "csv: table speedup column");
  assert_always((table.flags() & std::ios_base::basefield) == std::ios_base::hex, "csv: table did not restore flags");
  return true;
}

bool perf_bank() {
  SimClock clk;
  PerfCounterBank bank(clk);
  bank.enable(0);
  clk.run(10);
  bank.disable(0);
  clk.run(100); // not counted
  bank.enable(0);
  clk.run(5);
  bank.disable(0);
  assert_always(bank.value(0) == 15 && bank.windows(0) == 2, "perf: accumulation over two windows");

  bank.enable(1);
  assert_always(bank.running(1), "perf: counter 1 not running");
  assert_always(throws<ProtocolViolation>([&] { bank.enable(1); }), "perf: double enable");
  assert_always(throws<ProtocolViolation>([&] { bank.disable(2); }), "perf: disable while stopped");
  assert_always(throws<ProtocolViolation>([&] { bank.enable(PerfCounterBank::kNumCounters); }), "perf: index out of range");

  std::ostringstream os;
  bank.print_all(os);
  assert_always(os.str().find("PERF[0]") != std::string::npos, "perf: counter 0 not printed");
  assert_always(os.str().find("(running)") != std::string::npos, "perf: running counter not flagged");

  bank.reset_all();
  assert_always(bank.value(0) == 0 && bank.windows(0) == 0, "perf: reset_all");
  clk.run(6);
  bank.disable(1);
  assert_always(bank.value(1) == 6, "perf: running window did not restart at reset_all");
  return true;
}

bool workloads(int n) {
  FunctionRouter router(kNumExampleFunctions);
  register_example_functions(router);
  SimClock clk;
  SimCfu port(router, clk);
  CfuDispatcher cfu(port);
  CpuModel cpu(clk);
  ExampleWorkloads wl(cfu, cpu, static_cast<uint32_t>(n));
  assert_always(wl.length() % 4 == 0 && wl.length() >= static_cast<uint32_t>(n), "workloads: length rounding");

  PerfCounterBank perf(clk);
  wl.attach_perf(&perf);

  RegionStack regions(clk);
  HarnessConfig cfg;
  cfg.verbose = verbose;
  BenchmarkHarness harness(regions, cfg);
  const vector<BenchmarkResult> rs = harness.run(wl.cases());

  // only the accelerated variants call the CFU, one perf window per call
  assert_always(perf.windows(ExampleWorkloads::PERF_DOT) == wl.length() / 4, "workloads: dot perf windows");
  assert_always(perf.windows(ExampleWorkloads::PERF_HAMMING) == wl.length(), "workloads: hamming perf windows");
  assert_always(perf.windows(ExampleWorkloads::PERF_REQUANT) == wl.length(), "workloads: requant perf windows");
  assert_always(perf.value(ExampleWorkloads::PERF_DOT) == cfu.stats(FN_SIMD_MAC4).total_cycles, "workloads: dot perf cycles");
  assert_always(perf.value(ExampleWorkloads::PERF_HAMMING) == cfu.stats(FN_POPCOUNT).total_cycles,
                "workloads: hamming perf cycles");
  assert_always(perf.value(ExampleWorkloads::PERF_REQUANT) == cfu.stats(FN_MULHI).total_cycles,
                "workloads: requant perf cycles");

  assert_always(wl.verify(), "workloads: accelerated output differs from baseline");
  assert_always(wl.dot_result_baseline() == wl.dot_result_accelerated(), "workloads: dot product");
  assert_always(wl.hamming_result_baseline() == wl.hamming_result_accelerated(), "workloads: hamming distance");
  assert_always(rs.size() == 3, "workloads: case count");
  for (const BenchmarkResult& r : rs) {
    assert_always(r.has_speedup && r.speedup_ratio > 1.0, "workloads: CFU variant not faster");
  }
  assert_always(cpu.charged() > 0, "workloads: no CPU cycles charged");
  print_report_table(cout, rs);

  ExampleWorkloads odd(cfu, cpu, 5);
  assert_always(odd.length() == 8, "workloads: 5 not rounded up to 8");
  assert_always(throws<ConfigurationError>([&] { ExampleWorkloads none(cfu, cpu, 0); }), "workloads: empty length accepted");

  // a CFU with a wrong mulhi must fail verification against the CPU requantizer
  FunctionRouter broken(kNumExampleFunctions);
  broken.register_function(FN_IDENTITY,  "identity",  fn_identity);
  broken.register_function(FN_ADD,       "add",       fn_add);
  broken.register_function(FN_SIMD_MAC4, "simd_mac4", fn_simd_mac4, LatencyModel::fixed(2));
  broken.register_function(FN_POPCOUNT,  "popcount",  fn_popcount_xor, LatencyModel::data_dependent(popcount_latency));
  broken.register_function(FN_MULHI,     "mulhi_off_by_one", [](Word a, Word b) { return fn_mulhi(a, b) + 1u; },
                           LatencyModel::fixed(3));
  broken.seal();
  SimClock bclk;
  SimCfu bport(broken, bclk);
  CfuDispatcher bcfu(bport);
  CpuModel bcpu(bclk);
  ExampleWorkloads bad(bcfu, bcpu, static_cast<uint32_t>(n));
  bad.requant_baseline();
  bad.requant_accelerated();
  bad.dot_baseline();
  bad.dot_accelerated();
  bad.hamming_baseline();
  bad.hamming_accelerated();
  assert_always(!bad.verify(), "workloads: wrong mulhi CFU passed verification");

  // the CPU requantizer agrees with the reference on rounding ties and both signs
  const Word half = 1u << 30;
  assert_always(fn_mulhi(half, 3u) == 2u, "workloads: reference tie rounds up");
  assert_always(fn_mulhi(static_cast<Word>(-static_cast<int32_t>(half)), 3u) == static_cast<Word>(-1),
                "workloads: reference negative tie rounds up");
  return true;
}

bool run_suite(const std::string& s) {
  if (s == "counter_zero")     return counter_zero();
  if (s == "counter_wrap")     return counter_wrap();
  if (s == "region_nested")    return region_nested();
  if (s == "region_history")   return region_history();
  if (s == "region_mismatch")  return region_mismatch();
  if (s == "region_unwind")    return region_unwind();
  if (s == "bench_speedup")    return bench_speedup();
  if (s == "bench_reps")       return bench_reps();
  if (s == "bench_unbalanced") return bench_unbalanced();
  if (s == "report_csv")       return report_csv();
  if (s == "perf_bank")        return perf_bank();
  if (s == "workloads")        return workloads(length);
  return false;
}

} // namespace

int main(int argc, char* argv[]) {
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);

  const std::string S = std::string(suite);
  assert_always(length >= 1, "-length must be >= 1");
  cout << "Suite: " << S << endl;
  if (S == "all") {
    static const char* const names[] = {
      "counter_zero", "counter_wrap", "region_nested", "region_history", "region_mismatch", "region_unwind",
      "bench_speedup", "bench_reps", "bench_unbalanced", "report_csv", "perf_bank", "workloads",
    };
    for (const char* name : names) {
      assert_always(run_suite(name), "failed suite");
      cout << "PASS " << name << endl;
    }
    return 0;
  }
  assert_always(run_suite(S), "unknown or failed -suite");
  cout << "PASS " << S << endl;
  return 0;
}
