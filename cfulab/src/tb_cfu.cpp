// **********************************************************************
// cfulab/src/tb_cfu.cpp
// **********************************************************************
/*
CFU protocol testbench with a single-switch suite.

to build and run one suite:
cfulab % cmake --build build --target tb_cfu -j
cfulab/build % ./tb_cfu -suite=proto_latency
cfulab/build % ./tb_cfu -suite=all      # every software suite (hw_* need their own process)
*/
#if 0
// **********************************************************************
// High-level Flow (Guideposts)
// **********************************************************************
// Step 1: Parse CLI (-suite, -latency, -watchdog, -trace).
// Step 2: Resolve suite name(s).
// Step 3: Software suites build their own router + SimClock + SimCfu + dispatcher.
// Step 4: hw_* suites build CfuUnit + CycleCounterUnit, hook the clock, Sim::init().
// Step 5: Each suite checks with assert_always (never compiled out, aborts on failure).
// **********************************************************************
#endif
#include <descore/Parameter.hpp>
#include "CfuDispatcher.hpp"
#include "CfuFunctions.hpp"
#include "CfuInstruction.hpp"
#include "CfuUnit.hpp"
#include "CycleCounterUnit.hpp"
#include "FunctionRouter.hpp"
#include "SimCfu.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace std;
using namespace cfulab;

// **************
// Parameters (CLI flags): name, default value, help text
// **************
StringParameter(suite,   "all", "Suite: all|proto_latency|proto_busy|proto_order|proto_watchdog|proto_determinism|"
                                "proto_stats|cfg_router|isa_custom0|timing_functional|hw_parity|hw_reset");
IntParameter(latency,    4,     "Identity latency used by proto_latency (cycles)");
IntParameter(watchdog,   5,     "Watchdog bound used by proto_watchdog (cycles)");
BoolParameter(showcontexts, false, "List component instance names (contexts) and exit");

namespace {

/* true if fn() throws E; any other exception escapes and fails the run */
template <typename E, typename Fn>
bool throws(Fn fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

Word echo_a(Word a, Word) { return a; }
Word add_ab(Word a, Word b) { return a + b; }

/* identity at `lat`, add at 3, a function that never finishes, add at `bound` */
void build_protocol_router(FunctionRouter& r, uint32_t lat, uint32_t bound) {
  r.register_function(0, "identity", echo_a, LatencyModel::fixed(lat));
  r.register_function(1, "add3",     add_ab, LatencyModel::fixed(3));
  r.register_function(2, "hang",     echo_a, LatencyModel::never());
  r.register_function(3, "add_slow", add_ab, LatencyModel::fixed(bound));
  r.seal();
}

struct Operands { Word a, b; };

const vector<Operands>& sample_operands() {
  static const vector<Operands> ops = {
    {0u, 0u},
    {42u, 7u},
    {0xffffffffu, 1u},
    {0x80000000u, 0x80000000u},
    {0x01020304u, 0xffffffffu},
    {0x12345678u, 0x0f0f0f0fu},
  };
  return ops;
}

// ---- software suites ----

bool proto_latency(int lat) {
  FunctionRouter router(4);
  build_protocol_router(router, static_cast<uint32_t>(lat), 8);
  SimClock clk;
  SimCfu port(router, clk);
  CfuDispatcher cfu(port);

  cfu.issue(0, 42, 0);
  assert_always(cfu.status() == CfuStatus::Issued, "latency: expected Issued right after issue");
  assert_always(clk.ticks() == 0, "latency: issue must not advance the clock");
  for (int i = 1; i < lat; ++i) {
    cfu.step();
    assert_always(!cfu.is_done(), "latency: done too early");
    assert_always(cfu.status() == CfuStatus::Busy, "latency: expected Busy");
  }
  cfu.step();
  assert_always(cfu.is_done(), "latency: not done after exactly L cycles");
  assert_always(cfu.invocation().has_result && cfu.invocation().result == 42u, "latency: result not held at Done");
  assert_always(cfu.read_result() == 42u, "latency: identity(42) != 42");
  assert_always(cfu.idle(), "latency: expected Idle after read_result");
  assert_always(cfu.last_call_cycles() == static_cast<uint64_t>(lat), "latency: cycle count != L");
  assert_always(clk.ticks() == static_cast<uint64_t>(lat), "latency: clock ticks != L");
  cout << "proto_latency: identity(42) ready after " << lat << " cycles" << endl;
  return true;
}

bool proto_busy() {
  FunctionRouter router(4);
  build_protocol_router(router, 1, 8);
  SimClock clk;
  SimCfu port(router, clk);
  CfuDispatcher cfu(port);

  cfu.issue(1, 2, 3);
  cfu.step();
  assert_always(cfu.status() == CfuStatus::Busy, "busy: expected Busy after one cycle");
  assert_always(throws<ProtocolViolation>([&] { cfu.issue(0, 99, 0); }), "busy: second issue accepted");
  assert_always(cfu.status() == CfuStatus::Busy, "busy: rejected issue changed status");
  assert_always(cfu.invocation().request.function_id == 1, "busy: rejected issue replaced the request");
  assert_always(cfu.cycles_elapsed() == 1, "busy: rejected issue touched the cycle count");

  // Done but unread is still not Idle
  cfu.step();
  cfu.step();
  assert_always(cfu.is_done(), "busy: add3 not done after 3 cycles");
  assert_always(throws<ProtocolViolation>([&] { cfu.issue(0, 1, 0); }), "busy: issue accepted while Done");
  assert_always(cfu.read_result() == 5u, "busy: add3(2,3) != 5");
  assert_always(cfu.call(0, 9, 0) == 9u, "busy: follow-up call failed");
  return true;
}

bool proto_order() {
  FunctionRouter router(4);
  build_protocol_router(router, 2, 8);
  SimClock clk;
  SimCfu port(router, clk);
  CfuDispatcher cfu(port);

  assert_always(throws<ProtocolViolation>([&] { cfu.read_result(); }), "order: read while Idle accepted");
  assert_always(throws<ProtocolViolation>([&] { cfu.step(); }), "order: step while Idle accepted");
  assert_always(clk.ticks() == 0, "order: rejected step advanced the clock");

  cfu.issue(0, 5, 0);
  assert_always(throws<ProtocolViolation>([&] { cfu.read_result(); }), "order: read while Issued accepted");
  cfu.step();
  assert_always(throws<ProtocolViolation>([&] { cfu.read_result(); }), "order: read while Busy accepted");
  cfu.step();
  assert_always(cfu.read_result() == 5u, "order: identity(5) != 5");
  assert_always(throws<ProtocolViolation>([&] { cfu.read_result(); }), "order: second read accepted");

  // unknown ids are rejected before anything is latched
  assert_always(throws<ProtocolViolation>([&] { cfu.issue(4, 0, 0); }), "order: id == F accepted");
  assert_always(throws<ProtocolViolation>([&] { cfu.issue(1000, 0, 0); }), "order: id 1000 accepted");
  assert_always(cfu.idle(), "order: rejected issue left the dispatcher non-Idle");
  assert_always(cfu.call(1, 40, 2) == 42u, "order: call after rejections failed");
  return true;
}

bool proto_watchdog(int bound) {
  FunctionRouter router(4);
  build_protocol_router(router, 1, static_cast<uint32_t>(bound));
  SimClock clk;
  SimCfu port(router, clk);
  DispatcherConfig cfg;
  cfg.watchdog_cycles = static_cast<uint64_t>(bound);
  CfuDispatcher cfu(port, cfg);

  // latency equal to the bound still completes
  assert_always(cfu.call(3, 20, 22) == 42u, "watchdog: latency == bound did not complete");
  assert_always(cfu.last_call_cycles() == static_cast<uint64_t>(bound), "watchdog: latency == bound cycle count");

  cfu.issue(2, 1, 2);
  for (int i = 1; i < bound; ++i) {
    cfu.step(); // must not throw before the bound
  }
  uint64_t reported = 0;
  bool fired = false;
  try {
    cfu.step();
  } catch (const WatchdogTimeout& e) {
    fired = true;
    reported = e.cycles();
    assert_always(e.function_id() == 2, "watchdog: wrong function id in timeout");
  }
  assert_always(fired, "watchdog: no timeout at the bound");
  assert_always(reported == static_cast<uint64_t>(bound), "watchdog: fired at the wrong cycle");
  assert_always(cfu.status() == CfuStatus::Faulted, "watchdog: expected Faulted");
  assert_always(throws<ProtocolViolation>([&] { cfu.issue(0, 1, 0); }), "watchdog: issue accepted while Faulted");
  assert_always(throws<ProtocolViolation>([&] { cfu.step(); }), "watchdog: step accepted while Faulted");
  assert_always(throws<ProtocolViolation>([&] { cfu.read_result(); }), "watchdog: read accepted while Faulted");

  cfu.reset();
  assert_always(cfu.idle(), "watchdog: reset did not return to Idle");
  assert_always(cfu.call(0, 7, 0) == 7u, "watchdog: call after reset failed");

  // blocking form propagates the timeout
  assert_always(throws<WatchdogTimeout>([&] { cfu.call(2, 0, 0); }), "watchdog: blocking call did not time out");
  cfu.reset();

  assert_always(throws<ConfigurationError>([&] {
    DispatcherConfig zero;
    zero.watchdog_cycles = 0;
    CfuDispatcher bad(port, zero);
  }), "watchdog: zero bound accepted");
  cout << "proto_watchdog: timeout after " << reported << " cycles" << endl;
  return true;
}

bool proto_determinism() {
  FunctionRouter router(kNumExampleFunctions);
  register_example_functions(router);
  SimClock clk;
  SimCfu port(router, clk);
  CfuDispatcher cfu(port);

  for (uint32_t fn = 0; fn < kNumExampleFunctions; ++fn) {
    const CfuCompute& ref = router.route(fn).compute;
    for (const Operands& op : sample_operands()) {
      const Word r1 = cfu.call(fn, op.a, op.b);
      const uint64_t c1 = cfu.last_call_cycles();
      const Word r2 = cfu.call(fn, op.a, op.b);
      const uint64_t c2 = cfu.last_call_cycles();
      assert_always(r1 == r2, "determinism: result changed between identical calls");
      assert_always(c1 == c2, "determinism: latency changed between identical calls");
      assert_always(r1 == ref(op.a, op.b), "determinism: CFU result differs from its reference");
    }
  }

  // known values for the example set
  assert_always(cfu.call(FN_ADD, 0xffffffffu, 1u) == 0u, "determinism: add does not wrap");
  assert_always(cfu.call(FN_SIMD_MAC4, pack_int8x4(1, 2, 3, 4), pack_int8x4(-1, -1, -1, -1)) == static_cast<Word>(-10),
                "determinism: simd_mac4 lanes");
  assert_always(cfu.call(FN_SIMD_MAC4, pack_int8x4(-128, -128, -128, -128), pack_int8x4(-128, -128, -128, -128))
                == 65536u, "determinism: simd_mac4 int8 extremes");
  assert_always(cfu.call(FN_POPCOUNT, 0x000000ffu, 0u) == 8u, "determinism: popcount(0xff)");
  assert_always(cfu.last_call_cycles() == 2, "determinism: popcount latency, one nonzero byte");
  assert_always(cfu.call(FN_POPCOUNT, 0xffffffffu, 0u) == 32u, "determinism: popcount(~0)");
  assert_always(cfu.last_call_cycles() == 5, "determinism: popcount latency, four nonzero bytes");
  assert_always(cfu.call(FN_POPCOUNT, 5u, 5u) == 0u, "determinism: popcount(a ^ a)");
  assert_always(cfu.last_call_cycles() == 1, "determinism: popcount latency floor");
  assert_always(cfu.call(FN_MULHI, 0x80000000u, 0x80000000u) == 0x7fffffffu, "determinism: mulhi saturation");
  assert_always(cfu.call(FN_MULHI, 1u << 30, 1u << 30) == (1u << 29), "determinism: mulhi 0.5 * 0.5");
  assert_always(cfu.last_call_cycles() == 3, "determinism: mulhi latency");
  return true;
}

bool proto_stats() {
  FunctionRouter router(kNumExampleFunctions);
  register_example_functions(router);
  SimClock clk;
  SimCfu port(router, clk);
  CfuDispatcher cfu(port);

  cfu.call(FN_POPCOUNT, 0u, 0u);          // 1 cycle
  cfu.call(FN_POPCOUNT, 0xffffffffu, 0u); // 5 cycles
  cfu.call(FN_POPCOUNT, 0x00ff00ffu, 0u); // 3 cycles
  cfu.call(FN_ADD, 1u, 2u);

  const CfuCallStats& pc = cfu.stats(FN_POPCOUNT);
  assert_always(pc.calls == 3, "stats: popcount call count");
  assert_always(pc.total_cycles == 9, "stats: popcount total cycles");
  assert_always(pc.min_cycles == 1 && pc.max_cycles == 5, "stats: popcount min/max");
  assert_always(cfu.stats(FN_ADD).calls == 1, "stats: add call count");
  assert_always(cfu.stats(FN_MULHI).calls == 0, "stats: unused function counted");
  assert_always(clk.ticks() == 10, "stats: clock ticks != sum of call cycles");
  assert_always(throws<ProtocolViolation>([&] { cfu.stats(kNumExampleFunctions); }), "stats: bad id accepted");

  cfu.clear_stats();
  assert_always(cfu.stats(FN_POPCOUNT).calls == 0, "stats: clear_stats");
  return true;
}

bool cfg_router() {
  assert_always(throws<ConfigurationError>([] { FunctionRouter r(0); }), "router: F = 0 accepted");
  assert_always(throws<ConfigurationError>([] { FunctionRouter r(kMaxFunctions + 1); }), "router: F = 1025 accepted");
  FunctionRouter wide(kMaxFunctions);
  assert_always(wide.function_count() == kMaxFunctions, "router: F = 1024 rejected");

  FunctionRouter r(3);
  r.register_function(0, "a", echo_a);
  assert_always(throws<ConfigurationError>([&] { r.register_function(0, "again", echo_a); }), "router: duplicate id");
  assert_always(throws<ConfigurationError>([&] { r.register_function(3, "oob", echo_a); }), "router: id == F");
  assert_always(throws<ConfigurationError>([&] { r.register_function(1, "empty", CfuCompute()); }), "router: no callable");
  assert_always(throws<ConfigurationError>([] { LatencyModel::fixed(0); }), "router: zero latency");
  assert_always(throws<ConfigurationError>([] { LatencyModel::data_dependent(CfuLatencyFn()); }), "router: empty latency fn");

  // a hole in the table fails at seal(), not at the first call
  assert_always(throws<ConfigurationError>([&] { r.seal(); }), "router: sealed with ids 1, 2 missing");
  assert_always(!r.sealed(), "router: failed seal left the router sealed");
  SimClock clk;
  assert_always(throws<ConfigurationError>([&] { SimCfu early(r, clk); }), "router: backend accepted an unsealed router");

  r.register_function(1, "b", add_ab, LatencyModel::fixed(2));
  r.register_function(2, "c", add_ab, LatencyModel::data_dependent([](Word, Word) { return 0u; }));
  r.seal();
  assert_always(r.sealed(), "router: seal failed with every id present");
  assert_always(throws<ConfigurationError>([&] { r.register_function(2, "late", echo_a); }), "router: register after seal");
  assert_always(throws<ProtocolViolation>([&] { r.route(3); }), "router: route(F) accepted");
  assert_always(r.name(1) == "b", "router: name lookup");
  assert_always(r.route(2).latency.cycles_for(0, 0) == 1, "router: data-dependent latency below 1 not clamped");

  SimCfu port(r, clk);
  CfuDispatcher cfu(port);
  assert_always(cfu.call(2, 4, 5) == 9u, "router: call through a data-dependent slot");
  assert_always(cfu.last_call_cycles() == 1, "router: clamped latency");
  return true;
}

bool isa_custom0() {
  const uint32_t raw = CfuInstruction::encode(FN_MULHI, 10, 11, 12);
  const CfuInstruction d(raw);
  assert_always(d.is_cfu(), "isa: encoded word is not CUSTOM-0");
  assert_always(d.opcode == CfuInstruction::OPCODE_CUSTOM0, "isa: opcode");
  assert_always(d.rd == 10 && d.rs1 == 11 && d.rs2 == 12, "isa: register fields");
  assert_always(d.funct3 == 4 && d.funct7 == 0, "isa: funct fields");
  assert_always(d.function_id() == FN_MULHI, "isa: function id");

  const CfuInstruction top(CfuInstruction::encode(kMaxFunctions - 1, 0, 0, 0));
  assert_always(top.funct7 == 0x7f && top.funct3 == 0x7, "isa: highest selector");
  assert_always(top.function_id() == kMaxFunctions - 1, "isa: highest function id");
  assert_always(throws<ProtocolViolation>([] { CfuInstruction::encode(kMaxFunctions, 0, 0, 0); }), "isa: id 1024 encoded");
  assert_always(throws<ProtocolViolation>([] { CfuInstruction::encode(0, 32, 0, 0); }), "isa: rd 32 encoded");

  FunctionRouter router(kNumExampleFunctions);
  register_example_functions(router);
  SimClock clk;
  SimCfu port(router, clk);
  CfuDispatcher cfu(port);

  cfu.issue_instruction(CfuInstruction::encode(FN_ADD, 5, 6, 7), 7, 8);
  while (!cfu.is_done()) cfu.step();
  assert_always(cfu.read_result() == 15u, "isa: add via CUSTOM-0 word");

  const uint32_t add_x5_x6_x7 = 0x007302b3u; // add x5, x6, x7 (OP, not CUSTOM-0)
  assert_always(throws<ProtocolViolation>([&] { cfu.issue_instruction(add_x5_x6_x7, 1, 2); }), "isa: OP word accepted");
  assert_always(cfu.idle(), "isa: rejected word left the dispatcher non-Idle");
  // selector decodes fine but names a function the router does not have
  assert_always(throws<ProtocolViolation>([&] {
    cfu.issue_instruction(CfuInstruction::encode(8, 1, 2, 3), 0, 0);
  }), "isa: selector >= F accepted");
  return true;
}

bool timing_functional() {
  ExampleLatencies slow;
  slow.mac   = 9;
  slow.mulhi = 17;
  FunctionRouter router(kNumExampleFunctions);
  register_example_functions(router, slow);

  SimClock modeled_clk, functional_clk;
  SimCfu modeled(router, modeled_clk, SimCfu::Timing::Modeled);
  SimCfu functional(router, functional_clk, SimCfu::Timing::Functional);
  CfuDispatcher m(modeled), f(functional);
  assert_always(std::string(functional.backend_name()) == "functional", "functional: backend name");

  uint64_t calls = 0;
  for (uint32_t fn = 0; fn < kNumExampleFunctions; ++fn) {
    for (const Operands& op : sample_operands()) {
      assert_always(m.call(fn, op.a, op.b) == f.call(fn, op.a, op.b), "functional: result differs from modeled");
      assert_always(f.last_call_cycles() == 1, "functional: call took more than one cycle");
      ++calls;
    }
  }
  assert_always(functional_clk.ticks() == calls, "functional: clock ticks != calls");
  assert_always(modeled_clk.ticks() > functional_clk.ticks(), "functional: modeled timing not slower");

  // functional timing ignores latency models entirely, a never-completing slot included
  FunctionRouter hang(3);
  hang.register_function(0, "identity", echo_a, LatencyModel::fixed(6));
  hang.register_function(1, "add", add_ab);
  hang.register_function(2, "hang", echo_a, LatencyModel::never());
  hang.seal();
  SimClock hc;
  SimCfu hport(hang, hc, SimCfu::Timing::Functional);
  CfuDispatcher h(hport);
  assert_always(h.call(2, 77, 0) == 77u, "functional: never() slot did not complete");
  return true;
}

bool run_software_suite(const std::string& s) {
  if (s == "proto_latency")     return proto_latency(latency);
  if (s == "proto_busy")        return proto_busy();
  if (s == "proto_order")       return proto_order();
  if (s == "proto_watchdog")    return proto_watchdog(watchdog);
  if (s == "proto_determinism") return proto_determinism();
  if (s == "proto_stats")       return proto_stats();
  if (s == "cfg_router")        return cfg_router();
  if (s == "isa_custom0")       return isa_custom0();
  if (s == "timing_functional") return timing_functional();
  return false;
}

const vector<std::string>& software_suites() {
  static const vector<std::string> names = {
    "proto_latency", "proto_busy", "proto_order", "proto_watchdog", "proto_determinism",
    "proto_stats", "cfg_router", "isa_custom0", "timing_functional",
  };
  return names;
}

} // namespace

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  // **************
  // Step 2: Resolve suite
  // **************
  const std::string S = std::string(suite);
  const bool is_hw = S.rfind("hw_", 0) == 0;
  assert_always(latency >= 1 && watchdog >= 2, "-latency must be >= 1 and -watchdog >= 2");
  cout << "Suite: " << S << endl;

  if (!is_hw) {
    // **************
    // Step 3: Software backends (no simulator needed)
    // **************
    if (S == "all") {
      for (const std::string& name : software_suites()) {
        assert_always(run_software_suite(name), "failed suite");
        cout << "PASS " << name << endl;
      }
      return 0;
    }
    assert_always(run_software_suite(S), "unknown or failed -suite");
    cout << "PASS " << S << endl;
    return 0;
  }

  // **************
  // Step 4: Cascade backend: components, clock, Sim::init()
  // **************
  FunctionRouter router(kNumExampleFunctions);
  register_example_functions(router);
  CfuUnit unit("cfu", router);
  CycleCounterUnit mcycle("mcycle", 64, 0);
  HwClockDomain hw_clock(mcycle);

  if (showcontexts) { Sim::dumpComponentNames(); return 0; }

  Clock clk;
  unit.clk << clk;
  mcycle.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  CfuDispatcher hw(unit);
  assert_always(std::string(unit.backend_name()) == "hw", "hw: backend name");

  if (S == "hw_parity") {
    // **************
    // Step 5a: same calls on the Cascade unit and on the software model
    // **************
    SimClock sw_clock;
    SimCfu sw_port(router, sw_clock);
    CfuDispatcher sw(sw_port);

    const CycleSnapshot start = mcycle.now();
    uint64_t expected_cycles = 0;
    for (uint32_t fn = 0; fn < kNumExampleFunctions; ++fn) {
      for (const Operands& op : sample_operands()) {
        const Word hr = hw.call(fn, op.a, op.b);
        const Word sr = sw.call(fn, op.a, op.b);
        assert_always(hr == sr, "hw_parity: result differs from the software model");
        assert_always(hw.last_call_cycles() == sw.last_call_cycles(), "hw_parity: latency differs");
        expected_cycles += hw.last_call_cycles();
      }
    }
    assert_always(mcycle.elapsed(start, mcycle.now()) == expected_cycles, "hw_parity: mcycle != call cycles");
    assert_always(unit.busy_cycles() == expected_cycles, "hw_parity: busy edges != call cycles");

    // the counter keeps running with the CFU idle
    const CycleSnapshot idle_start = mcycle.now();
    hw_clock.run(25);
    assert_always(mcycle.elapsed(idle_start, mcycle.now()) == 25, "hw_parity: idle clock");
    assert_always(unit.busy_cycles() == expected_cycles, "hw_parity: idle edges counted as busy");
  } else if (S == "hw_reset") {
    // **************
    // Step 5b: abandon an in-flight call, then keep going
    // **************
    hw.issue(FN_MULHI, 1u << 30, 1u << 30);
    hw.step();
    assert_always(hw.status() == CfuStatus::Busy, "hw_reset: expected Busy");
    hw.reset();
    assert_always(hw.idle(), "hw_reset: reset did not return to Idle");
    assert_always(!unit.is_done(), "hw_reset: unit still holds a result");
    assert_always(hw.call(FN_ADD, 40, 2) == 42u, "hw_reset: call after reset");
    assert_always(hw.last_call_cycles() == 1, "hw_reset: add latency");
    assert_always(throws<ProtocolViolation>([&] { unit.read_result(); }), "hw_reset: unit read with nothing issued");
  } else {
    assert_always(false, "unknown -suite (hw_*)");
  }
  cout << "PASS " << S << endl;
  return 0;
}
