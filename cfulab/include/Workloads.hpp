// **********************************************************************
// cfulab/include/Workloads.hpp
// **********************************************************************
/*
Example co-design workloads: small ML kernels written twice, once as plain
CPU code and once leaning on the example CFU functions.

The CPU side is charged on the clock domain through CpuModel, which bills a
fixed number of cycles per instruction class of a small in-order RV32IM core.
CFU calls go through the dispatcher, so they cost whatever the backend's
timing says.  Both variants of a case read the same input buffers and write
their own output, which verify() compares afterwards.
*/
#pragma once

#include "BenchmarkHarness.hpp"
#include "CfuDispatcher.hpp"
#include "CycleCounter.hpp"
#include "PerfCounterBank.hpp"

#include <cstdint>
#include <vector>

namespace cfulab {

struct CpuCosts {
  uint32_t alu    = 1;
  uint32_t mul    = 4;
  uint32_t load   = 2;
  uint32_t store  = 1;
  uint32_t branch = 2;
};

class CpuModel {
public:
  explicit CpuModel(ClockDomain& clock, CpuCosts costs = CpuCosts());

  void alu(uint32_t n = 1)    { spend(static_cast<uint64_t>(n) * costs_.alu); }
  void mul(uint32_t n = 1)    { spend(static_cast<uint64_t>(n) * costs_.mul); }
  void load(uint32_t n = 1)   { spend(static_cast<uint64_t>(n) * costs_.load); }
  void store(uint32_t n = 1)  { spend(static_cast<uint64_t>(n) * costs_.store); }
  void branch(uint32_t n = 1) { spend(static_cast<uint64_t>(n) * costs_.branch); }

  uint64_t charged() const { return charged_; }
  const CpuCosts& costs() const { return costs_; }

private:
  void spend(uint64_t cycles);

  ClockDomain& clock_;
  CpuCosts     costs_;
  uint64_t     charged_ = 0;
};

class ExampleWorkloads {
public:
  // length = elements per kernel, rounded up to a multiple of 4
  ExampleWorkloads(CfuDispatcher& cfu, CpuModel& cpu, uint32_t length, uint32_t seed = 1);

  std::vector<BenchmarkCase> cases(); // dot_product_int8, hamming_distance, requantize_q31
  bool verify() const;                // every accelerated output matches its baseline

  uint32_t length() const { return length_; }

  // Counts CFU busy windows per case: PERF[0] dot, PERF[1] hamming, PERF[2] requant.
  void attach_perf(PerfCounterBank* bank) { perf_ = bank; }

  static constexpr unsigned PERF_DOT     = 0;
  static constexpr unsigned PERF_HAMMING = 1;
  static constexpr unsigned PERF_REQUANT = 2;

  // individual kernels (exposed for tests)
  void dot_baseline();
  void dot_accelerated();
  void hamming_baseline();
  void hamming_accelerated();
  void requant_baseline();
  void requant_accelerated();

  int32_t  dot_result_baseline()        const { return dot_base_; }
  int32_t  dot_result_accelerated()     const { return dot_accel_; }
  uint32_t hamming_result_baseline()    const { return ham_base_; }
  uint32_t hamming_result_accelerated() const { return ham_accel_; }

private:
  Word cfu_call(unsigned perf_idx, uint32_t function_id, Word a, Word b);

  CfuDispatcher& cfu_;
  CpuModel&      cpu_;
  uint32_t       length_;
  PerfCounterBank* perf_ = nullptr;

  std::vector<int8_t>  x_, w_;       // int8 activations / weights
  std::vector<Word>    bits_a_, bits_b_;
  std::vector<int32_t> acc_;         // int32 accumulators to requantize
  int32_t              multiplier_ = 0;

  int32_t  dot_base_  = 0, dot_accel_ = 0;
  uint32_t ham_base_  = 0, ham_accel_ = 0;
  std::vector<int32_t> rq_base_, rq_accel_;
};

} // namespace cfulab
