// **********************************************************************
// cfulab/src/Workloads.cpp
// **********************************************************************

#include "Workloads.hpp"
#include "CfuFunctions.hpp"

#include <limits>
#include <random>

namespace cfulab {

CpuModel::CpuModel(ClockDomain& clock, CpuCosts costs) : clock_(clock), costs_(costs) {
}

void CpuModel::spend(uint64_t cycles) {
  clock_.run(cycles);
  charged_ += cycles;
}

ExampleWorkloads::ExampleWorkloads(CfuDispatcher& cfu, CpuModel& cpu, uint32_t length, uint32_t seed)
  : cfu_(cfu), cpu_(cpu), length_((length + 3u) & ~3u) {
  if (length_ == 0) {
    throw ConfigurationError("workload length must be at least 1");
  }
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> i8(-128, 127);
  std::uniform_int_distribution<uint32_t> u32;
  std::uniform_int_distribution<int32_t> acc(-(1 << 20), 1 << 20);

  x_.resize(length_);
  w_.resize(length_);
  bits_a_.resize(length_);
  bits_b_.resize(length_);
  acc_.resize(length_);
  for (uint32_t i = 0; i < length_; ++i) {
    x_[i]      = static_cast<int8_t>(i8(rng));
    w_[i]      = static_cast<int8_t>(i8(rng));
    bits_a_[i] = u32(rng);
    bits_b_[i] = u32(rng);
    acc_[i]    = acc(rng);
  }
  multiplier_ = 1518500250; // ~0.7071 in q31
}

Word ExampleWorkloads::cfu_call(unsigned perf_idx, uint32_t function_id, Word a, Word b) {
  if (!perf_) return cfu_.call(function_id, a, b);
  perf_->enable(perf_idx);
  const Word result = cfu_.call(function_id, a, b);
  perf_->disable(perf_idx);
  return result;
}

// ---- int8 dot product ----

void ExampleWorkloads::dot_baseline() {
  int32_t sum = 0;
  for (uint32_t i = 0; i < length_; ++i) {
    cpu_.load(2);                                   // lb x[i], lb w[i]
    sum += static_cast<int32_t>(x_[i]) * static_cast<int32_t>(w_[i]);
    cpu_.mul();
    cpu_.alu(2);                                    // add, addi
    cpu_.branch();
  }
  dot_base_ = sum;
}

void ExampleWorkloads::dot_accelerated() {
  int32_t sum = 0;
  for (uint32_t i = 0; i < length_; i += 4) {
    cpu_.load(2);                                   // lw 4 lanes of x, lw 4 lanes of w
    const Word xa = pack_int8x4(x_[i], x_[i + 1], x_[i + 2], x_[i + 3]);
    const Word wb = pack_int8x4(w_[i], w_[i + 1], w_[i + 2], w_[i + 3]);
    sum += static_cast<int32_t>(cfu_call(PERF_DOT, FN_SIMD_MAC4, xa, wb));
    cpu_.alu(2);
    cpu_.branch();
  }
  dot_accel_ = sum;
}

// ---- binary hamming distance (BNN style) ----

void ExampleWorkloads::hamming_baseline() {
  uint32_t total = 0;
  for (uint32_t i = 0; i < length_; ++i) {
    cpu_.load(2);
    Word x = bits_a_[i] ^ bits_b_[i];
    x = x - ((x >> 1) & 0x55555555u);               // SWAR popcount
    x = (x & 0x33333333u) + ((x >> 2) & 0x33333333u);
    x = (x + (x >> 4)) & 0x0f0f0f0fu;
    total += (x * 0x01010101u) >> 24;
    cpu_.alu(12);
    cpu_.mul();
    cpu_.alu(2);
    cpu_.branch();
  }
  ham_base_ = total;
}

void ExampleWorkloads::hamming_accelerated() {
  uint32_t total = 0;
  for (uint32_t i = 0; i < length_; ++i) {
    cpu_.load(2);
    total += cfu_call(PERF_HAMMING, FN_POPCOUNT, bits_a_[i], bits_b_[i]);
    cpu_.alu(2);
    cpu_.branch();
  }
  ham_accel_ = total;
}

// ---- q31 requantization ----

void ExampleWorkloads::requant_baseline() {
  rq_base_.assign(length_, 0);
  for (uint32_t i = 0; i < length_; ++i) {
    cpu_.load();
    const int32_t a = acc_[i];
    int32_t out = std::numeric_limits<int32_t>::max();
    if (a != std::numeric_limits<int32_t>::min() || multiplier_ != std::numeric_limits<int32_t>::min()) {
      // mul/mulh pair, take bits [62:31] of the magnitude, round half up
      const int64_t  prod = static_cast<int64_t>(a) * multiplier_;
      const bool     neg  = prod < 0;
      const uint64_t mag  = neg ? static_cast<uint64_t>(-prod) : static_cast<uint64_t>(prod);
      const uint64_t high = (mag + (1ull << 30) - (neg ? 1u : 0u)) >> 31;
      out = neg ? -static_cast<int32_t>(high) : static_cast<int32_t>(high);
    }
    rq_base_[i] = out;
    cpu_.mul(2);                                    // mul + mulh
    cpu_.alu(8);                                    // nudge, carry, shift, saturate
    cpu_.store();
    cpu_.alu();
    cpu_.branch();
  }
}

void ExampleWorkloads::requant_accelerated() {
  rq_accel_.assign(length_, 0);
  for (uint32_t i = 0; i < length_; ++i) {
    cpu_.load();
    rq_accel_[i] = static_cast<int32_t>(cfu_call(PERF_REQUANT, FN_MULHI, static_cast<Word>(acc_[i]),
                                                 static_cast<Word>(multiplier_)));
    cpu_.store();
    cpu_.alu();
    cpu_.branch();
  }
}

std::vector<BenchmarkCase> ExampleWorkloads::cases() {
  std::vector<BenchmarkCase> out;
  BenchmarkCase dot;
  dot.name        = "dot_product_int8";
  dot.baseline    = [this]() { dot_baseline(); };
  dot.accelerated = [this]() { dot_accelerated(); };
  out.push_back(dot);

  BenchmarkCase ham;
  ham.name        = "hamming_distance";
  ham.baseline    = [this]() { hamming_baseline(); };
  ham.accelerated = [this]() { hamming_accelerated(); };
  out.push_back(ham);

  BenchmarkCase rq;
  rq.name        = "requantize_q31";
  rq.baseline    = [this]() { requant_baseline(); };
  rq.accelerated = [this]() { requant_accelerated(); };
  out.push_back(rq);
  return out;
}

bool ExampleWorkloads::verify() const {
  return dot_base_ == dot_accel_
      && ham_base_ == ham_accel_
      && rq_base_ == rq_accel_;
}

} // namespace cfulab
