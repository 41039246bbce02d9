// **********************************************************************
// cfulab/src/CfuFunctions.cpp
// **********************************************************************

#include "CfuFunctions.hpp"

#include <limits>

namespace cfulab {

namespace {

inline int8_t lane(Word w, unsigned i) {
  return static_cast<int8_t>((w >> (8u * i)) & 0xffu);
}

} // namespace

Word fn_identity(Word a, Word /*b*/) {
  return a;
}

Word fn_add(Word a, Word b) {
  return a + b;
}

Word fn_simd_mac4(Word a, Word b) {
  int32_t acc = 0;
  for (unsigned i = 0; i < 4; ++i) {
    acc += static_cast<int32_t>(lane(a, i)) * static_cast<int32_t>(lane(b, i));
  }
  return static_cast<Word>(acc);
}

Word fn_popcount_xor(Word a, Word b) {
  Word x = a ^ b;
  Word n = 0;
  while (x) {
    x &= x - 1u;
    ++n;
  }
  return n;
}

// gemmlowp SaturatingRoundingDoublingHighMul
Word fn_mulhi(Word a, Word b) {
  const int32_t sa = static_cast<int32_t>(a);
  const int32_t sb = static_cast<int32_t>(b);
  if (sa == sb && sa == std::numeric_limits<int32_t>::min()) {
    return static_cast<Word>(std::numeric_limits<int32_t>::max());
  }
  const int64_t ab    = static_cast<int64_t>(sa) * static_cast<int64_t>(sb);
  const int64_t nudge = ab >= 0 ? (1ll << 30) : (1ll - (1ll << 30));
  return static_cast<Word>(static_cast<int32_t>((ab + nudge) / (1ll << 31)));
}

uint32_t popcount_latency(Word a, Word b) {
  const Word x = a ^ b;
  uint32_t cycles = 1;
  for (unsigned i = 0; i < 4; ++i) {
    if ((x >> (8u * i)) & 0xffu) ++cycles;
  }
  return cycles;
}

void register_example_functions(FunctionRouter& router, const ExampleLatencies& lat) {
  router.register_function(FN_IDENTITY,  "identity",  fn_identity,     LatencyModel::fixed(lat.identity));
  router.register_function(FN_ADD,       "add",       fn_add,          LatencyModel::fixed(lat.add));
  router.register_function(FN_SIMD_MAC4, "simd_mac4", fn_simd_mac4,    LatencyModel::fixed(lat.mac));
  router.register_function(FN_POPCOUNT,  "popcount",  fn_popcount_xor, LatencyModel::data_dependent(popcount_latency));
  router.register_function(FN_MULHI,     "mulhi",     fn_mulhi,        LatencyModel::fixed(lat.mulhi));
  router.seal();
}

Word pack_int8x4(int8_t l0, int8_t l1, int8_t l2, int8_t l3) {
  return  (static_cast<Word>(static_cast<uint8_t>(l0)))
       | (static_cast<Word>(static_cast<uint8_t>(l1)) <<  8)
       | (static_cast<Word>(static_cast<uint8_t>(l2)) << 16)
       | (static_cast<Word>(static_cast<uint8_t>(l3)) << 24);
}

} // namespace cfulab
