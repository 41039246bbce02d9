// **********************************************************************
// cfulab/include/CfuFunctions.hpp
// **********************************************************************
/*
Example CFU function set used by the benchmark CLI and testbenches.  Each
function is a pure (a, b) -> word transform; the same functions double as the
software reference the accelerated results are checked against.

  id  name        result                                        latency
  0   identity    a                                             1
  1   add         a + b                                         1
  2   simd_mac4   sum of 4 signed int8 lane products of a, b   mac (2)
  3   popcount    set bits in a ^ b (bit-serial, byte/cycle)   1 + nonzero bytes
  4   mulhi       rounding doubling high mul (q31 requant)     mulhi (3)
*/
#pragma once

#include "CfuTypes.hpp"
#include "FunctionRouter.hpp"

#include <cstdint>

namespace cfulab {

enum ExampleFunction : uint32_t {
  FN_IDENTITY  = 0,
  FN_ADD       = 1,
  FN_SIMD_MAC4 = 2,
  FN_POPCOUNT  = 3,
  FN_MULHI     = 4,
  kNumExampleFunctions = 5,
};

struct ExampleLatencies {
  uint32_t identity = 1;
  uint32_t add      = 1;
  uint32_t mac      = 2;
  uint32_t mulhi    = 3;
};

Word fn_identity(Word a, Word b);
Word fn_add(Word a, Word b);
Word fn_simd_mac4(Word a, Word b);
Word fn_popcount_xor(Word a, Word b);
Word fn_mulhi(Word a, Word b);

uint32_t popcount_latency(Word a, Word b);

// Registers ids [0, kNumExampleFunctions) and seals the router.
void register_example_functions(FunctionRouter& router,
                                const ExampleLatencies& lat = ExampleLatencies());

// Pack four int8 lanes (lane 0 in the low byte).
Word pack_int8x4(int8_t l0, int8_t l1, int8_t l2, int8_t l3);

} // namespace cfulab
