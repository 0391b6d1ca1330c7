#ifndef DEMI_TESTS_HARNESS_TEST_HARNESS_HPP
#define DEMI_TESTS_HARNESS_TEST_HARNESS_HPP

// Generic "this against that" test harness.
//
// testAgainst(Name, Iter, ImplA, ImplB, Cmp)
//   runs ImplA and ImplB on every input yielded by Iter, compares
//   outputs using Cmp, and prints results.
//
// Both ImplA and ImplB are opaque callables:
//   (uint16_t, uint16_t) -> TestOutput<uint16_t>   for pair iterators
//   (uint16_t)           -> TestOutput<uint16_t>   for single iterators
// The harness knows nothing about what library backs them.
//
// This header includes only ops.hpp and the codec. It has no knowledge of
// MPFR, SoftFloat, or the facade.

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>
#include <tuple>
#include <utility>

#include "demi/core/codec.hpp"
#include "harness/ops.hpp"

namespace demi::testing {

using BitsType = uint16_t;
inline constexpr int HexWidth = 4;

// ===================================================================
// Hex printing
// ===================================================================

inline void printHex(FILE *Out, BitsType Val, int Width = HexWidth) {
  for (int I = Width - 1; I >= 0; --I) {
    int Nibble = static_cast<int>((Val >> (I * 4)) & BitsType{0xF});
    std::fputc("0123456789ABCDEF"[Nibble], Out);
  }
}

// ===================================================================
// Failure record
// ===================================================================

struct Failure {
  BitsType InputA;
  BitsType InputB;
  TestOutput<BitsType> OutputA;
  TestOutput<BitsType> OutputB;
};

struct TestResult {
  int Total = 0;
  int Passed = 0;
  int Failed = 0;
};

// ===================================================================
// testAgainst: the harness
// ===================================================================

static constexpr int MaxReportedFailures = 10;

namespace detail {

inline void report(const char *Name, const TestResult &R,
                   const Failure *Failures, int NumReported, bool Unary) {
  std::printf("%s: %d/%d passed", Name, R.Passed, R.Total);
  if (R.Failed > 0) {
    std::printf(" (%d FAILED)", R.Failed);
  }
  std::printf("\n");

  for (int I = 0; I < NumReported; ++I) {
    auto &F = Failures[I];
    std::fprintf(stderr, "  FAIL %s: a=0x", Name);
    printHex(stderr, F.InputA);
    if (!Unary) {
      std::fprintf(stderr, " b=0x");
      printHex(stderr, F.InputB);
    }
    std::fprintf(stderr, "  implA=0x");
    printHex(stderr, F.OutputA.Bits);
    std::fprintf(stderr, " implB=0x");
    printHex(stderr, F.OutputB.Bits);
    std::fprintf(stderr, "\n");
  }
}

} // namespace detail

template <typename IterFn, typename ImplA, typename ImplB,
          typename Comparator>
TestResult testAgainst(const char *Name, IterFn Iter, ImplA A, ImplB B,
                       Comparator Cmp) {
  TestResult R;
  Failure Failures[MaxReportedFailures];
  int NumReported = 0;

  Iter([&](BitsType ABits, BitsType BBits) {
    R.Total++;
    TestOutput<BitsType> OA = A(ABits, BBits);
    TestOutput<BitsType> OB = B(ABits, BBits);
    if (Cmp(OA, OB)) {
      R.Passed++;
    } else {
      R.Failed++;
      if (NumReported < MaxReportedFailures) {
        Failures[NumReported++] = {ABits, BBits, OA, OB};
      }
    }
  });

  detail::report(Name, R, Failures, NumReported, false);
  return R;
}

template <typename IterFn, typename ImplA, typename ImplB,
          typename Comparator>
TestResult testAgainstUnary(const char *Name, IterFn Iter, ImplA A, ImplB B,
                            Comparator Cmp) {
  TestResult R;
  Failure Failures[MaxReportedFailures];
  int NumReported = 0;

  Iter([&](BitsType ABits) {
    R.Total++;
    TestOutput<BitsType> OA = A(ABits);
    TestOutput<BitsType> OB = B(ABits);
    if (Cmp(OA, OB)) {
      R.Passed++;
    } else {
      R.Failed++;
      if (NumReported < MaxReportedFailures) {
        Failures[NumReported++] = {ABits, 0, OA, OB};
      }
    }
  });

  detail::report(Name, R, Failures, NumReported, true);
  return R;
}

// Ternary inputs report only the first two operands on failure.
template <typename IterFn, typename ImplA, typename ImplB,
          typename Comparator>
TestResult testAgainstTernary(const char *Name, IterFn Iter, ImplA A, ImplB B,
                              Comparator Cmp) {
  TestResult R;
  Failure Failures[MaxReportedFailures];
  int NumReported = 0;

  Iter([&](BitsType ABits, BitsType BBits, BitsType CBits) {
    R.Total++;
    TestOutput<BitsType> OA = A(ABits, BBits, CBits);
    TestOutput<BitsType> OB = B(ABits, BBits, CBits);
    if (Cmp(OA, OB)) {
      R.Passed++;
    } else {
      R.Failed++;
      if (NumReported < MaxReportedFailures) {
        Failures[NumReported++] = {ABits, BBits, OA, OB};
      }
    }
  });

  detail::report(Name, R, Failures, NumReported, false);
  return R;
}

// ===================================================================
// Iteration strategies
// ===================================================================

// Every 16-bit pattern, once. Feasible for unary operations only.
struct AllPatterns {
  template <typename Fn> void operator()(Fn &&Callback) const {
    for (uint32_t P = 0; P <= 0xFFFF; ++P)
      Callback(static_cast<BitsType>(P));
  }
};

// All pairs from a list of interesting values.
struct TargetedPairs {
  const BitsType *Values;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    for (int I = 0; I < Count; ++I)
      for (int J = 0; J < Count; ++J)
        Callback(Values[I], Values[J]);
  }
};

// All triples from a list of interesting values.
struct TargetedTriples {
  const BitsType *Values;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    for (int I = 0; I < Count; ++I)
      for (int J = 0; J < Count; ++J)
        for (int K = 0; K < Count; ++K)
          Callback(Values[I], Values[J], Values[K]);
  }
};

// Uniform random pairs over the 16-bit range.
struct RandomPairs {
  uint64_t Seed;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    for (int I = 0; I < Count; ++I) {
      BitsType A = static_cast<BitsType>(Rng());
      BitsType B = static_cast<BitsType>(Rng());
      Callback(A, B);
    }
  }
};

// Uniform random triples, fed to a ternary callback.
struct RandomTriples {
  uint64_t Seed;
  int Count;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::mt19937_64 Rng(Seed);
    for (int I = 0; I < Count; ++I) {
      BitsType A = static_cast<BitsType>(Rng());
      BitsType B = static_cast<BitsType>(Rng());
      BitsType C = static_cast<BitsType>(Rng());
      Callback(A, B, C);
    }
  }
};

// Run multiple strategies in sequence.
template <typename... Strategies> struct Combined {
  std::tuple<Strategies...> Strats;

  template <typename Fn> void operator()(Fn &&Callback) const {
    std::apply([&](const auto &...S) { (S(Callback), ...); }, Strats);
  }
};

template <typename... Strategies>
Combined<Strategies...> combined(Strategies... S) {
  return {std::tuple{std::move(S)...}};
}

// ===================================================================
// Comparators
// ===================================================================

struct BitExact {
  bool operator()(TestOutput<BitsType> A, TestOutput<BitsType> B) const {
    return A.Bits == B.Bits && A.Flags == B.Flags;
  }
};

struct BitExactIgnoreFlags {
  bool operator()(TestOutput<BitsType> A, TestOutput<BitsType> B) const {
    return A.Bits == B.Bits;
  }
};

// If both outputs are NaN (regardless of sign or payload), they match.
// Otherwise bit-exact.
struct NanAwareBitExact {
  static bool isNan(BitsType Bits) { return codec::isNaN(Bits); }

  bool operator()(TestOutput<BitsType> A, TestOutput<BitsType> B) const {
    if (isNan(A.Bits) && isNan(B.Bits))
      return true;
    return A.Bits == B.Bits;
  }
};

// ===================================================================
// Interesting values
// ===================================================================

// Edge-case binary16 bit patterns, derived from the layout.
constexpr auto interestingValues() {
  using Fmt = binary16_layout;
  constexpr int M = Fmt::mant_bits;
  constexpr int Bias = Fmt::exponent_bias;
  constexpr BitsType SignBit = BitsType{1} << Fmt::sign_offset;
  constexpr BitsType ExpMax = Fmt::exp_all_ones;
  constexpr BitsType MantMask = (BitsType{1} << M) - 1;

  return std::array<BitsType, 24>{{
      0,                                                       // +0
      SignBit,                                                 // -0
      ExpMax << Fmt::exp_offset,                               // +Inf
      SignBit | (ExpMax << Fmt::exp_offset),                   // -Inf
      (ExpMax << Fmt::exp_offset) | (BitsType{1} << (M - 1)),  // QNaN
      (ExpMax << Fmt::exp_offset) | 1,                         // SNaN min
      (ExpMax << Fmt::exp_offset) | ((BitsType{1} << (M - 1)) - 1), // SNaN max
      SignBit | (ExpMax << Fmt::exp_offset) |
          (BitsType{1} << (M - 1)),                            // -QNaN
      BitsType{1},                                             // min +subnormal
      SignBit | BitsType{1},                                   // min -subnormal
      MantMask,                                                // max subnormal
      BitsType{1} << M,                                        // min +normal
      ((ExpMax - 1) << Fmt::exp_offset) | MantMask,            // max +finite
      SignBit | ((ExpMax - 1) << Fmt::exp_offset) | MantMask,  // max -finite
      BitsType(Bias) << Fmt::exp_offset,                       // 1.0
      SignBit | (BitsType(Bias) << Fmt::exp_offset),           // -1.0
      BitsType(Bias + 1) << Fmt::exp_offset,                   // 2.0
      BitsType(Bias - 1) << Fmt::exp_offset,                   // 0.5
      (BitsType{1} << M) + 1,                  // min normal + 1 ULP
      (BitsType(Bias) << Fmt::exp_offset) + 1, // 1.0 + 1 ULP
      (BitsType(Bias) << Fmt::exp_offset) - 1, // 1.0 - 1 ULP
      BitsType(Bias - M) << Fmt::exp_offset,   // machine epsilon
      0x3E00,                                  // 1.5
      0x4248,                                  // pi
  }};
}

} // namespace demi::testing

#endif // DEMI_TESTS_HARNESS_TEST_HARNESS_HPP
