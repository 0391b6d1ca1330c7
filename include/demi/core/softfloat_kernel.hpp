#ifndef DEMI_CORE_SOFTFLOAT_KERNEL_HPP
#define DEMI_CORE_SOFTFLOAT_KERNEL_HPP

// Arithmetic kernel backed by Berkeley SoftFloat 3.
//
// SoftFloat's rounding mode and exception flags are its own state. This
// kernel never writes the rounding mode: arithmetic runs under whatever
// mode is current (round-to-nearest-even unless a caller changed it), and
// operations that take an explicit mode are given one. Exception flags are
// left for SoftFloat to accumulate; nothing here reads them.

#include <bit>
#include <cstdint>
#include <cstring>
#include <limits>

#include "demi/core/kernel.hpp"
#include "demi/core/rounding.hpp"

extern "C" {
#include "softfloat.h"
}

namespace demi::kernels {

struct SoftFloat {
  static constexpr const char *name() { return "SoftFloat"; }

  static uint16_t add(uint16_t A, uint16_t B) {
    return f16_add(wrap(A), wrap(B)).v;
  }
  static uint16_t sub(uint16_t A, uint16_t B) {
    return f16_sub(wrap(A), wrap(B)).v;
  }
  static uint16_t mul(uint16_t A, uint16_t B) {
    return f16_mul(wrap(A), wrap(B)).v;
  }
  static uint16_t div(uint16_t A, uint16_t B) {
    return f16_div(wrap(A), wrap(B)).v;
  }
  static uint16_t rem(uint16_t A, uint16_t B) {
    return f16_rem(wrap(A), wrap(B)).v;
  }
  static uint16_t fma(uint16_t A, uint16_t B, uint16_t C) {
    return f16_mulAdd(wrap(A), wrap(B), wrap(C)).v;
  }
  static uint16_t sqrt(uint16_t A) { return f16_sqrt(wrap(A)).v; }

  // Sign-bit operations: exact, and NaNs keep their payload.
  static uint16_t neg(uint16_t A) { return uint16_t(A ^ SignBit); }
  static uint16_t abs(uint16_t A) { return uint16_t(A & ~SignBit); }

  static uint16_t roundToIntegral(uint16_t A, RoundingRule R) {
    return f16_roundToInt(wrap(A), roundingMode(A, R), false).v;
  }

  static bool equal(uint16_t A, uint16_t B) {
    return f16_eq(wrap(A), wrap(B));
  }
  static bool lessThan(uint16_t A, uint16_t B) {
    return f16_lt_quiet(wrap(A), wrap(B));
  }
  static bool lessOrEqual(uint16_t A, uint16_t B) {
    return f16_le_quiet(wrap(A), wrap(B));
  }

  // ===================================================================
  // Conversions
  // ===================================================================

  static uint16_t fromFloat32(float F) {
    float32_t S;
    S.v = std::bit_cast<uint32_t>(F);
    return f32_to_f16(S).v;
  }

  static uint16_t fromFloat64(double D) {
    float64_t S;
    S.v = std::bit_cast<uint64_t>(D);
    return f64_to_f16(S).v;
  }

  static uint16_t fromExtended(long double L) {
    constexpr int Digits = std::numeric_limits<long double>::digits;
    constexpr bool Little = std::endian::native == std::endian::little;
    if constexpr (Digits == 64 && Little) {
      // x87 80-bit extended: 64-bit significand, then sign and exponent.
      unsigned char Bytes[sizeof(long double)];
      std::memcpy(Bytes, &L, sizeof(long double));
      extFloat80_t X;
      std::memcpy(&X.signif, Bytes, sizeof(X.signif));
      std::memcpy(&X.signExp, Bytes + 8, sizeof(X.signExp));
      return extF80M_to_f16(&X).v;
    } else if constexpr (Digits == 113 && Little) {
      float128_t Q;
      std::memcpy(&Q, &L, sizeof(Q));
      return f128M_to_f16(&Q).v;
    } else {
      static_assert(Digits <= 53 || Digits == 64 || Digits == 113,
                    "unsupported long double format");
      return fromFloat64(static_cast<double>(L));
    }
  }

  static float toFloat32(uint16_t A) {
    return std::bit_cast<float>(f16_to_f32(wrap(A)).v);
  }

  static double toFloat64(uint16_t A) {
    return std::bit_cast<double>(f16_to_f64(wrap(A)).v);
  }

  static uint16_t fromMachineInt(int64_t I) { return i64_to_f16(I).v; }
  static uint16_t fromMachineUInt(uint64_t U) { return ui64_to_f16(U).v; }

  static int64_t toMachineInt(uint16_t A) {
    return f16_to_i64(wrap(A), softfloat_round_minMag, false);
  }
  static uint64_t toMachineUInt(uint16_t A) {
    return f16_to_ui64(wrap(A), softfloat_round_minMag, false);
  }

  // ===================================================================
  // Constants
  // ===================================================================

  static uint16_t zero() { return 0x0000; }
  static uint16_t nan() { return 0x7E00; }
  static uint16_t pi() { return 0x4248; }                 // 3.140625
  static uint16_t unitLastPlaceOfOne() { return 0x1400; } // 2^-10

private:
  static constexpr uint16_t SignBit = 0x8000;

  static float16_t wrap(uint16_t A) {
    float16_t S;
    S.v = A;
    return S;
  }

  static uint_fast8_t roundingMode(uint16_t A, RoundingRule R) {
    switch (R) {
    case RoundingRule::ToNearestOrAwayFromZero:
      return softfloat_round_near_maxMag;
    case RoundingRule::ToNearestOrEven:
      return softfloat_round_near_even;
    case RoundingRule::Up:
      return softfloat_round_max;
    case RoundingRule::Down:
      return softfloat_round_min;
    case RoundingRule::TowardZero:
      return softfloat_round_minMag;
    case RoundingRule::AwayFromZero:
      return (A & SignBit) ? softfloat_round_min : softfloat_round_max;
    }
    return softfloat_round_near_even;
  }
};

static_assert(ArithmeticKernel<SoftFloat>);

using Default = SoftFloat;

} // namespace demi::kernels

#endif // DEMI_CORE_SOFTFLOAT_KERNEL_HPP
