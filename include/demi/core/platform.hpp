#ifndef DEMI_CORE_PLATFORM_HPP
#define DEMI_CORE_PLATFORM_HPP

#include <concepts>

#include "demi/core/enums.hpp"

namespace demi {

// Target properties the numeric facade depends on.
//
//   machine_word_bits  integers at most this wide convert through the
//                      kernel's native integer path; wider ones are
//                      widened to long double first
//   denormal_mode      whether subnormal encodings are flushed; consulted
//                      by isCanonical, binade, nextUp and
//                      leastNonzeroMagnitude only
template <typename P>
concept PlatformPolicy = requires {
  { P::machine_word_bits } -> std::convertible_to<int>;
  { P::denormal_mode } -> std::convertible_to<DenormalMode>;
} && (P::machine_word_bits == 32 || P::machine_word_bits == 64);

namespace platforms {

struct Generic64 {
  static constexpr int machine_word_bits = 64;
  static constexpr auto denormal_mode = DenormalMode::Full;
};

struct Generic32 {
  static constexpr int machine_word_bits = 32;
  static constexpr auto denormal_mode = DenormalMode::Full;
};

// 32-bit ARM with the FPU in flush-to-zero mode.
struct ArmFlushToZero {
  static constexpr int machine_word_bits = 32;
  static constexpr auto denormal_mode = DenormalMode::FlushToZero;
};

using Default = Generic64;

static_assert(PlatformPolicy<Generic64>);
static_assert(PlatformPolicy<Generic32>);
static_assert(PlatformPolicy<ArmFlushToZero>);

} // namespace platforms

template <PlatformPolicy P>
inline constexpr bool flushes_subnormals =
    P::denormal_mode == DenormalMode::FlushToZero;

} // namespace demi

#endif // DEMI_CORE_PLATFORM_HPP
