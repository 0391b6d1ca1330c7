#ifndef DEMI_CORE_TEXT_HPP
#define DEMI_CORE_TEXT_HPP

// Decimal formatting and parsing.
//
// Every binary16 value is exact in binary32, so finite values and
// infinities are printed with binary32's shortest round-trip formatter and
// no rounding happens on the way out. Parsing reads the decimal as a
// binary64 and rounds it once to binary16.

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

#include "demi/core/codec.hpp"
#include "demi/core/half.hpp"

namespace demi {

// "nan" for every NaN; otherwise the shortest decimal that reads back as
// the same value ("inf" and "-inf" for the infinities).
template <PlatformPolicy Plat, ArithmeticKernel Kern>
std::string toString(BasicHalf<Plat, Kern> H) {
  if (H.isNaN())
    return "nan";
  // The shortest float form needs at most a sign, nine digits, a point
  // and a four-character exponent.
  char Buf[32];
  char *End = std::to_chars(Buf, Buf + sizeof(Buf), H.toFloat()).ptr;
  return std::string(Buf, End);
}

// Like toString, but NaNs show sign, signaling bit and payload:
// "nan", "-snan", "nan(0x1f)".
template <PlatformPolicy Plat, ArithmeticKernel Kern>
std::string toDebugString(BasicHalf<Plat, Kern> H) {
  if (!H.isNaN())
    return toString(H);
  std::string Out;
  if (H.sign() == Sign::Minus)
    Out += '-';
  if (H.isSignalingNaN())
    Out += 's';
  Out += "nan";
  uint16_t Payload = codec::nanPayload(H.bitPattern());
  // Signaling NaNs built by fromNaNPayload carry a marker bit just below
  // the quiet bit; it is not part of the payload.
  if (H.isSignalingNaN())
    Payload &= static_cast<uint16_t>(~(codec::quietNaNMask() >> 1));
  if (Payload != 0) {
    char Buf[16];
    std::snprintf(Buf, sizeof(Buf), "(0x%x)", static_cast<unsigned>(Payload));
    Out += Buf;
  }
  return Out;
}

template <PlatformPolicy Plat, ArithmeticKernel Kern>
std::ostream &operator<<(std::ostream &OS, BasicHalf<Plat, Kern> H) {
  return OS << toString(H);
}

// Parse the whole string as a general-format decimal ("1.5", "-2e-3",
// "inf", "nan"). nullopt on malformed input, trailing characters, or
// magnitudes beyond binary64. Magnitudes below binary64's range round to a
// signed zero.
template <typename HalfType = Half>
std::optional<HalfType> fromString(std::string_view Text) {
  double Value = 0.0;
  const char *First = Text.data();
  const char *Last = Text.data() + Text.size();
  auto [Ptr, Ec] =
      std::from_chars(First, Last, Value, std::chars_format::general);
  if (Ptr != Last)
    return std::nullopt;
  if (Ec == std::errc::result_out_of_range) {
    // from_chars leaves Value untouched when out of range; strtod tells
    // overflow (HUGE_VAL) from underflow and keeps the sign. The text was
    // already matched in full, so strtod reads the same number.
    std::string Copy(Text);
    Value = std::strtod(Copy.c_str(), nullptr);
    if (std::isinf(Value))
      return std::nullopt;
    return HalfType::fromDouble(Value);
  }
  if (Ec != std::errc())
    return std::nullopt;
  return HalfType::fromDouble(Value);
}

} // namespace demi

#endif // DEMI_CORE_TEXT_HPP
