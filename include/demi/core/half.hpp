#ifndef DEMI_CORE_HALF_HPP
#define DEMI_CORE_HALF_HPP

// BasicHalf: an IEEE 754 binary16 value as a first-class number.
//
// The 16-bit pattern is the only state. Everything that can be answered by
// looking at the bits (classification, exponent, significand, ulp, nextUp,
// binade) is computed here through the codec; everything that needs real
// arithmetic or rounding is delegated to the Kernel.
//
// Platform: machine word width and subnormal flush mode.
// Kernel:   arithmetic, comparisons, conversions and constants.

#include <algorithm>
#include <bit>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <optional>
#include <type_traits>
#include <variant>

#include "demi/core/codec.hpp"
#include "demi/core/enums.hpp"
#include "demi/core/format.hpp"
#include "demi/core/kernel.hpp"
#include "demi/core/platform.hpp"
#include "demi/core/preconditions.hpp"
#include "demi/core/rounding.hpp"
#include "demi/core/softfloat_kernel.hpp"

namespace demi {

namespace detail {

// Integer sources: the standard integral types, plus the 128-bit
// extension types when the compiler has them (they are not std::integral
// in strict modes).
template <typename T>
inline constexpr bool is_signed_integer =
    std::is_integral_v<T> && std::is_signed_v<T>;

template <typename T>
inline constexpr bool is_unsigned_integer =
    std::is_integral_v<T> && std::is_unsigned_v<T> && !std::same_as<T, bool>;

#if defined(__SIZEOF_INT128__)
template <> inline constexpr bool is_signed_integer<__int128> = true;
template <> inline constexpr bool is_unsigned_integer<__int128> = false;
template <> inline constexpr bool is_signed_integer<unsigned __int128> = false;
template <>
inline constexpr bool is_unsigned_integer<unsigned __int128> = true;
#endif

template <typename T>
concept Integer = is_signed_integer<T> || is_unsigned_integer<T>;

template <typename T>
concept WideSource = std::same_as<T, float> || std::same_as<T, double> ||
                     std::same_as<T, long double>;

// Signaling-NaN test for the native wide types, read from the bits so it
// does not depend on what the FPU does with signaling operands.
template <WideSource T> bool isSignalingNaN(T X) {
  if constexpr (std::same_as<T, float>) {
    return codec::isSignalingNaN<binary32_layout>(std::bit_cast<uint32_t>(X));
  } else if constexpr (std::same_as<T, double> ||
                       std::numeric_limits<T>::digits == 53) {
    return codec::isSignalingNaN<binary64_layout>(
        std::bit_cast<uint64_t>(static_cast<double>(X)));
  } else {
    if (!std::isnan(X))
      return false;
    // x87 extended keeps the quiet bit at bit 62 of the 64-bit
    // significand; binary128 at bit 111 (bit 47 of the high word).
    unsigned char Bytes[sizeof(T)];
    std::memcpy(Bytes, &X, sizeof(T));
    uint64_t Word;
    if constexpr (std::numeric_limits<T>::digits == 64) {
      std::memcpy(&Word, Bytes, sizeof(Word));
      return (Word & (uint64_t{1} << 62)) == 0;
    } else {
      std::memcpy(&Word, Bytes + 8, sizeof(Word));
      return (Word & (uint64_t{1} << 47)) == 0;
    }
  }
}

template <class... Fns> struct Overloaded : Fns... {
  using Fns::operator()...;
};
template <class... Fns> Overloaded(Fns...) -> Overloaded<Fns...>;

} // namespace detail

template <PlatformPolicy Plat = platforms::Default,
          ArithmeticKernel Kern = kernels::Default>
class BasicHalf {
public:
  using platform = Plat;
  using kernel = Kern;
  using layout = binary16_layout;
  using storage_type = uint16_t;

  // Closed set of floating-point sources for fromWideFloat.
  using WideFloat = std::variant<BasicHalf, float, double, long double>;

  static constexpr int exponentBitCount = layout::exp_bits;
  static constexpr int significandBitCount = layout::mant_bits;
  static constexpr int radix = 2;

  constexpr BasicHalf() : Bits(0) {}

  // ===================================================================
  // Bit-pattern interchange
  // ===================================================================

  static constexpr BasicHalf fromBitPattern(uint16_t Pattern) {
    BasicHalf H;
    H.Bits = Pattern;
    return H;
  }

  constexpr uint16_t bitPattern() const { return Bits; }

  // ===================================================================
  // Construction
  // ===================================================================

  // The low-level constructor everything else funnels through. The
  // exponent is truncated to 5 bits and the significand to 10.
  static constexpr BasicHalf
  fromSignExponentSignificand(Sign S, unsigned ExponentBitPattern,
                              uint16_t SignificandBitPattern) {
    return fromBitPattern(codec::compose(
        static_cast<uint16_t>(S), static_cast<uint16_t>(ExponentBitPattern &
                                                        layout::exp_all_ones),
        SignificandBitPattern));
  }

  // A NaN carrying Payload below the quiet bit. Signaling NaNs also set the
  // bit below the quiet bit, so their payload must stay under it. Payloads
  // that reach either marker are a precondition failure.
  static BasicHalf fromNaNPayload(uint16_t Payload, bool Signaling) {
    DEMI_PRECONDITION(Payload < (Signaling ? QuietMask >> 1 : QuietMask),
                      "NaN payload is not encodable");
    uint16_t Significand =
        static_cast<uint16_t>(Payload | (QuietMask >> (Signaling ? 1 : 0)));
    return fromSignExponentSignificand(Sign::Plus, layout::exp_all_ones,
                                       Significand);
  }

  // (S == Minus ? -1 : 1) * Significand * 2^Exponent.
  static BasicHalf fromSignExponentAndSignificand(Sign S, int Exponent,
                                                  BasicHalf Significand) {
    BasicHalf Result = S == Sign::Minus ? -Significand : Significand;
    if (!Significand.isFinite() || Significand.isZero())
      return Result;

    constexpr int LeastNormalExponent = layout::min_exponent;
    constexpr int GreatestFiniteExponent = layout::max_exponent;
    int Clamped = Exponent;
    if (Clamped < LeastNormalExponent) {
      Clamped = std::max(Clamped, 3 * LeastNormalExponent);
      while (Clamped < LeastNormalExponent) {
        Result *= leastNormalMagnitude();
        Clamped -= LeastNormalExponent;
      }
    } else if (Clamped > GreatestFiniteExponent) {
      const BasicHalf Step = fromSignExponentSignificand(
          Sign::Plus, layout::exp_all_ones - 1, 0);
      Clamped = std::min(Clamped, 3 * GreatestFiniteExponent);
      while (Clamped > GreatestFiniteExponent) {
        Result *= Step;
        Clamped -= GreatestFiniteExponent;
      }
    }
    Result *= fromSignExponentSignificand(
        Sign::Plus, static_cast<unsigned>(layout::exponent_bias + Clamped), 0);
    return Result;
  }

  static BasicHalf fromWideFloat(const WideFloat &X) {
    return std::visit(
        detail::Overloaded{
            [](BasicHalf H) { return H; },
            [](float F) {
              return fromWide(F, [](float V) { return Kern::fromFloat32(V); });
            },
            [](double D) {
              return fromWide(D, [](double V) { return Kern::fromFloat64(V); });
            },
            [](long double L) {
              return fromWide(L,
                              [](long double V) { return Kern::fromExtended(V); });
            }},
        X);
  }

  static BasicHalf fromFloat(float F) { return fromWideFloat(F); }
  static BasicHalf fromDouble(double D) { return fromWideFloat(D); }
  static BasicHalf fromLongDouble(long double L) { return fromWideFloat(L); }

  // Integers that fit the machine word take the kernel's integer path;
  // wider ones are widened to long double first.
  template <detail::Integer I> static BasicHalf fromInteger(I Value) {
    if constexpr (int(sizeof(I) * 8) <= Plat::machine_word_bits) {
      if constexpr (detail::is_signed_integer<I>)
        return fromBitPattern(Kern::fromMachineInt(static_cast<int64_t>(Value)));
      else
        return fromBitPattern(
            Kern::fromMachineUInt(static_cast<uint64_t>(Value)));
    } else {
      return fromLongDouble(static_cast<long double>(Value));
    }
  }

  // Construct from Value only if no information is lost.
  template <typename T> static std::optional<BasicHalf> exactly(T Value) {
    if constexpr (std::same_as<T, BasicHalf>) {
      return Value;
    } else if constexpr (detail::WideSource<T>) {
      BasicHalf Result = fromWideFloat(Value);
      bool SourceInfinite = std::isinf(Value);
      bool SourceNaN = std::isnan(Value);
      if (Result.isInfinite() || SourceInfinite) {
        if (!Result.isInfinite() || !SourceInfinite)
          return std::nullopt;
        if ((Result.sign() == Sign::Minus) != std::signbit(Value))
          return std::nullopt;
        return Result;
      }
      if (Result.isNaN() || SourceNaN) {
        if (!Result.isNaN() || !SourceNaN)
          return std::nullopt;
        if (Result.isSignalingNaN() != detail::isSignalingNaN(Value))
          return std::nullopt;
        return Result;
      }
      if (Result.template toWide<T>() != Value)
        return std::nullopt;
      return Result;
    } else {
      static_assert(detail::Integer<T>, "unsupported source type");
      BasicHalf Result = fromInteger(Value);
      if (Result.isInfinite() || Result.isNaN())
        return std::nullopt;
      std::optional<T> Back = Result.template toInteger<T>();
      if (!Back || *Back != Value)
        return std::nullopt;
      return Result;
    }
  }

  // ===================================================================
  // Named values
  // ===================================================================

  static BasicHalf zero() { return fromBitPattern(Kern::zero()); }
  static constexpr BasicHalf infinity() {
    return fromSignExponentSignificand(Sign::Plus, layout::exp_all_ones, 0);
  }
  static BasicHalf nan() { return fromBitPattern(Kern::nan()); }
  static BasicHalf signalingNaN() { return fromNaNPayload(0, true); }
  static BasicHalf pi() { return fromBitPattern(Kern::pi()); }
  static BasicHalf ulpOfOne() {
    return fromBitPattern(Kern::unitLastPlaceOfOne());
  }
  static constexpr BasicHalf greatestFiniteMagnitude() {
    return fromSignExponentSignificand(Sign::Plus, layout::exp_all_ones - 1,
                                       SignificandMask);
  }
  static constexpr BasicHalf leastNormalMagnitude() {
    return fromSignExponentSignificand(Sign::Plus, 1, 0);
  }
  static constexpr BasicHalf leastNonzeroMagnitude() {
    if constexpr (flushes_subnormals<Plat>)
      return leastNormalMagnitude();
    else
      return fromSignExponentSignificand(Sign::Plus, 0, 1);
  }

  // ===================================================================
  // Fields and classification
  // ===================================================================

  constexpr Sign sign() const {
    return codec::signBit(Bits) ? Sign::Minus : Sign::Plus;
  }
  constexpr unsigned exponentBitPattern() const {
    return codec::decompose(Bits).Exponent;
  }
  constexpr uint16_t significandBitPattern() const {
    return codec::decompose(Bits).Significand;
  }

  constexpr FloatClass classification() const { return codec::classify(Bits); }
  constexpr bool isZero() const { return codec::isZero(Bits); }
  constexpr bool isSubnormal() const { return codec::isSubnormal(Bits); }
  constexpr bool isNormal() const { return codec::isNormal(Bits); }
  constexpr bool isFinite() const { return codec::isFinite(Bits); }
  constexpr bool isInfinite() const { return codec::isInfinite(Bits); }
  constexpr bool isNaN() const { return codec::isNaN(Bits); }
  constexpr bool isSignalingNaN() const { return codec::isSignalingNaN(Bits); }
  constexpr bool isCanonical() const {
    return codec::isCanonical(Bits, flushes_subnormals<Plat>);
  }

  // ===================================================================
  // Derived quantities
  // ===================================================================

  // Unbiased exponent; INT_MAX for infinity and NaN, INT_MIN for zero.
  constexpr int exponent() const {
    if (!isFinite())
      return std::numeric_limits<int>::max();
    if (isZero())
      return std::numeric_limits<int>::min();
    int Provisional =
        static_cast<int>(exponentBitPattern()) - layout::exponent_bias;
    if (isNormal())
      return Provisional;
    return Provisional + 1 - normalizationShift();
  }

  // The significand as a value in [1, 2), sign dropped.
  constexpr BasicHalf significand() const {
    if (isNaN())
      return *this;
    if (isNormal())
      return fromSignExponentSignificand(Sign::Plus, layout::exponent_bias,
                                         significandBitPattern());
    if (isSubnormal())
      return fromSignExponentSignificand(
          Sign::Plus, layout::exponent_bias,
          static_cast<uint16_t>(significandBitPattern()
                                << normalizationShift()));
    return fromSignExponentSignificand(Sign::Plus, exponentBitPattern(), 0);
  }

  BasicHalf ulp() const {
    if (!isFinite())
      return nan();
    if (isNormal())
      return fromBitPattern(Bits & ExponentMask) * ulpOfOne();
    return leastNormalMagnitude() * ulpOfOne();
  }

  // Least representable value that compares greater than this one.
  BasicHalf nextUp() const {
    BasicHalf Next = *this + zero();
    if constexpr (flushes_subnormals<Plat>) {
      if (Next.isZero() || Next.isSubnormal())
        return leastNonzeroMagnitude();
      if (Next == -leastNonzeroMagnitude())
        return -zero();
    }
    if (Next < infinity()) {
      int16_t Signed = std::bit_cast<int16_t>(Next.Bits);
      uint16_t Increment = static_cast<uint16_t>((Signed >> 15) | 1);
      return fromBitPattern(static_cast<uint16_t>(Next.Bits + Increment));
    }
    return Next;
  }

  BasicHalf nextDown() const { return -(-*this).nextUp(); }

  // Same sign and exponent, significand 1.0.
  BasicHalf binade() const {
    if (!isFinite())
      return nan();
    if constexpr (!flushes_subnormals<Plat>) {
      if (isSubnormal()) {
        // Scale into the normal range by 2^10, mask, scale back.
        BasicHalf Scaled =
            *this * fromSignExponentSignificand(
                        Sign::Plus, layout::exponent_bias + layout::mant_bits,
                        0);
        return fromBitPattern(Scaled.Bits & SignExponentMask) * ulpOfOne();
      }
    }
    return fromBitPattern(Bits & SignExponentMask);
  }

  // Fraction bits needed to represent significand(); -1 for zero,
  // infinity and NaN.
  constexpr int significandWidth() const {
    uint16_t Sig = significandBitPattern();
    int TrailingZeroBits = trailingZeros(Sig);
    if (isNormal()) {
      if (Sig == 0)
        return 0;
      return significandBitCount - TrailingZeroBits;
    }
    if (isSubnormal()) {
      int LeadingZeroBits = leadingZeros(Sig);
      return 16 - (TrailingZeroBits + LeadingZeroBits + 1);
    }
    return -1;
  }

  BasicHalf magnitude() const { return fromBitPattern(Kern::abs(Bits)); }

  // ===================================================================
  // Arithmetic
  // ===================================================================

  friend BasicHalf operator+(BasicHalf A, BasicHalf B) {
    return fromBitPattern(Kern::add(A.Bits, B.Bits));
  }
  friend BasicHalf operator-(BasicHalf A, BasicHalf B) {
    return fromBitPattern(Kern::sub(A.Bits, B.Bits));
  }
  friend BasicHalf operator*(BasicHalf A, BasicHalf B) {
    return fromBitPattern(Kern::mul(A.Bits, B.Bits));
  }
  friend BasicHalf operator/(BasicHalf A, BasicHalf B) {
    return fromBitPattern(Kern::div(A.Bits, B.Bits));
  }
  friend BasicHalf operator-(BasicHalf A) {
    return fromBitPattern(Kern::neg(A.Bits));
  }

  BasicHalf &operator+=(BasicHalf Other) { return *this = *this + Other; }
  BasicHalf &operator-=(BasicHalf Other) { return *this = *this - Other; }
  BasicHalf &operator*=(BasicHalf Other) { return *this = *this * Other; }
  BasicHalf &operator/=(BasicHalf Other) { return *this = *this / Other; }

  void negate() { Bits = Kern::neg(Bits); }

  // this + Lhs * Rhs with a single rounding.
  void addProduct(BasicHalf Lhs, BasicHalf Rhs) {
    Bits = Kern::fma(Lhs.Bits, Rhs.Bits, Bits);
  }

  BasicHalf squareRoot() const { return fromBitPattern(Kern::sqrt(Bits)); }
  void formSquareRoot() { Bits = Kern::sqrt(Bits); }

  // IEEE remainder: this - Other * n, n the integer nearest this / Other.
  BasicHalf remainder(BasicHalf Other) const {
    return fromBitPattern(Kern::rem(Bits, Other.Bits));
  }
  void formRemainder(BasicHalf Other) { *this = remainder(Other); }

  // fmod: n rounded toward zero. Exact in binary32, so computing there
  // introduces no rounding.
  BasicHalf truncatingRemainder(BasicHalf Other) const {
    return fromFloat(std::fmod(toFloat(), Other.toFloat()));
  }
  void formTruncatingRemainder(BasicHalf Other) {
    *this = truncatingRemainder(Other);
  }

  BasicHalf rounded(RoundingRule Rule = RoundingRule::ToNearestOrAwayFromZero)
      const {
    return fromBitPattern(Kern::roundToIntegral(Bits, Rule));
  }
  void round(RoundingRule Rule = RoundingRule::ToNearestOrAwayFromZero) {
    *this = rounded(Rule);
  }

  BasicHalf distance(BasicHalf To) const { return To - *this; }
  BasicHalf advanced(BasicHalf By) const { return *this + By; }

  // ===================================================================
  // Comparison
  // ===================================================================

  bool isEqual(BasicHalf Other) const { return Kern::equal(Bits, Other.Bits); }
  bool isLess(BasicHalf Other) const {
    return Kern::lessThan(Bits, Other.Bits);
  }
  bool isLessThanOrEqual(BasicHalf Other) const {
    return Kern::lessOrEqual(Bits, Other.Bits);
  }

  friend bool operator==(BasicHalf A, BasicHalf B) { return A.isEqual(B); }
  friend bool operator!=(BasicHalf A, BasicHalf B) { return !A.isEqual(B); }
  friend bool operator<(BasicHalf A, BasicHalf B) { return A.isLess(B); }
  friend bool operator<=(BasicHalf A, BasicHalf B) {
    return A.isLessThanOrEqual(B);
  }
  friend bool operator>(BasicHalf A, BasicHalf B) { return B.isLess(A); }
  friend bool operator>=(BasicHalf A, BasicHalf B) {
    return B.isLessThanOrEqual(A);
  }

  // Consistent with ==: both zeros hash alike.
  std::size_t hashValue() const {
    uint16_t Canonical = isZero() ? uint16_t{0} : Bits;
    return std::hash<uint16_t>{}(Canonical);
  }

  // ===================================================================
  // Outbound conversions
  // ===================================================================

  float toFloat() const { return Kern::toFloat32(Bits); }
  double toDouble() const { return Kern::toFloat64(Bits); }
  explicit operator float() const { return toFloat(); }
  explicit operator double() const { return toDouble(); }

  template <detail::WideSource T> T toWide() const {
    if constexpr (std::same_as<T, float>)
      return toFloat();
    else
      return static_cast<T>(toDouble());
  }

  // Truncates toward zero; nullopt for NaN, infinity and values outside
  // I's range. Every finite binary16 value fits 32 bits, so only narrower
  // types and negative values for unsigned types can fail.
  template <detail::Integer I> std::optional<I> toInteger() const {
    if (!isFinite())
      return std::nullopt;
    BasicHalf Truncated = rounded(RoundingRule::TowardZero);
    if constexpr (detail::is_signed_integer<I>) {
      int64_t Value = Kern::toMachineInt(Truncated.Bits);
      if constexpr (sizeof(I) < sizeof(int32_t)) {
        if (Value < std::numeric_limits<I>::min() ||
            Value > std::numeric_limits<I>::max())
          return std::nullopt;
      }
      return static_cast<I>(Value);
    } else {
      if (Truncated.sign() == Sign::Minus && !Truncated.isZero())
        return std::nullopt;
      uint64_t Value = Kern::toMachineUInt(Truncated.Bits);
      if constexpr (sizeof(I) < sizeof(uint32_t)) {
        if (Value > std::numeric_limits<I>::max())
          return std::nullopt;
      }
      return static_cast<I>(Value);
    }
  }

private:
  static constexpr uint16_t SignificandMask = codec::significandMask();
  static constexpr uint16_t ExponentMask = codec::exponentMask();
  static constexpr uint16_t SignExponentMask =
      static_cast<uint16_t>(codec::signMask() | codec::exponentMask());
  static constexpr uint16_t QuietMask = codec::quietNaNMask();

  // Left shift that gives a subnormal significand an implicit leading 1.
  constexpr int normalizationShift() const {
    return significandBitCount - binaryLog(significandBitPattern());
  }

  // Shared wide-float path: infinities keep their sign, NaNs become the
  // quiet NaN, finite values are rounded by the kernel.
  template <typename T, typename Convert>
  static BasicHalf fromWide(T X, Convert Fn) {
    if (std::isinf(X))
      return fromSignExponentSignificand(
          std::signbit(X) ? Sign::Minus : Sign::Plus, layout::exp_all_ones, 0);
    if (std::isnan(X))
      return nan();
    return fromBitPattern(Fn(X));
  }

  uint16_t Bits;
};

using Half = BasicHalf<>;

static_assert(sizeof(Half) == 2);
static_assert(std::is_trivially_copyable_v<Half>);

} // namespace demi

namespace std {

template <demi::PlatformPolicy Plat, demi::ArithmeticKernel Kern>
struct hash<demi::BasicHalf<Plat, Kern>> {
  size_t operator()(demi::BasicHalf<Plat, Kern> H) const {
    return H.hashValue();
  }
};

} // namespace std

#endif // DEMI_CORE_HALF_HPP
