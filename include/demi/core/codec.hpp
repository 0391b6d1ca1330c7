#ifndef DEMI_CORE_CODEC_HPP
#define DEMI_CORE_CODEC_HPP

// Bit-Codec: lossless mapping between a bit pattern and its logical
// fields, and the classification that follows from them.
//
// Every function is a pure function of its argument. The Layout parameter
// defaults to binary16; the same code classifies binary32 and binary64
// sources for the wide-float constructors.

#include "demi/core/bits.hpp"
#include "demi/core/enums.hpp"
#include "demi/core/format.hpp"

namespace demi::codec {

template <typename Layout = binary16_layout>
using storage_t = bits_t<Layout::total_bits>;

template <typename Layout = binary16_layout> struct Fields {
  using BitsType = storage_t<Layout>;

  BitsType Sign;        // 0 or 1
  BitsType Exponent;    // biased, exp_bits wide
  BitsType Significand; // fraction only, mant_bits wide

  friend constexpr bool operator==(const Fields &, const Fields &) = default;
};

template <typename Layout = binary16_layout>
constexpr storage_t<Layout> exponentMask() {
  using BitsType = storage_t<Layout>;
  return static_cast<BitsType>(lowMask<BitsType>(Layout::exp_bits)
                               << Layout::exp_offset);
}

template <typename Layout = binary16_layout>
constexpr storage_t<Layout> significandMask() {
  return lowMask<storage_t<Layout>>(Layout::mant_bits);
}

template <typename Layout = binary16_layout>
constexpr storage_t<Layout> signMask() {
  using BitsType = storage_t<Layout>;
  return static_cast<BitsType>(BitsType{1} << Layout::sign_offset);
}

template <typename Layout = binary16_layout>
constexpr storage_t<Layout> quietNaNMask() {
  using BitsType = storage_t<Layout>;
  return static_cast<BitsType>(BitsType{1} << Layout::quiet_bit);
}

template <typename Layout = binary16_layout>
constexpr Fields<Layout> decompose(storage_t<Layout> Bits) {
  using BitsType = storage_t<Layout>;
  return {static_cast<BitsType>((Bits >> Layout::sign_offset) & 1),
          static_cast<BitsType>((Bits >> Layout::exp_offset) &
                                lowMask<BitsType>(Layout::exp_bits)),
          static_cast<BitsType>(Bits & significandMask<Layout>())};
}

// Out-of-range exponent and significand values are truncated to their
// field widths, not rejected.
template <typename Layout = binary16_layout>
constexpr storage_t<Layout> compose(storage_t<Layout> SignBit,
                                    storage_t<Layout> Exponent,
                                    storage_t<Layout> Significand) {
  using BitsType = storage_t<Layout>;
  BitsType S = static_cast<BitsType>((SignBit & 1) << Layout::sign_offset);
  BitsType E = static_cast<BitsType>(
      (Exponent & lowMask<BitsType>(Layout::exp_bits)) << Layout::exp_offset);
  BitsType M = static_cast<BitsType>(Significand & significandMask<Layout>());
  return static_cast<BitsType>(S | E | M);
}

template <typename Layout = binary16_layout>
constexpr storage_t<Layout> compose(const Fields<Layout> &F) {
  return compose<Layout>(F.Sign, F.Exponent, F.Significand);
}

// ===================================================================
// Classification
// ===================================================================

template <typename Layout = binary16_layout>
constexpr FloatClass classify(storage_t<Layout> Bits) {
  auto F = decompose<Layout>(Bits);
  if (F.Exponent == 0)
    return F.Significand == 0 ? FloatClass::Zero : FloatClass::Subnormal;
  if (F.Exponent != Layout::exp_all_ones)
    return FloatClass::Normal;
  if (F.Significand == 0)
    return FloatClass::Infinity;
  return (F.Significand & quietNaNMask<Layout>()) != 0
             ? FloatClass::QuietNaN
             : FloatClass::SignalingNaN;
}

template <typename Layout = binary16_layout>
constexpr bool signBit(storage_t<Layout> Bits) {
  return decompose<Layout>(Bits).Sign != 0;
}

template <typename Layout = binary16_layout>
constexpr bool isZero(storage_t<Layout> Bits) {
  return classify<Layout>(Bits) == FloatClass::Zero;
}

template <typename Layout = binary16_layout>
constexpr bool isSubnormal(storage_t<Layout> Bits) {
  return classify<Layout>(Bits) == FloatClass::Subnormal;
}

template <typename Layout = binary16_layout>
constexpr bool isNormal(storage_t<Layout> Bits) {
  return classify<Layout>(Bits) == FloatClass::Normal;
}

template <typename Layout = binary16_layout>
constexpr bool isFinite(storage_t<Layout> Bits) {
  return decompose<Layout>(Bits).Exponent != Layout::exp_all_ones;
}

template <typename Layout = binary16_layout>
constexpr bool isInfinite(storage_t<Layout> Bits) {
  return classify<Layout>(Bits) == FloatClass::Infinity;
}

template <typename Layout = binary16_layout>
constexpr bool isNaN(storage_t<Layout> Bits) {
  FloatClass C = classify<Layout>(Bits);
  return C == FloatClass::QuietNaN || C == FloatClass::SignalingNaN;
}

template <typename Layout = binary16_layout>
constexpr bool isQuietNaN(storage_t<Layout> Bits) {
  return classify<Layout>(Bits) == FloatClass::QuietNaN;
}

template <typename Layout = binary16_layout>
constexpr bool isSignalingNaN(storage_t<Layout> Bits) {
  return classify<Layout>(Bits) == FloatClass::SignalingNaN;
}

// With flushed subnormals, a subnormal encoding is a non-canonical zero.
template <typename Layout = binary16_layout>
constexpr bool isCanonical(storage_t<Layout> Bits, bool FlushSubnormals) {
  return !(FlushSubnormals && isSubnormal<Layout>(Bits));
}

// NaN payload: the fraction bits below the quiet bit.
template <typename Layout = binary16_layout>
constexpr storage_t<Layout> nanPayload(storage_t<Layout> Bits) {
  using BitsType = storage_t<Layout>;
  return static_cast<BitsType>(Bits &
                               lowMask<BitsType>(Layout::quiet_bit));
}

static_assert(decompose(uint16_t{0xFC01}) == Fields<>{1, 31, 1});
static_assert(compose(uint16_t{0}, uint16_t{0x3F}, uint16_t{0x7FF}) ==
              0x7FFF);
static_assert(classify(uint16_t{0x7E00}) == FloatClass::QuietNaN);
static_assert(classify(uint16_t{0x7D00}) == FloatClass::SignalingNaN);
static_assert(classify<binary32_layout>(0x7F800000u) ==
              FloatClass::Infinity);

} // namespace demi::codec

#endif // DEMI_CORE_CODEC_HPP
