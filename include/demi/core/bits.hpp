#ifndef DEMI_CORE_BITS_HPP
#define DEMI_CORE_BITS_HPP

// bits_t<N>: the smallest standard unsigned word holding N bits, and the
// bit-counting helpers the derived quantities are built from.
//
// Not an integer semantically: a bag of bits. The counting helpers take
// the logical width explicitly so that a 10-bit field stored in a 16-bit
// word reports counts relative to the width the caller means.

#include <bit>
#include <concepts>
#include <cstdint>

namespace demi {

namespace detail {

template <int N> struct BitsStorage {
  static_assert(N > 0 && N <= 64, "bit containers are limited to 64 bits");
};

template <int N>
  requires(N > 0 && N <= 8)
struct BitsStorage<N> {
  using type = uint8_t;
};

template <int N>
  requires(N > 8 && N <= 16)
struct BitsStorage<N> {
  using type = uint16_t;
};

template <int N>
  requires(N > 16 && N <= 32)
struct BitsStorage<N> {
  using type = uint32_t;
};

template <int N>
  requires(N > 32 && N <= 64)
struct BitsStorage<N> {
  using type = uint64_t;
};

} // namespace detail

template <int N> using bits_t = typename detail::BitsStorage<N>::type;

// Mask of the low Width bits.
template <std::unsigned_integral T>
constexpr T lowMask(int Width) {
  if (Width >= int(sizeof(T) * 8))
    return static_cast<T>(~T{0});
  return static_cast<T>((T{1} << Width) - 1);
}

// Leading zeros of Val viewed as a Width-bit word.
template <std::unsigned_integral T>
constexpr int leadingZeros(T Val, int Width = int(sizeof(T) * 8)) {
  return std::countl_zero(Val) - (int(sizeof(T) * 8) - Width);
}

// Trailing zeros of Val viewed as a Width-bit word (Width for zero).
template <std::unsigned_integral T>
constexpr int trailingZeros(T Val, int Width = int(sizeof(T) * 8)) {
  if (Val == 0)
    return Width;
  return std::countr_zero(Val);
}

// floor(log2(Val)). Val must be non-zero.
template <std::unsigned_integral T> constexpr int binaryLog(T Val) {
  return std::bit_width(Val) - 1;
}

static_assert(leadingZeros(uint16_t{1}) == 15);
static_assert(leadingZeros(uint16_t{1}, 10) == 9);
static_assert(trailingZeros(uint16_t{0x0200}) == 9);
static_assert(trailingZeros(uint16_t{0}, 10) == 10);
static_assert(binaryLog(uint16_t{0x3FF}) == 9);
static_assert(lowMask<uint16_t>(10) == 0x3FF);

} // namespace demi

#endif // DEMI_CORE_BITS_HPP
