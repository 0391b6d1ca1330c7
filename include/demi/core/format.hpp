#ifndef DEMI_CORE_FORMAT_HPP
#define DEMI_CORE_FORMAT_HPP

namespace demi {

// Bit geometry of an IEEE 754 interchange format.
//
// Describes where the fields live in the storage word and the constants
// that follow from their widths. Says nothing about what a pattern means;
// that is the codec's job.
template <int ExpBits, int MantBits> struct IEEE_Layout {
  static constexpr int sign_bits = 1;
  static constexpr int exp_bits = ExpBits;
  static constexpr int mant_bits = MantBits;
  static constexpr int mant_offset = 0;
  static constexpr int exp_offset = MantBits;
  static constexpr int sign_offset = ExpBits + MantBits;
  static constexpr int total_bits = 1 + ExpBits + MantBits;

  // All-ones exponent field, reserved for infinity and NaN.
  static constexpr int exp_all_ones = (1 << ExpBits) - 1;
  static constexpr int exponent_bias = exp_all_ones >> 1;

  // Least normal and greatest finite unbiased exponents.
  static constexpr int min_exponent = 1 - exponent_bias;
  static constexpr int max_exponent = exponent_bias;

  // Position of the quiet bit: the most significant fraction bit.
  static constexpr int quiet_bit = MantBits - 1;

  static_assert(ExpBits >= 2, "exponent field must be at least 2 bits");
  static_assert(MantBits >= 2,
                "mantissa field must hold a quiet bit and a payload bit");
  static_assert(ExpBits < 31, "exponent field must fit an int");
};

// Named standard layouts
using binary16_layout = IEEE_Layout<5, 10>;
using binary32_layout = IEEE_Layout<8, 23>;
using binary64_layout = IEEE_Layout<11, 52>;

static_assert(binary16_layout::total_bits == 16);
static_assert(binary16_layout::exponent_bias == 15);
static_assert(binary16_layout::exp_all_ones == 31);
static_assert(binary32_layout::exponent_bias == 127);
static_assert(binary64_layout::exponent_bias == 1023);

} // namespace demi

#endif // DEMI_CORE_FORMAT_HPP
