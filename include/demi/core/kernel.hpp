#ifndef DEMI_CORE_KERNEL_HPP
#define DEMI_CORE_KERNEL_HPP

// The arithmetic kernel contract.
//
// A kernel supplies every operation that needs real floating-point
// arithmetic rather than bit manipulation. Operands and results are raw
// binary16 bit patterns; arithmetic and conversions into binary16 are
// correctly rounded to nearest, ties to even. Comparisons are quiet and
// treat NaN as unordered.

#include <concepts>
#include <cstdint>

#include "demi/core/rounding.hpp"

namespace demi {

template <typename K>
concept ArithmeticKernel = requires(uint16_t A, uint16_t B, uint16_t C,
                                    float F, double D, long double L,
                                    int64_t I, uint64_t U, RoundingRule R) {
  { K::add(A, B) } -> std::same_as<uint16_t>;
  { K::sub(A, B) } -> std::same_as<uint16_t>;
  { K::mul(A, B) } -> std::same_as<uint16_t>;
  { K::div(A, B) } -> std::same_as<uint16_t>;
  { K::rem(A, B) } -> std::same_as<uint16_t>;
  { K::fma(A, B, C) } -> std::same_as<uint16_t>; // A * B + C, one rounding
  { K::sqrt(A) } -> std::same_as<uint16_t>;
  { K::neg(A) } -> std::same_as<uint16_t>;
  { K::abs(A) } -> std::same_as<uint16_t>;
  { K::roundToIntegral(A, R) } -> std::same_as<uint16_t>;

  { K::equal(A, B) } -> std::same_as<bool>;
  { K::lessThan(A, B) } -> std::same_as<bool>;
  { K::lessOrEqual(A, B) } -> std::same_as<bool>;

  { K::fromFloat32(F) } -> std::same_as<uint16_t>;
  { K::fromFloat64(D) } -> std::same_as<uint16_t>;
  { K::fromExtended(L) } -> std::same_as<uint16_t>;
  { K::toFloat32(A) } -> std::same_as<float>;
  { K::toFloat64(A) } -> std::same_as<double>;
  { K::fromMachineInt(I) } -> std::same_as<uint16_t>;
  { K::fromMachineUInt(U) } -> std::same_as<uint16_t>;
  { K::toMachineInt(A) } -> std::same_as<int64_t>;   // truncating
  { K::toMachineUInt(A) } -> std::same_as<uint64_t>; // truncating

  { K::zero() } -> std::same_as<uint16_t>;
  { K::nan() } -> std::same_as<uint16_t>;
  { K::pi() } -> std::same_as<uint16_t>;
  { K::unitLastPlaceOfOne() } -> std::same_as<uint16_t>;
};

} // namespace demi

#endif // DEMI_CORE_KERNEL_HPP
