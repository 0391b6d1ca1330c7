#ifndef DEMI_CORE_ROUNDING_HPP
#define DEMI_CORE_ROUNDING_HPP

namespace demi {

// Rules for rounding a value to an integral value.
//
// Arithmetic results are always rounded to nearest, ties to even; these
// rules only apply to BasicHalf::round and BasicHalf::rounded.
enum class RoundingRule {
  ToNearestOrAwayFromZero, // C round()
  ToNearestOrEven,         // IEEE 754 default; C rint() in default mode
  Up,                      // C ceil()
  Down,                    // C floor()
  TowardZero,              // C trunc()
  AwayFromZero             // ceil() for positives, floor() for negatives
};

inline const char *ruleName(RoundingRule R) {
  switch (R) {
  case RoundingRule::ToNearestOrAwayFromZero: return "toNearestOrAwayFromZero";
  case RoundingRule::ToNearestOrEven:         return "toNearestOrEven";
  case RoundingRule::Up:                      return "up";
  case RoundingRule::Down:                    return "down";
  case RoundingRule::TowardZero:              return "towardZero";
  case RoundingRule::AwayFromZero:            return "awayFromZero";
  }
  return "???";
}

} // namespace demi

#endif // DEMI_CORE_ROUNDING_HPP
