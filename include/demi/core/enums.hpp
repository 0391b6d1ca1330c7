#ifndef DEMI_CORE_ENUMS_HPP
#define DEMI_CORE_ENUMS_HPP

namespace demi {

// Sign of a value; the raw value is the stored sign bit.
enum class Sign { Plus = 0, Minus = 1 };

// IEEE 754 class of a bit pattern. Every pattern has exactly one class.
enum class FloatClass {
  Zero,         // exp=0, mant=0 (either sign)
  Subnormal,    // exp=0, mant!=0
  Normal,       // 0 < exp < all-ones
  Infinity,     // exp=all-ones, mant=0 (either sign)
  QuietNaN,     // exp=all-ones, quiet bit set
  SignalingNaN  // exp=all-ones, mant!=0, quiet bit clear
};

enum class DenormalMode {
  Full,        // Gradual underflow, IEEE 754 compliant
  FlushToZero  // Subnormal encodings are read as zero (e.g. 32-bit ARM)
};

inline const char *className(FloatClass C) {
  switch (C) {
  case FloatClass::Zero:         return "zero";
  case FloatClass::Subnormal:    return "subnormal";
  case FloatClass::Normal:       return "normal";
  case FloatClass::Infinity:     return "infinity";
  case FloatClass::QuietNaN:     return "qnan";
  case FloatClass::SignalingNaN: return "snan";
  }
  return "???";
}

} // namespace demi

#endif // DEMI_CORE_ENUMS_HPP
