#ifndef DEMI_HPP
#define DEMI_HPP

#include "demi/core/bits.hpp"
#include "demi/core/codec.hpp"
#include "demi/core/enums.hpp"
#include "demi/core/format.hpp"
#include "demi/core/half.hpp"
#include "demi/core/kernel.hpp"
#include "demi/core/platform.hpp"
#include "demi/core/preconditions.hpp"
#include "demi/core/rounding.hpp"
#include "demi/core/softfloat_kernel.hpp"
#include "demi/core/text.hpp"

#endif // DEMI_HPP
