#pragma once

#include <bit>

// =========================================================================================================
// Bit manipulation functions
// =========================================================================================================
//
// Power of two operations (unsigned integers only):
//   has_single_bit(value)                   - check if value is integral power of 2
//   bit_ceil(value)                         - smallest power of 2 not less than value
//   bit_floor(value)                        - largest power of 2 not greater than value
//

namespace od
{
/// Usage:
///   od::has_single_bit(8u);   // true
///   od::has_single_bit(0u);   // false
using std::has_single_bit;

/// Usage:
///   od::bit_ceil(5u);   // 8
///   od::bit_ceil(16u);  // 16
///   od::bit_ceil(0u);   // 1
using std::bit_ceil;

/// Usage:
///   od::bit_floor(5u);   // 4
///   od::bit_floor(16u);  // 16
///   od::bit_floor(0u);   // 0
using std::bit_floor;
} // namespace od
