#pragma once

#include <cstdint>

//----------------------------------------------------------------------------------------------------------------------
// 16.16 signed fixed point numbers.
// Only used for storage: level files keep coordinates and heights in this format so they are exact and
// endian-swappable. Everything is converted to float on load.
//----------------------------------------------------------------------------------------------------------------------
typedef int32_t Fixed;

inline constexpr float fixed16ToFloat(const Fixed fixed) noexcept {
    return float((double) fixed * (1.0 / 65536.0));
}

inline constexpr Fixed floatToFixed16(const float value) noexcept {
    return Fixed((double) value * 65536.0);
}
