#pragma once

#include "Base/Macros.h"
#include <cmath>
#include <cstdint>

//----------------------------------------------------------------------------------------------------------------------
// Floating point math functions
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(FMath)

//----------------------------------------------------------------------------------------------------------------------
// Commonly used float angles (in radians)
//----------------------------------------------------------------------------------------------------------------------
template <class T> static constexpr T ANGLE_180 = T(3.141592653589793238462643383279502884197169399375105820974944592307816406286208998628034825342117067);
template <class T> static constexpr T ANGLE_360 = ANGLE_180<T> * T(2.0);
template <class T> static constexpr T ANGLE_90  = ANGLE_180<T> / T(2.0);
template <class T> static constexpr T ANGLE_45  = ANGLE_180<T> / T(4.0);
template <class T> static constexpr T ANGLE_1   = ANGLE_180<T> / T(180.0);

//----------------------------------------------------------------------------------------------------------------------
// Degrees to radians
//----------------------------------------------------------------------------------------------------------------------
template <class T>
constexpr inline T degToRad(const T degrees) noexcept {
    return degrees * ANGLE_1<T>;
}

//----------------------------------------------------------------------------------------------------------------------
// Clamp a value to the given inclusive range
//----------------------------------------------------------------------------------------------------------------------
template <class T>
constexpr inline T clamp(const T value, const T minValue, const T maxValue) noexcept {
    return (value < minValue) ? minValue : ((value > maxValue) ? maxValue : value);
}

//----------------------------------------------------------------------------------------------------------------------
// Get the angle from one point to another in radians
//----------------------------------------------------------------------------------------------------------------------
template <class T>
inline T angleFromPointToPoint(const T p1x, const T p1y, const T p2x, const T p2y) noexcept {
    const T dx = p2x - p1x;
    const T dy = p2y - p1y;
    return std::atan2(dy, dx);
}

//----------------------------------------------------------------------------------------------------------------------
// Get the 2D distance between two points
//----------------------------------------------------------------------------------------------------------------------
template <class T>
inline T distance2d(const T x1, const T y1, const T x2, const T y2) noexcept {
    const T dx = x2 - x1;
    const T dy = y2 - y1;
    return std::sqrt(dx * dx + dy * dy);
}

//----------------------------------------------------------------------------------------------------------------------
// Modulus that always gives a result in the range 0..(divisor - 1), for wrapping texture coordinates
//----------------------------------------------------------------------------------------------------------------------
inline int32_t wrapIndex(const int32_t value, const int32_t divisor) noexcept {
    const int32_t result = value % divisor;
    return (result < 0) ? result + divisor : result;
}

//----------------------------------------------------------------------------------------------------------------------
// Wrap an angle in radians to the range [0, 2 PI)
//----------------------------------------------------------------------------------------------------------------------
template <class T>
inline T normalizeRadians(const T angle) noexcept {
    const T wrapped = std::fmod(angle, ANGLE_360<T>);
    return (wrapped < T(0)) ? wrapped + ANGLE_360<T> : wrapped;
}

END_NAMESPACE(FMath)
