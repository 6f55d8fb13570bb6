#pragma once

#include "Base/Macros.h"
#include <cstdint>

//----------------------------------------------------------------------------------------------------------------------
// Whether or not the host system is big endian or not:
// If this is not explicitly defined by the build setup, then just assume little endian.
//----------------------------------------------------------------------------------------------------------------------
#ifndef RBSP_BIG_ENDIAN
    #define RBSP_BIG_ENDIAN 0
#endif

BEGIN_NAMESPACE(Endian)

//----------------------------------------------------------------------------------------------------------------------
// Byte swapping from big endian (level file byte order) to host endian.
//----------------------------------------------------------------------------------------------------------------------
inline uint32_t bigToHost(const uint32_t num) noexcept {
    #if RBSP_BIG_ENDIAN
        return num;
    #else
        return (
            ((num & (uint32_t) 0x000000FFU) << 24) |
            ((num & (uint32_t) 0x0000FF00U) << 8) |
            ((num & (uint32_t) 0x00FF0000U) >> 8) |
            ((num & (uint32_t) 0xFF000000U) >> 24)
        );
    #endif
}

inline int32_t bigToHost(const int32_t num) noexcept {
    return (int32_t) bigToHost((uint32_t) num);
}

// The swap is symmetric, so writing a big endian value is the same operation
inline uint32_t hostToBig(const uint32_t num) noexcept { return bigToHost(num); }

template <class T>
inline void convertBigToHost(T& value) noexcept {
    #if !RBSP_BIG_ENDIAN
        value = bigToHost(value);
    #endif
}

END_NAMESPACE(Endian)
