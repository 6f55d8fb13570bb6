#pragma once

#include <cstdint>

//----------------------------------------------------------------------------------------------------------------------
// Represents a four character identifier used in file formats to identify the file type.
// The identifier is always stored in reading order, from left to right - irrespective of machine endianess.
//----------------------------------------------------------------------------------------------------------------------
struct FourCID {
    uint8_t idChars[4];

    inline constexpr bool operator == (const FourCID& other) const noexcept {
        return (
            (idChars[0] == other.idChars[0]) &&
            (idChars[1] == other.idChars[1]) &&
            (idChars[2] == other.idChars[2]) &&
            (idChars[3] == other.idChars[3])
        );
    }

    inline constexpr bool operator != (const FourCID& other) const noexcept {
        return (!(*this == other));
    }

    // Make from a string of at least 4 characters
    static inline constexpr FourCID make(const char* const pStr) noexcept {
        return FourCID{ { (uint8_t) pStr[0], (uint8_t) pStr[1], (uint8_t) pStr[2], (uint8_t) pStr[3] } };
    }
};
