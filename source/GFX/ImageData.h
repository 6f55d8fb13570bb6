#pragma once

#include "Base/FMath.h"
#include <cstdint>
#include <vector>

//------------------------------------------------------------------------------------------------------------------------------------------
// Simple struct describing the data for an image in ARGB8888 format, stored in row major layout.
// All textures (walls and flats) and the frame buffer itself use this single uniform format.
//------------------------------------------------------------------------------------------------------------------------------------------
struct ImageData {
    uint32_t                width;
    uint32_t                height;
    std::vector<uint32_t>   pixels;

    // Fetch a texel, wrapping the coordinates around the image in both directions
    inline uint32_t getWrappedTexel(const int32_t x, const int32_t y) const noexcept {
        const int32_t wrappedX = FMath::wrapIndex(x, (int32_t) width);
        const int32_t wrappedY = FMath::wrapIndex(y, (int32_t) height);
        return pixels[(uint32_t) wrappedY * width + (uint32_t) wrappedX];
    }
};

//------------------------------------------------------------------------------------------------------------------------------------------
// Utility functions for dealing with 'ImageData' pixels
//------------------------------------------------------------------------------------------------------------------------------------------
namespace ImageDataUtils {
    // Decode a pixel to integer RGB values in the range 0-255
    inline constexpr void decodePixelToRGB(const uint32_t pixel, uint32_t& r, uint32_t& g, uint32_t& b) noexcept {
        r = (pixel >> 16) & 0xFFu;
        g = (pixel >> 8) & 0xFFu;
        b = pixel & 0xFFu;
    }

    // Make a fully opaque pixel from RGB values (saturated to 0-255)
    inline constexpr uint32_t encodeRGB(const uint32_t r, const uint32_t g, const uint32_t b) noexcept {
        const uint32_t rClamp = (r > 0xFF) ? 0xFF : r;
        const uint32_t gClamp = (g > 0xFF) ? 0xFF : g;
        const uint32_t bClamp = (b > 0xFF) ? 0xFF : b;
        return (0xFF000000u | (rClamp << 16) | (gClamp << 8) | bClamp);
    }

    // Multiply the RGB values of a pixel by a light multiplier, saturating if the multiplier is above '1.0'
    inline uint32_t applyLightMul(const uint32_t pixel, const float lightMul) noexcept {
        uint32_t r, g, b;
        decodePixelToRGB(pixel, r, g, b);

        const uint32_t mulFrac = (uint32_t)(lightMul * 256.0f);     // 24.8 fixed point
        return encodeRGB((r * mulFrac) >> 8, (g * mulFrac) >> 8, (b * mulFrac) >> 8);
    }
}
