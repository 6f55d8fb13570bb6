#pragma once

#include "Base/FMath.h"
#include <cstdint>

//----------------------------------------------------------------------------------------------------------------------
// Settings the renderer runs with.
// Filled in from the config file by the viewer, or directly by tests.
// The renderer never reads configuration from anywhere else.
//----------------------------------------------------------------------------------------------------------------------
struct RenderSettings {
    uint32_t    screenWidth         = 320;
    uint32_t    screenHeight        = 200;
    float       fieldOfView         = FMath::ANGLE_90<float>;   // Horizontal field of view (radians)
    float       nearClipDepth       = 1.0f;                     // Walls and bounding boxes are clipped against this view depth
    float       depthEpsilon        = 1.0f / 256.0f;            // Depths are clamped to at least this before dividing by them
    uint32_t    maxVisplanes        = 128;                      // Maximum number of live visplanes before early flushing
    uint32_t    spanThreads         = 1;                        // Number of threads used to rasterize floor and ceiling spans

    // Limits for the values above
    static constexpr uint32_t   MIN_SCREEN_SIZE     = 16;
    static constexpr uint32_t   MAX_SCREEN_SIZE     = 4096;
    static constexpr uint32_t   MIN_VISPLANES       = 2;
    static constexpr uint32_t   MAX_VISPLANES       = 1024;
    static constexpr uint32_t   MAX_SPAN_THREADS    = 64;
};
