#pragma once

#include "Base/Macros.h"
#include <cstdint>

BEGIN_NAMESPACE(Renderer)

static constexpr float      MAX_LIGHT_VALUE     = 255.0f;
static constexpr float      MIN_LIGHT_MUL       = 0.020f;       // Minimum allowed multiplier due to light
static constexpr uint32_t   NUM_LIGHT_LEVELS    = 256;

//----------------------------------------------------------------------------------------------------------------------
// Describes lighting params for an input light level
//----------------------------------------------------------------------------------------------------------------------
struct LightParams {
    float   lightMin;       // Minimum light value allowed
    float   lightMax;       // Maximum light value allowed
    float   lightSub;       // Subtract this as part of the light diminishing calculations
    float   lightCoef;      // Controls the falloff for light diminishing

    // For these light parameters, gives a light multiplier that can be applied to textures etc.
    // after doing light diminishing effects. Requires the distance of the object from the camera.
    // Never increases as the distance increases.
    float getLightMulForDist(const float dist) const noexcept;
};

// Get the light parameters for a sector light level (levels above 255 are treated as 255)
LightParams getLightParams(const uint32_t sectorLightLevel) noexcept;

END_NAMESPACE(Renderer)
