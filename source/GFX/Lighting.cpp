#include "Lighting.h"

#include <algorithm>
#include <cmath>

BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// Light diminishing tables, one entry per light level.
// These never change so they are built once on first use and shared by every frame.
//----------------------------------------------------------------------------------------------------------------------
struct LightTables {
    float lightMins[NUM_LIGHT_LEVELS];
    float lightSubs[NUM_LIGHT_LEVELS];
    float lightCoefs[NUM_LIGHT_LEVELS];
};

static LightTables makeLightTables() noexcept {
    constexpr float LIGHT_MIN_PERCENT = 1.0f / 5.0f;
    constexpr float MAX_BRIGHT_RANGE_SCALE = 1.0f;
    constexpr float LIGHT_COEF_BASE = 16.0f;
    constexpr float LIGHT_COEF_ADJUST_FACTOR = 13.0f;

    LightTables tables = {};

    for (uint32_t i = 0; i < NUM_LIGHT_LEVELS; ++i) {
        const float lightLevel = (float) i / 255.0f;
        const float maxBrightRange = lightLevel * MAX_BRIGHT_RANGE_SCALE;

        tables.lightMins[i] = (float) i * LIGHT_MIN_PERCENT;
        tables.lightSubs[i] = maxBrightRange;
        tables.lightCoefs[i] = LIGHT_COEF_BASE - lightLevel * LIGHT_COEF_ADJUST_FACTOR;
    }

    return tables;
}

static const LightTables& getLightTables() noexcept {
    static const LightTables gLightTables = makeLightTables();
    return gLightTables;
}

float LightParams::getLightMulForDist(const float dist) const noexcept {
    const float distFactorLinear = std::max(dist - lightSub, 0.0f);
    const float distFactorQuad = std::sqrt(distFactorLinear);
    const float lightDiminish = distFactorQuad * lightCoef;

    float lightValue = MAX_LIGHT_VALUE - lightDiminish;
    lightValue = std::max(lightValue, lightMin);
    lightValue = std::min(lightValue, lightMax);

    const float lightMul = lightValue * (1.0f / MAX_LIGHT_VALUE);
    return std::max(lightMul, MIN_LIGHT_MUL);
}

LightParams getLightParams(const uint32_t sectorLightLevel) noexcept {
    const LightTables& tables = getLightTables();
    const uint32_t lightMax = std::min(sectorLightLevel, NUM_LIGHT_LEVELS - 1);

    LightParams out;
    out.lightMin = tables.lightMins[lightMax];
    out.lightMax = (float) lightMax;
    out.lightSub = tables.lightSubs[lightMax];
    out.lightCoef = tables.lightCoefs[lightMax];

    return out;
}

END_NAMESPACE(Renderer)
