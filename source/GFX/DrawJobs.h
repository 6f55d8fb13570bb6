#pragma once

#include "Base/Macros.h"
#include <cstdint>
#include <vector>

BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// A vertical strip of wall to be drawn
//----------------------------------------------------------------------------------------------------------------------
struct WallColumnJob {
    uint16_t    x;
    uint16_t    yTop;               // Inclusive row range
    uint16_t    yBottom;
    uint16_t    _unused;
    uint32_t    texId;
    float       texU;               // Texture column
    float       texV;               // Texture row at the center of the top pixel
    float       texVStep;           // Texture rows to step for each screen row
    float       lightMul;           // Multiply value for lighting
};

//----------------------------------------------------------------------------------------------------------------------
// A horizontal row of floor or ceiling to be drawn
//----------------------------------------------------------------------------------------------------------------------
struct FlatSpanJob {
    uint16_t    y;
    uint16_t    x1;                 // Inclusive column range
    uint16_t    x2;
    uint16_t    _unused;
    uint32_t    texId;
    uint32_t    lightLevel;         // Sector light level: diminished with the depth of the row
    float       planeZ;             // World height of the plane
};

//----------------------------------------------------------------------------------------------------------------------
// Something for the rasterizers to draw.
// A plain tagged union: the pixels covered by any two jobs in the same frame never overlap.
//----------------------------------------------------------------------------------------------------------------------
struct DrawJob {
    enum class Kind : uint8_t {
        WallColumn,
        FloorSpan,
        CeilingSpan
    };

    Kind kind;

    union {
        WallColumnJob   wall;
        FlatSpanJob     span;
    };

    inline bool isSpan() const noexcept {
        return (kind != Kind::WallColumn);
    }

    static inline DrawJob makeWallColumn(const WallColumnJob& wall) noexcept {
        DrawJob job;
        job.kind = Kind::WallColumn;
        job.wall = wall;
        return job;
    }

    static inline DrawJob makeSpan(const bool bFloor, const FlatSpanJob& span) noexcept {
        DrawJob job;
        job.kind = (bFloor) ? Kind::FloorSpan : Kind::CeilingSpan;
        job.span = span;
        return job;
    }
};

//----------------------------------------------------------------------------------------------------------------------
// Counters for one frame
//----------------------------------------------------------------------------------------------------------------------
struct FrameStats {
    uint32_t                numWallColumns = 0;         // Wall column jobs emitted
    uint32_t                numSpans = 0;               // Floor and ceiling span jobs emitted
    uint32_t                numVisplanes = 0;           // Visplanes created (including ones that reused a flushed slot)
    uint32_t                numMergedVisplanes = 0;     // Visplanes merged away before span extraction
    uint32_t                numOverflowFlushes = 0;     // Visplanes flushed early because the pool was full
    uint32_t                numMissingTextures = 0;     // References to textures that are not in the texture bank
    uint32_t                numCulledNodes = 0;         // BSP children skipped because their bounding box was not visible
    uint32_t                numSegsDrawn = 0;           // Segs that had at least one visible column
    std::vector<uint32_t>   subsectorOrder;             // Subsectors in the order they were visited

    void clear() noexcept;
};

END_NAMESPACE(Renderer)
