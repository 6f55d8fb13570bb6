#pragma once

//----------------------------------------------------------------------------------------------------------------------
// Data structures and functions internal to the renderer.
// Nothing here is used by outside code, except for tests of the individual renderer stages.
//----------------------------------------------------------------------------------------------------------------------
#include "Lighting.h"
#include "Renderer.h"

struct Texture;

namespace Renderer {
    //==================================================================================================================
    // Data structures
    //==================================================================================================================

    //------------------------------------------------------------------------------------------------------------------
    // Everything which stays the same for the whole frame: what is being drawn and where it is seen from
    //------------------------------------------------------------------------------------------------------------------
    struct RenderView {
        const LevelGeometry&    level;
        const TextureBank&      textures;
        const Camera&           camera;
    };

    //------------------------------------------------------------------------------------------------------------------
    // A point in view space: 'lateral' is distance to the right of the view direction, 'depth' into the screen
    //------------------------------------------------------------------------------------------------------------------
    struct ViewPoint {
        float lateral;
        float depth;
    };

    //------------------------------------------------------------------------------------------------------------------
    // Describes a seg to be drawn column by column.
    // Set up once per seg so each column only has to do the work which actually varies across the seg.
    //------------------------------------------------------------------------------------------------------------------
    struct SegDrawInfo {
        const Seg*      pSeg;
        const Sector*   pFrontSector;
        const Sector*   pBackSector;        // Null for one sided walls

        ViewPoint       p1;                 // Seg end points in view space (not near clipped)
        ViewPoint       p2;

        float           texUOffset;         // Texture x coordinate at the start of the seg
        float           texVOffset;         // Added to all texture y coordinates
        LightParams     lightParams;        // Light diminishing for the front sector
        float           lightMul;           // Extra light multiplier for the seg (fake contrast)

        // Solid segs close every column they cover. This is all one sided walls and also two sided walls with a
        // back sector that can't be seen into (e.g a closed door).
        bool            bSolid;

        // Whether floor and ceiling coverage gets recorded for the columns of this seg
        bool            bMarkFloor;
        bool            bMarkCeiling;

        // What wall pieces to draw: the middle wall is only ever drawn for one sided walls
        bool            bDrawUpper;
        bool            bDrawLower;
        bool            bDrawMid;

        uint32_t        upperTexId;
        uint32_t        lowerTexId;
        uint32_t        midTexId;

        float           upperTexTopZ;       // World height where texture row '0' is for each wall piece
        float           lowerTexTopZ;
        float           midTexTopZ;

        VisplaneKey     floorKey;
        VisplaneKey     ceilingKey;
    };

    //==================================================================================================================
    // BSP traversal: defined in Renderer_BspTraversal.cpp
    //==================================================================================================================

    // Traverse the BSP tree front to back, emitting wall columns and recording floor/ceiling coverage
    void doBspTraversal(const RenderView& view, FrameContext& frame) noexcept;

    // Could anything inside the given bounding box be visible?
    bool isBBoxVisible(const float bbox[BOXCOUNT], const Camera& camera, const ClipSpans& clipSpans) noexcept;

    // Clip and project a single seg and then pass the visible parts of it to the wall column code
    void addSegToFrame(const RenderView& view, const Seg& seg, FrameContext& frame) noexcept;

    //==================================================================================================================
    // Wall preparation: defined in Renderer_WallPrep.cpp
    //==================================================================================================================
    void prepareSegDraw(
        const RenderView& view,
        const Seg& seg,
        const ViewPoint& p1,
        const ViewPoint& p2,
        SegDrawInfo& info,
        FrameStats& stats
    ) noexcept;

    // Emit wall columns and record floor/ceiling coverage for the inclusive column range of a prepared seg
    void emitSegColumns(
        const RenderView& view,
        const SegDrawInfo& info,
        const int32_t x1,
        const int32_t x2,
        FrameContext& frame
    ) noexcept;

    // Where the view ray through the center of column 'x' hits the seg: fraction along it and view depth
    void getSegColumnHit(
        const SegDrawInfo& info,
        const Camera& camera,
        const int32_t x,
        float& outT,
        float& outDepth
    ) noexcept;

    // The first pixel row whose center is at or below the given screen y (clamped to a sane range)
    int32_t screenYToRow(const float screenY) noexcept;

    //==================================================================================================================
    // Rasterization: defined in Renderer_WallDraw.cpp and Renderer_FloorDraw.cpp
    //==================================================================================================================
    void drawWallColumn(const WallColumnJob& column, const TextureBank& textures, ImageData& frameBuffer) noexcept;
    void drawFlatSpan(const FlatSpanJob& span, const Camera& camera, const TextureBank& textures, ImageData& frameBuffer) noexcept;

    // Draw all of the given jobs: spans are split over 'numSpanThreads' threads
    void drawAllJobs(
        const RenderView& view,
        const std::vector<DrawJob>& jobs,
        const uint32_t numSpanThreads,
        ImageData& frameBuffer
    ) noexcept;
}
