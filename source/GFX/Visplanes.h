#pragma once

#include "DrawJobs.h"

BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// Contains two screen space Y coordinates (top and bottom).
// For visplanes this is the inclusive range of rows covered by the plane in a column.
//----------------------------------------------------------------------------------------------------------------------
struct ScreenYPair {
    uint16_t ty;        // Top y coordinate
    uint16_t by;        // Bottom y coordinate

    inline constexpr bool operator == (const ScreenYPair& other) const noexcept {
        return (ty == other.ty && by == other.by);
    }

    inline constexpr bool isUndefined() const noexcept {
        return (*this == UNDEFINED());
    }

    inline constexpr bool isDefined() const noexcept {
        return (!isUndefined());
    }

    static inline constexpr ScreenYPair UNDEFINED() noexcept {
        return ScreenYPair{ UINT16_MAX, 0 };
    }
};

//----------------------------------------------------------------------------------------------------------------------
// What makes two bits of floor or ceiling drawable as the same plane
//----------------------------------------------------------------------------------------------------------------------
struct VisplaneKey {
    float       height;             // Height of the floor or ceiling
    uint32_t    texId;              // Texture id
    uint32_t    lightLevel;         // Sector light level
    bool        bFloor;             // Floor or ceiling?

    inline bool operator == (const VisplaneKey& other) const noexcept {
        return (
            (height == other.height) &&
            (texId == other.texId) &&
            (lightLevel == other.lightLevel) &&
            (bFloor == other.bFloor)
        );
    }

    inline bool operator != (const VisplaneKey& other) const noexcept {
        return (!(*this == other));
    }
};

//----------------------------------------------------------------------------------------------------------------------
// Describes a floor or ceiling area to be drawn
//----------------------------------------------------------------------------------------------------------------------
struct Visplane {
    VisplaneKey                 key;
    std::vector<ScreenYPair>    cols;           // Rows covered in each screen column
    int32_t                     minX;           // Minimum x, max x
    int32_t                     maxX;
    uint32_t                    sequence;       // When the plane was created: lower is older
};

//----------------------------------------------------------------------------------------------------------------------
// Gathers floor and ceiling coverage during BSP traversal so it can be drawn as horizontal spans afterwards.
//
// Notes:
//  (1) There is a limit on the number of live planes. When a new plane is needed and the pool is full, the oldest live
//      plane is flushed: its spans are emitted as draw jobs straight away and its slot is reused.
//      Every covered pixel still gets drawn exactly once, only the batching gets worse.
//  (2) Plane storage is kept between frames to avoid reallocating the column arrays every frame.
//----------------------------------------------------------------------------------------------------------------------
class VisplanePool {
public:
    VisplanePool() noexcept;

    void reset(const uint32_t screenWidth, const uint32_t screenHeight, const uint32_t maxPlanes) noexcept;

    // Find a live plane with the given key that has column 'start' free and extend it to cover up to 'stop'.
    // If there is none then a new plane is made, which may flush the oldest plane into 'flushedJobs'.
    // Returns the index of the plane in the live set.
    uint32_t findPlane(
        const VisplaneKey& key,
        const int32_t start,
        const int32_t stop,
        std::vector<DrawJob>& flushedJobs
    ) noexcept;

    // Merge live planes with the same key whose used columns do not overlap
    void mergeCompatiblePlanes() noexcept;

    // Emit the spans of every live plane as draw jobs and empty the pool
    void emitAllSpans(std::vector<DrawJob>& jobsOut) noexcept;

    inline uint32_t getNumLivePlanes() const noexcept { return mNumLivePlanes; }
    inline uint32_t getMaxPlanes() const noexcept { return mMaxPlanes; }
    inline uint32_t getNumPlanesCreated() const noexcept { return mNumPlanesCreated; }
    inline uint32_t getNumOverflowFlushes() const noexcept { return mNumOverflowFlushes; }
    inline uint32_t getNumMerges() const noexcept { return mNumMerges; }

    inline Visplane& getPlane(const uint32_t planeIdx) noexcept {
        ASSERT(planeIdx < mNumLivePlanes);
        return mPlanes[planeIdx];
    }

    inline const Visplane& getPlane(const uint32_t planeIdx) const noexcept {
        ASSERT(planeIdx < mNumLivePlanes);
        return mPlanes[planeIdx];
    }

    // Turn the top and bottom transitions of a plane's columns into horizontal spans
    void emitPlaneSpans(const Visplane& plane, std::vector<DrawJob>& jobsOut) noexcept;

private:
    void initPlane(Visplane& plane, const VisplaneKey& key, const int32_t start, const int32_t stop) noexcept;
    uint32_t findOldestPlane() const noexcept;

    uint32_t                mScreenWidth;
    uint32_t                mScreenHeight;
    uint32_t                mMaxPlanes;
    uint32_t                mNumLivePlanes;
    uint32_t                mNextSequence;
    uint32_t                mNumPlanesCreated;
    uint32_t                mNumOverflowFlushes;
    uint32_t                mNumMerges;
    std::vector<Visplane>   mPlanes;            // Only the first 'mNumLivePlanes' are in use
    std::vector<int32_t>    mSpanStarts;        // Start column for the span currently open on each row
};

END_NAMESPACE(Renderer)
