#pragma once

#include "Base/Macros.h"
#include <cstdint>
#include <vector>

BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// An inclusive range of screen columns
//----------------------------------------------------------------------------------------------------------------------
struct ClipRange {
    int32_t first;
    int32_t last;

    inline constexpr bool operator == (const ClipRange& other) const noexcept {
        return ((first == other.first) && (last == other.last));
    }

    inline constexpr bool operator != (const ClipRange& other) const noexcept {
        return (!(*this == other));
    }
};

//----------------------------------------------------------------------------------------------------------------------
// Clip bounds (top & bottom) for a screen column.
// Rows 'top' and above are occluded, as are rows 'bottom' and below.
//----------------------------------------------------------------------------------------------------------------------
struct SegClip {
    int16_t top;
    int16_t bottom;

    inline constexpr bool isClosed() const noexcept {
        return (top + 1 >= bottom);
    }
};

//----------------------------------------------------------------------------------------------------------------------
// Tracks which parts of the screen are already covered by solid walls during BSP traversal.
//
// Notes:
//  (1) Fully occluded columns are kept as a sorted list of disjoint column ranges.
//      Two sentinel ranges (one off each side of the screen) mean a lookup never runs off the end of the list.
//  (2) Adjacent or overlapping ranges are always merged, so the stored ranges are the exact union of every range ever
//      marked, no matter what order they were marked in.
//  (3) Each column also has a vertical clip which narrows as portal walls are drawn in front of it.
//      When that clip closes the column it gets added to the occluded ranges.
//----------------------------------------------------------------------------------------------------------------------
class ClipSpans {
public:
    static constexpr int32_t SENTINEL_EXTENT = 0x4000;

    ClipSpans() noexcept;

    void reset(const uint32_t screenWidth, const uint32_t screenHeight) noexcept;

    // Gives the parts of the given column range which are not yet occluded, in left to right order
    void clipToVisible(const int32_t x1, const int32_t x2, std::vector<ClipRange>& visibleRanges) const noexcept;

    // Mark the given column range as fully occluded
    void markSolid(const int32_t x1, const int32_t x2) noexcept;

    bool isFullyOccluded(const int32_t x1, const int32_t x2) const noexcept;
    bool isScreenFull() const noexcept;

    inline const std::vector<ClipRange>& getRanges() const noexcept { return mRanges; }
    inline uint32_t getScreenWidth() const noexcept { return mScreenWidth; }
    inline uint32_t getScreenHeight() const noexcept { return mScreenHeight; }

    inline const SegClip& getColumnClip(const int32_t x) const noexcept {
        ASSERT((x >= 0) && ((uint32_t) x < mScreenWidth));
        return mColumnClips[(uint32_t) x];
    }

    // Narrow the vertical clip for a column: marks the column solid if it closes
    void setColumnClip(const int32_t x, const int32_t top, const int32_t bottom) noexcept;

    // Fully occlude a column (a solid wall covers it)
    inline void closeColumn(const int32_t x) noexcept {
        setColumnClip(x, (int32_t) mScreenHeight, -1);
    }

private:
    uint32_t                mScreenWidth;
    uint32_t                mScreenHeight;
    std::vector<ClipRange>  mRanges;
    std::vector<SegClip>    mColumnClips;
};

END_NAMESPACE(Renderer)
