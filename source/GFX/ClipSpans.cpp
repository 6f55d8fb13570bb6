#include "ClipSpans.h"

#include <algorithm>

BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// Find the first stored range which ends at or after the given column.
// The right sentinel ends beyond any on screen column, so this always finds something.
//----------------------------------------------------------------------------------------------------------------------
template <class RangeIter>
static RangeIter findFirstRangeEndingAtOrAfter(const RangeIter beg, const RangeIter end, const int32_t x) noexcept {
    return std::lower_bound(
        beg,
        end,
        x,
        [](const ClipRange& range, const int32_t value) noexcept {
            return (range.last < value);
        }
    );
}

ClipSpans::ClipSpans() noexcept
    : mScreenWidth(0)
    , mScreenHeight(0)
    , mRanges()
    , mColumnClips()
{
    reset(0, 0);
}

void ClipSpans::reset(const uint32_t screenWidth, const uint32_t screenHeight) noexcept {
    mScreenWidth = screenWidth;
    mScreenHeight = screenHeight;

    mRanges.clear();
    mRanges.push_back(ClipRange{ -SENTINEL_EXTENT, -1 });
    mRanges.push_back(ClipRange{ (int32_t) screenWidth, SENTINEL_EXTENT });

    mColumnClips.clear();
    mColumnClips.resize(screenWidth, SegClip{ -1, (int16_t) screenHeight });
}

void ClipSpans::clipToVisible(const int32_t x1, const int32_t x2, std::vector<ClipRange>& visibleRanges) const noexcept {
    visibleRanges.clear();

    if (x1 > x2)
        return;

    int32_t start = x1;
    auto rangeIter = findFirstRangeEndingAtOrAfter(mRanges.begin(), mRanges.end(), start);

    while (rangeIter != mRanges.end()) {
        // Anything before this occluded range is visible
        if (rangeIter->first > start) {
            const int32_t visibleEnd = std::min(x2, rangeIter->first - 1);
            visibleRanges.push_back(ClipRange{ start, visibleEnd });
        }

        start = rangeIter->last + 1;

        if (start > x2)
            break;

        ++rangeIter;
    }
}

void ClipSpans::markSolid(const int32_t x1, const int32_t x2) noexcept {
    if (x1 > x2)
        return;

    // Find the first range that the new one overlaps or touches
    auto rangeIter = findFirstRangeEndingAtOrAfter(mRanges.begin(), mRanges.end(), x1 - 1);

    if (rangeIter == mRanges.end() || rangeIter->first > x2 + 1) {
        // Doesn't touch anything: a brand new range
        mRanges.insert(rangeIter, ClipRange{ x1, x2 });
        return;
    }

    // Grow the range found and swallow any following ranges which the new one now reaches
    rangeIter->first = std::min(rangeIter->first, x1);
    int32_t newLast = std::max(rangeIter->last, x2);
    auto nextIter = rangeIter + 1;

    while ((nextIter != mRanges.end()) && (nextIter->first <= newLast + 1)) {
        newLast = std::max(newLast, nextIter->last);
        ++nextIter;
    }

    rangeIter->last = newLast;
    mRanges.erase(rangeIter + 1, nextIter);
}

bool ClipSpans::isFullyOccluded(const int32_t x1, const int32_t x2) const noexcept {
    const auto rangeIter = findFirstRangeEndingAtOrAfter(mRanges.begin(), mRanges.end(), x1);

    if (rangeIter == mRanges.end())
        return false;

    return ((rangeIter->first <= x1) && (rangeIter->last >= x2));
}

bool ClipSpans::isScreenFull() const noexcept {
    return ((mRanges.front().first <= 0) && (mRanges.front().last >= (int32_t) mScreenWidth - 1));
}

void ClipSpans::setColumnClip(const int32_t x, const int32_t top, const int32_t bottom) noexcept {
    ASSERT((x >= 0) && ((uint32_t) x < mScreenWidth));
    SegClip& clip = mColumnClips[(uint32_t) x];

    if (clip.isClosed())
        return;

    clip.top = (int16_t) std::max((int32_t) clip.top, top);
    clip.bottom = (int16_t) std::min((int32_t) clip.bottom, bottom);

    if (clip.isClosed()) {
        markSolid(x, x);
    }
}

END_NAMESPACE(Renderer)
