#include "Visplanes.h"

#include <algorithm>

BEGIN_NAMESPACE(Renderer)

VisplanePool::VisplanePool() noexcept
    : mScreenWidth(0)
    , mScreenHeight(0)
    , mMaxPlanes(0)
    , mNumLivePlanes(0)
    , mNextSequence(0)
    , mNumPlanesCreated(0)
    , mNumOverflowFlushes(0)
    , mNumMerges(0)
    , mPlanes()
    , mSpanStarts()
{
}

void VisplanePool::reset(const uint32_t screenWidth, const uint32_t screenHeight, const uint32_t maxPlanes) noexcept {
    ASSERT(maxPlanes >= 1);

    // If the screen size changed then the column arrays of all saved planes need to be remade
    if ((screenWidth != mScreenWidth) || (screenHeight != mScreenHeight)) {
        mPlanes.clear();
    }

    mScreenWidth = screenWidth;
    mScreenHeight = screenHeight;
    mMaxPlanes = maxPlanes;
    mNumLivePlanes = 0;
    mNextSequence = 0;
    mNumPlanesCreated = 0;
    mNumOverflowFlushes = 0;
    mNumMerges = 0;

    if (mPlanes.size() > maxPlanes) {
        mPlanes.resize(maxPlanes);
    }

    mSpanStarts.clear();
    mSpanStarts.resize(screenHeight, 0);
}

uint32_t VisplanePool::findPlane(
    const VisplaneKey& key,
    const int32_t start,
    const int32_t stop,
    std::vector<DrawJob>& flushedJobs
) noexcept {
    ASSERT((start >= 0) && (start <= stop) && ((uint32_t) stop < mScreenWidth));

    // Same plane as before and not defined yet at the start column? If so then extend it.
    for (uint32_t planeIdx = 0; planeIdx < mNumLivePlanes; ++planeIdx) {
        Visplane& plane = mPlanes[planeIdx];

        if ((plane.key == key) && plane.cols[(uint32_t) start].isUndefined()) {
            plane.minX = std::min(plane.minX, start);       // Mark the new edges
            plane.maxX = std::max(plane.maxX, stop);
            return planeIdx;
        }
    }

    // Make a new plane: if the pool is full then flush the oldest plane first and reuse its slot
    uint32_t newPlaneIdx;

    if (mNumLivePlanes >= mMaxPlanes) {
        newPlaneIdx = findOldestPlane();
        emitPlaneSpans(mPlanes[newPlaneIdx], flushedJobs);
        ++mNumOverflowFlushes;
    } else {
        newPlaneIdx = mNumLivePlanes;
        ++mNumLivePlanes;

        if (mPlanes.size() < mNumLivePlanes) {
            mPlanes.emplace_back();
        }
    }

    initPlane(mPlanes[newPlaneIdx], key, start, stop);
    ++mNumPlanesCreated;
    return newPlaneIdx;
}

void VisplanePool::mergeCompatiblePlanes() noexcept {
    for (uint32_t destIdx = 0; destIdx < mNumLivePlanes; ++destIdx) {
        uint32_t srcIdx = destIdx + 1;

        while (srcIdx < mNumLivePlanes) {
            Visplane& dest = mPlanes[destIdx];
            Visplane& src = mPlanes[srcIdx];

            if (src.key != dest.key) {
                ++srcIdx;
                continue;
            }

            // Can only merge if no column is used by both planes
            const int32_t overlapBeg = std::max(dest.minX, src.minX);
            const int32_t overlapEnd = std::min(dest.maxX, src.maxX);
            bool bDisjoint = true;

            for (int32_t x = overlapBeg; x <= overlapEnd; ++x) {
                if (dest.cols[(uint32_t) x].isDefined() && src.cols[(uint32_t) x].isDefined()) {
                    bDisjoint = false;
                    break;
                }
            }

            if (!bDisjoint) {
                ++srcIdx;
                continue;
            }

            for (int32_t x = src.minX; x <= src.maxX; ++x) {
                const ScreenYPair srcCol = src.cols[(uint32_t) x];

                if (srcCol.isDefined()) {
                    dest.cols[(uint32_t) x] = srcCol;
                }
            }

            dest.minX = std::min(dest.minX, src.minX);
            dest.maxX = std::max(dest.maxX, src.maxX);
            ++mNumMerges;

            // Remove the source plane, keeping the order of the remaining planes
            std::rotate(mPlanes.begin() + srcIdx, mPlanes.begin() + srcIdx + 1, mPlanes.begin() + mNumLivePlanes);
            --mNumLivePlanes;
        }
    }
}

void VisplanePool::emitAllSpans(std::vector<DrawJob>& jobsOut) noexcept {
    for (uint32_t planeIdx = 0; planeIdx < mNumLivePlanes; ++planeIdx) {
        emitPlaneSpans(mPlanes[planeIdx], jobsOut);
    }

    mNumLivePlanes = 0;
}

//----------------------------------------------------------------------------------------------------------------------
// Draw a plane by scanning its columns.
// The columns hold top and bottom Y's for the plane: walking them from left to right a span opens on a row when the
// row becomes covered and closes when it stops being covered. The column after the last one is treated as empty so
// that every open span gets closed.
//----------------------------------------------------------------------------------------------------------------------
void VisplanePool::emitPlaneSpans(const Visplane& plane, std::vector<DrawJob>& jobsOut) noexcept {
    const bool bFloor = plane.key.bFloor;

    auto emitSpan = [&](const int32_t y, const int32_t x2) noexcept {
        FlatSpanJob span = {};
        span.y = (uint16_t) y;
        span.x1 = (uint16_t) mSpanStarts[(uint32_t) y];
        span.x2 = (uint16_t) x2;
        span.texId = plane.key.texId;
        span.lightLevel = plane.key.lightLevel;
        span.planeZ = plane.key.height;
        jobsOut.push_back(DrawJob::makeSpan(bFloor, span));
    };

    // An undefined column has top > bottom, so it covers no rows
    int32_t prevTop = UINT16_MAX;
    int32_t prevBottom = 0;

    for (int32_t x = plane.minX; x <= plane.maxX + 1; ++x) {
        int32_t newTop = UINT16_MAX;
        int32_t newBottom = 0;

        if (x <= plane.maxX) {
            const ScreenYPair col = plane.cols[(uint32_t) x];
            newTop = col.ty;
            newBottom = col.by;
        }

        if ((newTop == prevTop) && (newBottom == prevBottom))
            continue;

        // Close rows that are covered in the previous column but not this one
        int32_t closeTop = prevTop;
        int32_t closeBottom = prevBottom;

        while ((closeTop < newTop) && (closeTop <= closeBottom)) {
            emitSpan(closeTop, x - 1);
            ++closeTop;
        }

        while ((closeBottom > newBottom) && (closeBottom >= closeTop)) {
            emitSpan(closeBottom, x - 1);
            --closeBottom;
        }

        // Open rows that are covered in this column but not the previous one
        int32_t openTop = newTop;
        int32_t openBottom = newBottom;

        while ((openTop < closeTop) && (openTop <= openBottom)) {
            mSpanStarts[(uint32_t) openTop] = x;
            ++openTop;
        }

        while ((openBottom > closeBottom) && (openBottom >= openTop)) {
            mSpanStarts[(uint32_t) openBottom] = x;
            --openBottom;
        }

        prevTop = newTop;
        prevBottom = newBottom;
    }
}

void VisplanePool::initPlane(Visplane& plane, const VisplaneKey& key, const int32_t start, const int32_t stop) noexcept {
    plane.key = key;
    plane.cols.assign(mScreenWidth, ScreenYPair::UNDEFINED());
    plane.minX = start;
    plane.maxX = stop;
    plane.sequence = mNextSequence;
    ++mNextSequence;
}

uint32_t VisplanePool::findOldestPlane() const noexcept {
    ASSERT(mNumLivePlanes > 0);
    uint32_t oldestIdx = 0;

    for (uint32_t planeIdx = 1; planeIdx < mNumLivePlanes; ++planeIdx) {
        if (mPlanes[planeIdx].sequence < mPlanes[oldestIdx].sequence) {
            oldestIdx = planeIdx;
        }
    }

    return oldestIdx;
}

END_NAMESPACE(Renderer)
