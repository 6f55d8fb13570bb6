#include "GFX/Visplanes.h"

#include <gtest/gtest.h>
#include <vector>

using namespace Renderer;

namespace {

constexpr uint32_t SCREEN_W = 64;
constexpr uint32_t SCREEN_H = 48;

VisplaneKey makeKey(const float height, const uint32_t texId = 1, const bool bFloor = true) {
    return VisplaneKey{ height, texId, 160, bFloor };
}

// Set the rows covered by a plane for a range of columns
void fillColumns(Visplane& plane, const int32_t x1, const int32_t x2, const uint16_t top, const uint16_t bottom) {
    for (int32_t x = x1; x <= x2; ++x) {
        plane.cols[(uint32_t) x] = ScreenYPair{ top, bottom };
    }
}

// Count how many times each pixel is covered by the given span jobs
std::vector<uint32_t> getSpanCoverage(const std::vector<DrawJob>& jobs) {
    std::vector<uint32_t> coverage(SCREEN_W * SCREEN_H, 0);

    for (const DrawJob& job : jobs) {
        EXPECT_TRUE(job.isSpan());
        EXPECT_LE(job.span.x1, job.span.x2);

        for (uint32_t x = job.span.x1; x <= job.span.x2; ++x) {
            ++coverage[job.span.y * SCREEN_W + x];
        }
    }

    return coverage;
}

}  // namespace

TEST(VisplanesTest, SameKeyWithFreeColumnReusesThePlane) {
    VisplanePool pool;
    pool.reset(SCREEN_W, SCREEN_H, 8);
    std::vector<DrawJob> flushed;

    const uint32_t first = pool.findPlane(makeKey(0.0f), 0, 9, flushed);
    fillColumns(pool.getPlane(first), 0, 9, 30, 47);

    const uint32_t second = pool.findPlane(makeKey(0.0f), 10, 20, flushed);
    EXPECT_EQ(second, first);
    EXPECT_EQ(pool.getPlane(first).minX, 0);
    EXPECT_EQ(pool.getPlane(first).maxX, 20);
    EXPECT_EQ(pool.getNumLivePlanes(), 1u);

    // Column already used: needs another plane
    const uint32_t third = pool.findPlane(makeKey(0.0f), 5, 9, flushed);
    EXPECT_NE(third, first);
    EXPECT_EQ(pool.getNumLivePlanes(), 2u);

    // Any difference in the key also needs another plane
    pool.findPlane(makeKey(0.0f, 2), 30, 31, flushed);
    pool.findPlane(makeKey(0.0f, 1, false), 30, 31, flushed);
    pool.findPlane(makeKey(8.0f), 30, 31, flushed);
    EXPECT_EQ(pool.getNumLivePlanes(), 5u);
    EXPECT_TRUE(flushed.empty());
}

TEST(VisplanesTest, LivePlaneCountNeverExceedsTheCap) {
    VisplanePool pool;
    pool.reset(SCREEN_W, SCREEN_H, 4);
    std::vector<DrawJob> flushed;

    for (uint32_t i = 0; i < 20; ++i) {
        const uint32_t planeIdx = pool.findPlane(makeKey((float) i), 0, 3, flushed);
        fillColumns(pool.getPlane(planeIdx), 0, 3, (uint16_t) i, (uint16_t) i);
        EXPECT_LE(pool.getNumLivePlanes(), 4u);
    }

    EXPECT_EQ(pool.getNumLivePlanes(), 4u);
    EXPECT_EQ(pool.getNumOverflowFlushes(), 16u);
    EXPECT_EQ(pool.getNumPlanesCreated(), 20u);

    // Each flushed plane covered one row of 4 columns: one span each
    EXPECT_EQ(flushed.size(), 16u);
}

TEST(VisplanesTest, OverflowFlushesTheOldestPlaneFirst) {
    VisplanePool pool;
    pool.reset(SCREEN_W, SCREEN_H, 2);
    std::vector<DrawJob> flushed;

    for (uint32_t i = 0; i < 3; ++i) {
        const uint32_t planeIdx = pool.findPlane(makeKey((float) i), 0, 0, flushed);
        fillColumns(pool.getPlane(planeIdx), 0, 0, (uint16_t)(10 + i), (uint16_t)(10 + i));
    }

    ASSERT_EQ(flushed.size(), 1u);
    EXPECT_EQ(flushed[0].span.y, 10u);
    EXPECT_FLOAT_EQ(flushed[0].span.planeZ, 0.0f);
}

TEST(VisplanesTest, OverflowNeverDropsPixels) {
    // Lots of planes in a checker pattern of small blocks, with and without a tight cap
    std::vector<uint32_t> coverageByCap[2];
    const uint32_t caps[2] = { 2, 128 };

    for (uint32_t capIdx = 0; capIdx < 2; ++capIdx) {
        VisplanePool pool;
        pool.reset(SCREEN_W, SCREEN_H, caps[capIdx]);
        std::vector<DrawJob> jobs;

        for (uint32_t blockY = 0; blockY < SCREEN_H / 8; ++blockY) {
            for (uint32_t blockX = 0; blockX < SCREEN_W / 8; ++blockX) {
                const int32_t x1 = (int32_t)(blockX * 8);
                const uint32_t planeIdx = pool.findPlane(makeKey((float)((blockX + blockY) % 5)), x1, x1 + 7, jobs);
                Visplane& plane = pool.getPlane(planeIdx);

                // A column is only ever given to a plane once
                if (plane.cols[(uint32_t) x1].isUndefined()) {
                    fillColumns(plane, x1, x1 + 7, (uint16_t)(blockY * 8), (uint16_t)(blockY * 8 + 7));
                }
            }
        }

        pool.mergeCompatiblePlanes();
        pool.emitAllSpans(jobs);
        EXPECT_EQ(pool.getNumLivePlanes(), 0u);
        coverageByCap[capIdx] = getSpanCoverage(jobs);

        if (caps[capIdx] == 2) {
            EXPECT_GT(pool.getNumOverflowFlushes(), 0u);
        }
    }

    for (const uint32_t count : coverageByCap[0]) {
        EXPECT_LE(count, 1u);
    }

    EXPECT_EQ(coverageByCap[0], coverageByCap[1]);
}

TEST(VisplanesTest, MergeJoinsDisjointPlanesWithTheSameKey) {
    VisplanePool pool;
    pool.reset(SCREEN_W, SCREEN_H, 8);
    std::vector<DrawJob> flushed;

    const uint32_t a = pool.findPlane(makeKey(0.0f), 0, 9, flushed);
    fillColumns(pool.getPlane(a), 0, 9, 20, 30);

    // Same key, but starts in a used column so it is a new plane. It shares columns with plane 'a' so can't merge.
    const uint32_t b = pool.findPlane(makeKey(0.0f), 0, 9, flushed);
    fillColumns(pool.getPlane(b), 5, 9, 40, 41);

    // Another new plane with the same key: it only ends up using columns that 'a' doesn't
    const uint32_t c = pool.findPlane(makeKey(0.0f), 5, 15, flushed);
    fillColumns(pool.getPlane(c), 10, 15, 25, 35);
    EXPECT_NE(c, a);
    EXPECT_NE(c, b);

    // Different key entirely
    const uint32_t d = pool.findPlane(makeKey(16.0f), 20, 22, flushed);
    fillColumns(pool.getPlane(d), 20, 22, 1, 2);

    std::vector<DrawJob> unmergedJobs;
    {
        VisplanePool copy = pool;
        copy.emitAllSpans(unmergedJobs);
    }

    ASSERT_EQ(pool.getNumLivePlanes(), 4u);
    pool.mergeCompatiblePlanes();
    EXPECT_EQ(pool.getNumLivePlanes(), 3u);
    EXPECT_EQ(pool.getNumMerges(), 1u);
    EXPECT_LE(pool.getNumLivePlanes(), pool.getMaxPlanes());

    const Visplane& merged = pool.getPlane(a);
    EXPECT_EQ(merged.minX, 0);
    EXPECT_EQ(merged.maxX, 15);
    EXPECT_EQ(merged.cols[12].ty, 25u);

    // The covered pixels are exactly the same as before merging
    std::vector<DrawJob> mergedJobs;
    pool.emitAllSpans(mergedJobs);
    EXPECT_EQ(getSpanCoverage(mergedJobs), getSpanCoverage(unmergedJobs));
    EXPECT_LT(mergedJobs.size(), unmergedJobs.size());
}

TEST(VisplanesTest, SpansFollowColumnRowRanges) {
    VisplanePool pool;
    pool.reset(SCREEN_W, SCREEN_H, 8);
    std::vector<DrawJob> jobs;

    // Rows 10-12 in columns 0-3, then rows 11-11 in columns 4-5
    const uint32_t planeIdx = pool.findPlane(makeKey(0.0f, 7), 0, 5, jobs);
    fillColumns(pool.getPlane(planeIdx), 0, 3, 10, 12);
    fillColumns(pool.getPlane(planeIdx), 4, 5, 11, 11);
    pool.emitAllSpans(jobs);

    ASSERT_EQ(jobs.size(), 3u);

    for (const DrawJob& job : jobs) {
        EXPECT_EQ(job.kind, DrawJob::Kind::FloorSpan);
        EXPECT_EQ(job.span.texId, 7u);
        EXPECT_EQ(job.span.x1, 0u);

        if (job.span.y == 11) {
            EXPECT_EQ(job.span.x2, 5u);
        } else {
            EXPECT_EQ(job.span.x2, 3u);
        }
    }
}
