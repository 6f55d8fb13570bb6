#include "GFX/Textures.h"
#include "Map/DemoLevels.h"
#include "Map/LevelGeometry.h"

#include <gtest/gtest.h>
#include <cmath>
#include <vector>

namespace {

constexpr uint32_t WALL_TEX = 1;
constexpr uint32_t FLOOR_TEX = 2;
constexpr uint32_t CEIL_TEX = 3;

LevelRecords makeRoom() {
    return DemoLevels::makeRectangularRoom(256.0f, 512.0f, 0.0f, 128.0f, 160, WALL_TEX, FLOOR_TEX, CEIL_TEX);
}

LevelRecords makeTwoRooms() {
    TextureBank textures;
    return DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures));
}

// Signed area test: is the point on the line through the seg (within a tolerance)?
bool isPointOnSegLine(const Seg& seg, const Vertex& point) {
    const float cross = (point.x - seg.v1.x) * (seg.v2.y - seg.v1.y) - (point.y - seg.v1.y) * (seg.v2.x - seg.v1.x);
    return std::abs(cross) < 1e-3f;
}

}  // namespace

TEST(LevelGeometryTest, LoadsSingleSubsectorRoomWithoutNodes) {
    const LevelGeometry level = LevelGeometry::load(makeRoom());

    EXPECT_EQ(level.getVertexes().size(), 4u);
    EXPECT_EQ(level.getSegs().size(), 4u);
    EXPECT_EQ(level.getSubsectors().size(), 1u);
    EXPECT_TRUE(level.getNodes().empty());
    EXPECT_EQ(level.getRoot(), BspChild::Leaf(0));
    EXPECT_EQ(level.getSubsectorSegs(0).size(), 4u);
    EXPECT_FLOAT_EQ(level.getSubsectorSector(0).ceilingHeight, 128.0f);
}

TEST(LevelGeometryTest, SegsGetResolvedGeometry) {
    const LevelGeometry level = LevelGeometry::load(makeRoom());
    const Seg& seg = level.getSegs()[1];        // (0, 512) -> (256, 512)

    EXPECT_FLOAT_EQ(seg.v1.x, 0.0f);
    EXPECT_FLOAT_EQ(seg.v1.y, 512.0f);
    EXPECT_FLOAT_EQ(seg.v2.x, 256.0f);
    EXPECT_FLOAT_EQ(seg.length, 256.0f);
    EXPECT_EQ(seg.frontSector, 0u);
    EXPECT_FALSE(seg.isTwoSided());
}

TEST(LevelGeometryTest, EverySegBelongsToExactlyOneSubsectorAndLiesOnItsBoundary) {
    const LevelGeometry level = LevelGeometry::load(makeTwoRooms());
    std::vector<uint32_t> segOwnerCount(level.getSegs().size(), 0);

    for (uint32_t subsecIdx = 0; subsecIdx < level.getSubsectors().size(); ++subsecIdx) {
        const LevelGeometry::SegRange segs = level.getSubsectorSegs(subsecIdx);

        for (const Seg& seg : segs) {
            ++segOwnerCount[(uint32_t)(&seg - level.getSegs().data())];

            // A convex subsector lies entirely on the front side of each of its boundary segs
            for (const Seg& other : segs) {
                for (const Vertex& point : { other.v1, other.v2 }) {
                    const float cross = (point.x - seg.v1.x) * (seg.v2.y - seg.v1.y) - (point.y - seg.v1.y) * (seg.v2.x - seg.v1.x);
                    EXPECT_GE(cross, -1e-3f);
                }
            }
        }
    }

    for (const uint32_t count : segOwnerCount) {
        EXPECT_EQ(count, 1u);
    }
}

TEST(LevelGeometryTest, PartnerSegsShareTheirLine) {
    const LevelGeometry level = LevelGeometry::load(makeTwoRooms());
    uint32_t numTwoSided = 0;

    for (const Seg& seg : level.getSegs()) {
        if (!seg.isTwoSided())
            continue;

        ++numTwoSided;
        ASSERT_NE(seg.partnerSeg, INVALID_INDEX);
        const Seg& partner = level.getSegs()[seg.partnerSeg];
        EXPECT_EQ(partner.lineDef, seg.lineDef);
        EXPECT_EQ(partner.frontSector, seg.backSector);
        EXPECT_TRUE(isPointOnSegLine(seg, partner.v1));
        EXPECT_TRUE(isPointOnSegLine(seg, partner.v2));
    }

    EXPECT_EQ(numTwoSided, 2u);
}

TEST(LevelGeometryTest, LocatesSubsectorsThroughTheTree) {
    const LevelGeometry level = LevelGeometry::load(makeTwoRooms());

    EXPECT_EQ(level.locateSubsector(100.0f, 100.0f), 0u);
    EXPECT_EQ(level.locateSubsector(900.0f, 100.0f), 1u);
    EXPECT_FLOAT_EQ(level.getFloorHeightAt(100.0f, 100.0f), 0.0f);
    EXPECT_FLOAT_EQ(level.getFloorHeightAt(900.0f, 100.0f), 24.0f);

    // Exactly on the partition counts as the front side, which is the second room
    EXPECT_EQ(level.locateSubsector(512.0f, 256.0f), 1u);
}

TEST(LevelGeometryTest, PointOnPartitionIsFront) {
    const Partition line = { 0.0f, 0.0f, 1.0f, 0.0f };

    EXPECT_EQ(pointOnPartitionSide(line, 5.0f, 0.0f), NodeSide::Front);
    EXPECT_EQ(pointOnPartitionSide(line, 5.0f, -1.0f), NodeSide::Front);     // Right of the line direction
    EXPECT_EQ(pointOnPartitionSide(line, 5.0f, 1.0f), NodeSide::Back);
}

TEST(LevelGeometryTest, FakeContrastVariesWithOrientation) {
    const LevelGeometry contrast = LevelGeometry::load(makeRoom(), true);
    const LevelGeometry flat = LevelGeometry::load(makeRoom(), false);

    // Walls along x and walls along y get different multipliers, within the allowed range
    EXPECT_NE(contrast.getSegs()[0].lightMul, contrast.getSegs()[1].lightMul);

    for (const Seg& seg : contrast.getSegs()) {
        EXPECT_GE(seg.lightMul, 0.75f - 1e-5f);
        EXPECT_LE(seg.lightMul, 1.05f + 1e-5f);
    }

    for (const Seg& seg : flat.getSegs()) {
        EXPECT_FLOAT_EQ(seg.lightMul, 1.0f);
    }
}

TEST(LevelGeometryTest, RejectsBadVertexReference) {
    LevelRecords records = makeRoom();
    records.lines[2].v2 = 99;
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, RejectsBadSectorReference) {
    LevelRecords records = makeRoom();
    records.sides[0].sector = 5;
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, RejectsTwoSidedLineWithoutBackSide) {
    LevelRecords records = makeRoom();
    records.lines[0].flags |= ML_TWOSIDED;
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, RejectsSegOwnedByTwoSubsectors) {
    LevelRecords records = makeRoom();
    records.subsectors.push_back(SubsectorRecord{ 3, 1 });
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, RejectsSegNotOwnedByAnySubsector) {
    LevelRecords records = makeRoom();
    records.subsectors[0].numSegs = 3;
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, RejectsBadNodeChild) {
    LevelRecords records = makeTwoRooms();
    records.nodes[0].children[1] = NF_SUBSECTOR | 7;
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, RejectsCycleInTree) {
    LevelRecords records = makeTwoRooms();
    records.nodes[0].children[0] = 0;       // The root refers back to itself
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, RejectsMultipleSubsectorsWithoutNodes) {
    LevelRecords records = makeTwoRooms();
    records.nodes.clear();
    EXPECT_THROW(LevelGeometry::load(records), MalformedLevelException);
}

TEST(LevelGeometryTest, ErrorMessageNamesTheProblem) {
    LevelRecords records = makeRoom();
    records.segs[0].lineDef = 42;

    try {
        LevelGeometry::load(records);
        FAIL() << "Expected a MalformedLevelException";
    } catch (const MalformedLevelException& exception) {
        EXPECT_NE(std::string(exception.what()).find("line 42"), std::string::npos);
    }
}
