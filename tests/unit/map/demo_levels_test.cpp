#include "GFX/Textures.h"
#include "Map/DemoLevels.h"

#include <gtest/gtest.h>

TEST(DemoLevelsTest, DemoTexturesAreRegisteredByName) {
    TextureBank textures;
    const DemoLevels::DemoTextures tex = DemoLevels::addDemoTextures(textures);

    EXPECT_EQ(textures.findTexture("BRICK"), tex.brickWall);
    EXPECT_EQ(textures.findTexture("STONE"), tex.stoneWall);
    EXPECT_EQ(textures.findTexture("STEP"), tex.stepWall);
    EXPECT_EQ(textures.findTexture("FLOOR"), tex.floorTiles);
    EXPECT_EQ(textures.findTexture("CEIL"), tex.ceilingPanels);
    EXPECT_EQ(textures.findTexture("GRASS"), tex.grassFloor);
    EXPECT_NE(tex.brickWall, TextureBank::PLACEHOLDER_TEX_ID);
    EXPECT_EQ(textures.lookup(tex.stepWall).data.height, 16u);
}

TEST(DemoLevelsTest, TwoRoomLevelLoads) {
    TextureBank textures;
    const LevelRecords records = DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures));
    const LevelGeometry level = LevelGeometry::load(records);

    EXPECT_EQ(level.getSectors().size(), 2u);
    EXPECT_EQ(level.getSubsectors().size(), 2u);
    EXPECT_EQ(level.getNodes().size(), 1u);
    EXPECT_EQ(level.getRoot(), BspChild::Node(0));
}

TEST(DemoLevelsTest, StartPointIsInsideTheFirstRoom) {
    TextureBank textures;
    const LevelGeometry level = LevelGeometry::load(DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures)));
    const DemoLevels::StartPoint start = DemoLevels::getTwoRoomLevelStart();

    EXPECT_EQ(level.locateSubsector(start.x, start.y), 0u);
}
