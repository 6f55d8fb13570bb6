#include "GFX/Textures.h"
#include "Map/DemoLevels.h"
#include "Map/LevelFile.h"

#include <gtest/gtest.h>
#include <cstdio>
#include <string>

namespace {

LevelRecords makeTwoRooms() {
    TextureBank textures;
    return DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures));
}

}  // namespace

TEST(LevelFileTest, SavedLevelLoadsBackAndBuildsTheSameGeometry) {
    const LevelRecords original = makeTwoRooms();
    const std::vector<std::byte> fileData = LevelFile::saveToMemory(original);
    const LevelRecords loaded = LevelFile::loadFromMemory(fileData.data(), fileData.size());

    ASSERT_EQ(loaded.vertexes.size(), original.vertexes.size());
    ASSERT_EQ(loaded.segs.size(), original.segs.size());
    ASSERT_EQ(loaded.nodes.size(), original.nodes.size());
    EXPECT_FLOAT_EQ(loaded.vertexes[3].y, original.vertexes[3].y);
    EXPECT_FLOAT_EQ(loaded.sectors[1].floorHeight, 24.0f);
    EXPECT_EQ(loaded.sides[0].topTexture, original.sides[0].topTexture);
    EXPECT_EQ(loaded.lines[3].sideNum[1], original.lines[3].sideNum[1]);
    EXPECT_EQ(loaded.nodes[0].children[0], original.nodes[0].children[0]);

    const LevelGeometry level = LevelGeometry::load(loaded);
    EXPECT_EQ(level.locateSubsector(900.0f, 100.0f), 1u);
}

TEST(LevelFileTest, GameLogicFieldsRoundTrip) {
    LevelRecords original = makeTwoRooms();
    original.sectors[1].special = 9;
    original.sectors[1].tag = 3;
    original.lines[2].special = 1;
    original.lines[2].tag = 3;

    const std::vector<std::byte> fileData = LevelFile::saveToMemory(original);
    const LevelRecords loaded = LevelFile::loadFromMemory(fileData.data(), fileData.size());

    EXPECT_EQ(loaded.sectors[1].special, 9u);
    EXPECT_EQ(loaded.sectors[1].tag, 3u);
    EXPECT_EQ(loaded.lines[2].special, 1u);
    EXPECT_EQ(loaded.lines[2].tag, 3u);
}

TEST(LevelFileTest, FileStartsWithIdAndVersion) {
    const std::vector<std::byte> fileData = LevelFile::saveToMemory(makeTwoRooms());

    ASSERT_GE(fileData.size(), 8u);
    EXPECT_EQ((char) fileData[0], 'R');
    EXPECT_EQ((char) fileData[1], 'B');
    EXPECT_EQ((char) fileData[2], 'S');
    EXPECT_EQ((char) fileData[3], 'P');

    // Big endian version number
    EXPECT_EQ((uint8_t) fileData[4], 0u);
    EXPECT_EQ((uint8_t) fileData[7], LevelFile::FILE_VERSION);
}

TEST(LevelFileTest, RejectsBadFileId) {
    std::vector<std::byte> fileData = LevelFile::saveToMemory(makeTwoRooms());
    fileData[0] = (std::byte) 'X';
    EXPECT_THROW(LevelFile::loadFromMemory(fileData.data(), fileData.size()), MalformedLevelException);
}

TEST(LevelFileTest, RejectsUnknownVersion) {
    std::vector<std::byte> fileData = LevelFile::saveToMemory(makeTwoRooms());
    fileData[7] = (std::byte) 99;
    EXPECT_THROW(LevelFile::loadFromMemory(fileData.data(), fileData.size()), MalformedLevelException);
}

TEST(LevelFileTest, RejectsTruncatedData) {
    const std::vector<std::byte> fileData = LevelFile::saveToMemory(makeTwoRooms());

    for (const size_t cutSize : { (size_t) 0, (size_t) 6, fileData.size() / 2, fileData.size() - 1 }) {
        EXPECT_THROW(LevelFile::loadFromMemory(fileData.data(), cutSize), MalformedLevelException) << cutSize;
    }
}

TEST(LevelFileTest, RejectsHugeElementCount) {
    std::vector<std::byte> fileData = LevelFile::saveToMemory(makeTwoRooms());

    // The vertex count follows the 8 byte header
    fileData[8] = (std::byte) 0x7F;
    EXPECT_THROW(LevelFile::loadFromMemory(fileData.data(), fileData.size()), MalformedLevelException);
}

TEST(LevelFileTest, MissingFileIsReported) {
    EXPECT_THROW(LevelFile::loadFromFile("this/file/does/not/exist.rbsp"), MalformedLevelException);
}

TEST(LevelFileTest, SavesAndLoadsThroughDisk) {
    const std::string path = ::testing::TempDir() + "retrobsp_level_file_test.rbsp";
    ASSERT_TRUE(LevelFile::saveToFile(path.c_str(), makeTwoRooms()));

    const LevelRecords loaded = LevelFile::loadFromFile(path.c_str());
    EXPECT_EQ(loaded.subsectors.size(), 2u);
    std::remove(path.c_str());
}
