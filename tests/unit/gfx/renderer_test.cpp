#include "GFX/Renderer.h"
#include "test_scenes.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

using namespace Renderer;

namespace {

constexpr uint32_t FLOOR_COLOR = 0xFF808080u;
constexpr uint32_t CEIL_COLOR = 0xFF0000FFu;

uint32_t getRed(const uint32_t pixel) {
    return (pixel >> 16) & 0xFFu;
}

}  // namespace

//----------------------------------------------------------------------------------------------------------------------
// A huge room seen from the middle: the walls are so far away that they shrink to nothing at the horizon, so the
// bottom half of the screen is all floor.
//----------------------------------------------------------------------------------------------------------------------
TEST(RendererTest, FloorBelowTheCameraIsAUniformRegionUpToTheHorizon) {
    constexpr float ROOM_SIZE = 65536.0f;

    TextureBank textures;
    const uint32_t wallTex = TestScenes::addSolidTexture(textures, "WALL", 0xFFFFFFFFu);
    const uint32_t floorTex = TestScenes::addSolidTexture(textures, "FLOOR", FLOOR_COLOR);
    const uint32_t ceilTex = TestScenes::addSolidTexture(textures, "CEIL", CEIL_COLOR);
    const LevelGeometry level = LevelGeometry::load(
        DemoLevels::makeRectangularRoom(ROOM_SIZE, ROOM_SIZE, 0.0f, 128.0f, 255, wallTex, floorTex, ceilTex)
    );

    const RenderSettings settings = TestScenes::makeSettings(128, 4);
    const CameraPose pose = { ROOM_SIZE * 0.5f, ROOM_SIZE * 0.5f, 41.0f, 0.0f };
    FrameContext frame;
    ImageData frameBuffer = {};
    drawFrame(level, textures, pose, settings, frame, frameBuffer);

    ASSERT_EQ(frameBuffer.width, settings.screenWidth);
    ASSERT_EQ(frameBuffer.height, settings.screenHeight);
    EXPECT_EQ(frame.stats.numMissingTextures, 0u);

    const uint32_t horizonRow = settings.screenHeight / 2;
    uint32_t prevRowRed = 0;

    for (uint32_t y = horizonRow; y < settings.screenHeight; ++y) {
        const uint32_t* const pRow = frameBuffer.pixels.data() + y * frameBuffer.width;
        const uint32_t rowPixel = pRow[0];

        // Gray floor texels, the same across the whole row
        EXPECT_EQ(getRed(rowPixel), rowPixel & 0xFFu) << "row " << y;

        for (uint32_t x = 1; x < frameBuffer.width; ++x) {
            ASSERT_EQ(pRow[x], rowPixel) << "row " << y << " column " << x;
        }

        // Brightness never increases going up towards the horizon
        if (y > horizonRow) {
            EXPECT_GE(getRed(rowPixel), prevRowRed) << "row " << y;
        }

        prevRowRed = getRed(rowPixel);
    }

    // Above the horizon is all ceiling
    for (uint32_t y = 0; y < horizonRow; ++y) {
        const uint32_t pixel = frameBuffer.pixels[y * frameBuffer.width + frameBuffer.width / 2];
        EXPECT_EQ(pixel & 0x00FFFF00u, 0u) << "row " << y;
        EXPECT_GT(pixel & 0xFFu, 0u) << "row " << y;
    }

    // Nearest floor row is brighter than the row at the horizon
    EXPECT_GT(
        getRed(frameBuffer.pixels[(settings.screenHeight - 1) * frameBuffer.width]),
        getRed(frameBuffer.pixels[horizonRow * frameBuffer.width])
    );
}

TEST(RendererTest, UnknownTextureDrawsThePlaceholderAndFrameCompletes) {
    TextureBank textures;
    const uint32_t floorTex = TestScenes::addSolidTexture(textures, "FLOOR", 0xFF00FF00u);
    const uint32_t ceilTex = TestScenes::addSolidTexture(textures, "CEIL", 0xFF0000FFu);
    const uint32_t missingTex = 999;
    const LevelGeometry level = LevelGeometry::load(
        DemoLevels::makeRectangularRoom(512.0f, 512.0f, 0.0f, 128.0f, 255, missingTex, floorTex, ceilTex),
        false
    );

    const RenderSettings settings = TestScenes::makeSettings();
    const CameraPose pose = { 256.0f, 256.0f, 41.0f, 0.0f };
    FrameContext frame;
    ImageData frameBuffer = {};
    drawFrame(level, textures, pose, settings, frame, frameBuffer);

    EXPECT_GT(frame.stats.numMissingTextures, 0u);
    EXPECT_GT(frame.stats.numWallColumns, 0u);

    // Walls are drawn with the gray checkerboard: look for both checker shades down the middle column
    std::vector<uint32_t> grays;

    for (uint32_t y = 0; y < frameBuffer.height; ++y) {
        uint32_t r, g, b;
        ImageDataUtils::decodePixelToRGB(frameBuffer.pixels[y * frameBuffer.width + frameBuffer.width / 2], r, g, b);

        if ((r == g) && (g == b) && (r > 0)) {
            grays.push_back(r);
        }
    }

    ASSERT_FALSE(grays.empty());
    EXPECT_NE(*std::min_element(grays.begin(), grays.end()), *std::max_element(grays.begin(), grays.end()));

    // Nothing left undrawn
    for (const uint32_t pixel : frameBuffer.pixels) {
        ASSERT_NE(pixel, CLEAR_COLOR);
    }
}

TEST(RendererTest, VisplaneOverflowStillDrawsEveryPixelOnce) {
    TextureBank textures;
    const LevelGeometry level = LevelGeometry::load(DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures)));
    const DemoLevels::StartPoint start = DemoLevels::getTwoRoomLevelStart();
    const CameraPose pose = { start.x, start.y, 41.0f, start.angle };

    FrameContext roomyFrame;
    FrameContext crampedFrame;
    ImageData roomyFrameBuffer = {};
    ImageData crampedFrameBuffer = {};
    const RenderSettings roomySettings = TestScenes::makeSettings(128);
    const RenderSettings crampedSettings = TestScenes::makeSettings(RenderSettings::MIN_VISPLANES);

    drawFrame(level, textures, pose, roomySettings, roomyFrame, roomyFrameBuffer);
    drawFrame(level, textures, pose, crampedSettings, crampedFrame, crampedFrameBuffer);

    EXPECT_EQ(roomyFrame.stats.numOverflowFlushes, 0u);
    EXPECT_GT(crampedFrame.stats.numOverflowFlushes, 0u);
    EXPECT_EQ(roomyFrame.stats.numWallColumns, crampedFrame.stats.numWallColumns);

    const std::vector<uint32_t> roomyCoverage = TestScenes::getPixelCoverage(roomyFrame.drawJobs, roomySettings);
    const std::vector<uint32_t> crampedCoverage = TestScenes::getPixelCoverage(crampedFrame.drawJobs, crampedSettings);

    for (size_t i = 0; i < roomyCoverage.size(); ++i) {
        ASSERT_EQ(roomyCoverage[i], 1u) << "pixel " << i;
        ASSERT_EQ(crampedCoverage[i], 1u) << "pixel " << i;
    }
}

//----------------------------------------------------------------------------------------------------------------------
// The second room is moved entirely below the first room's floor, then entirely above its ceiling.
// Either way the opening between them is closed: the wall in it must stop where the first room's floor or ceiling
// starts, so that no pixel is drawn by both a wall column and a span.
//----------------------------------------------------------------------------------------------------------------------
TEST(RendererTest, ClosedBackSectorWallsDoNotOverlapPlanes) {
    TextureBank textures;
    const LevelRecords twoRooms = DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures));
    const DemoLevels::StartPoint start = DemoLevels::getTwoRoomLevelStart();
    const CameraPose pose = { start.x, start.y, 41.0f, start.angle };
    const RenderSettings settings = TestScenes::makeSettings();

    const float backSectorHeights[][2] = {
        { -100.0f, -50.0f },
        { 200.0f, 300.0f },
    };

    for (const auto& heights : backSectorHeights) {
        LevelRecords records = twoRooms;
        records.sectors[1].floorHeight = heights[0];
        records.sectors[1].ceilingHeight = heights[1];
        const LevelGeometry level = LevelGeometry::load(records);

        FrameContext frame;
        ImageData frameBuffer = {};
        drawFrame(level, textures, pose, settings, frame, frameBuffer);

        const std::vector<uint32_t> coverage = TestScenes::getPixelCoverage(frame.drawJobs, settings);

        for (size_t i = 0; i < coverage.size(); ++i) {
            ASSERT_EQ(coverage[i], 1u) << "pixel " << i << ", back sector floor " << heights[0];
        }
    }
}

TEST(RendererTest, ParallelSpansGiveTheSameImage) {
    TextureBank textures;
    const LevelGeometry level = LevelGeometry::load(DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures)));
    const CameraPose pose = { 200.0f, 150.0f, 41.0f, 0.4f };

    FrameContext frame;
    ImageData serialImage = {};
    ImageData parallelImage = {};
    drawFrame(level, textures, pose, TestScenes::makeSettings(128, 1), frame, serialImage);
    drawFrame(level, textures, pose, TestScenes::makeSettings(128, 8), frame, parallelImage);

    EXPECT_EQ(serialImage.pixels, parallelImage.pixels);
}

TEST(RendererTest, FrameContextIsReusableAcrossScreenSizes) {
    TextureBank textures;
    const LevelGeometry level = LevelGeometry::load(DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures)));
    const CameraPose pose = { 128.0f, 256.0f, 41.0f, 0.0f };

    RenderSettings small = TestScenes::makeSettings();
    small.screenWidth = 160;
    small.screenHeight = 100;

    FrameContext frame;
    ImageData first = {};
    ImageData image = {};
    drawFrame(level, textures, pose, TestScenes::makeSettings(), frame, first);
    drawFrame(level, textures, pose, small, frame, image);

    EXPECT_EQ(image.width, 160u);
    EXPECT_EQ(image.pixels.size(), 160u * 100u);

    drawFrame(level, textures, pose, TestScenes::makeSettings(), frame, image);
    EXPECT_EQ(image.pixels, first.pixels);
}

TEST(RendererTest, StatsDescribeTheFrame) {
    TextureBank textures;
    const LevelGeometry level = LevelGeometry::load(DemoLevels::makeTwoRoomLevel(DemoLevels::addDemoTextures(textures)));
    const CameraPose pose = { 128.0f, 256.0f, 41.0f, 0.0f };

    FrameContext frame;
    ImageData image = {};
    drawFrame(level, textures, pose, TestScenes::makeSettings(), frame, image);

    const FrameStats& stats = frame.stats;
    EXPECT_GT(stats.numSegsDrawn, 0u);
    EXPECT_GT(stats.numWallColumns, 0u);
    EXPECT_GT(stats.numSpans, 0u);
    EXPECT_GT(stats.numVisplanes, 0u);
    EXPECT_EQ(stats.numMissingTextures, 0u);

    uint32_t numSpanJobs = 0;

    for (const DrawJob& job : frame.drawJobs) {
        numSpanJobs += (job.isSpan()) ? 1 : 0;
    }

    EXPECT_EQ(stats.numSpans, numSpanJobs);
    EXPECT_EQ(stats.numWallColumns + stats.numSpans, (uint32_t) frame.drawJobs.size());
}
