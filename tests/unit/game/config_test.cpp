#include "Game/Config.h"

#include <gtest/gtest.h>
#include <cstring>

namespace {

void parse(const char* const pText) {
    Config::parseConfigText(pText, std::strlen(pText));
}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Config::clear(); }
    void TearDown() override { Config::clear(); }
};

}  // namespace

TEST_F(ConfigTest, DefaultConfigTextGivesTheDefaultSettings) {
    parse(Config::getDefaultConfigText());

    EXPECT_FALSE(Config::gbFullscreen);
    EXPECT_EQ(Config::gOutputScale, 3u);
    EXPECT_EQ(Config::gScreenWidth, 320u);
    EXPECT_EQ(Config::gScreenHeight, 200u);
    EXPECT_FLOAT_EQ(Config::gFieldOfView, 90.0f);
    EXPECT_FLOAT_EQ(Config::gDepthEpsilon, 1.0f / 256.0f);
    EXPECT_EQ(Config::gMaxVisplanes, 128u);
    EXPECT_EQ(Config::gSpanThreads, 1u);
    EXPECT_TRUE(Config::gbDoFakeContrast);
    EXPECT_TRUE(Config::gLevelFile.empty());
    EXPECT_FLOAT_EQ(Config::gEyeHeight, 41.0f);
}

TEST_F(ConfigTest, ReadsValuesFromEachSection) {
    parse(
        "[Video]\n"
        "Fullscreen = 1\n"
        "OutputScale = 2\n"
        "[Renderer]\n"
        "ScreenWidth = 640\n"
        "ScreenHeight = 400\n"
        "FieldOfView = 60\n"
        "MaxVisplanes = 32\n"
        "SpanThreads = 4\n"
        "DoFakeContrast = 0\n"
        "[Level]\n"
        "File = maps/test.rbsp\n"
        "EyeHeight = 56\n"
    );

    EXPECT_TRUE(Config::gbFullscreen);
    EXPECT_EQ(Config::gOutputScale, 2u);
    EXPECT_EQ(Config::gScreenWidth, 640u);
    EXPECT_EQ(Config::gScreenHeight, 400u);
    EXPECT_FLOAT_EQ(Config::gFieldOfView, 60.0f);
    EXPECT_EQ(Config::gMaxVisplanes, 32u);
    EXPECT_EQ(Config::gSpanThreads, 4u);
    EXPECT_FALSE(Config::gbDoFakeContrast);
    EXPECT_EQ(Config::gLevelFile, "maps/test.rbsp");
    EXPECT_FLOAT_EQ(Config::gEyeHeight, 56.0f);
}

TEST_F(ConfigTest, OutOfRangeValuesAreClamped) {
    parse(
        "[Renderer]\n"
        "ScreenWidth = 1\n"
        "ScreenHeight = 100000\n"
        "FieldOfView = 179\n"
        "MaxVisplanes = 0\n"
        "SpanThreads = 1000\n"
        "DepthEpsilon = -5\n"
    );

    EXPECT_EQ(Config::gScreenWidth, RenderSettings::MIN_SCREEN_SIZE);
    EXPECT_EQ(Config::gScreenHeight, RenderSettings::MAX_SCREEN_SIZE);
    EXPECT_FLOAT_EQ(Config::gFieldOfView, 150.0f);
    EXPECT_EQ(Config::gMaxVisplanes, RenderSettings::MIN_VISPLANES);
    EXPECT_EQ(Config::gSpanThreads, RenderSettings::MAX_SPAN_THREADS);
    EXPECT_GT(Config::gDepthEpsilon, 0.0f);
}

TEST_F(ConfigTest, NonFiniteValuesKeepTheDefaults) {
    parse(
        "[Renderer]\n"
        "DepthEpsilon = nan\n"
        "FieldOfView = inf\n"
        "[Level]\n"
        "EyeHeight = -nan\n"
    );

    const RenderSettings settings = Config::getRenderSettings();
    EXPECT_FLOAT_EQ(settings.depthEpsilon, 1.0f / 256.0f);
    EXPECT_NEAR(settings.fieldOfView, FMath::ANGLE_90<float>, 1e-6f);
    EXPECT_FLOAT_EQ(Config::gEyeHeight, 41.0f);
}

TEST_F(ConfigTest, UnknownSectionsAndBadValuesAreIgnored) {
    parse(
        "[Audio]\n"
        "Volume = 11\n"
        "[Renderer]\n"
        "ScreenWidth = wide\n"
    );

    EXPECT_EQ(Config::gScreenWidth, 320u);
}

TEST_F(ConfigTest, RenderSettingsUseRadians) {
    parse("[Renderer]\nFieldOfView = 90\nMaxVisplanes = 64\n");
    const RenderSettings settings = Config::getRenderSettings();

    EXPECT_NEAR(settings.fieldOfView, FMath::ANGLE_90<float>, 1e-6f);
    EXPECT_EQ(settings.maxVisplanes, 64u);
    EXPECT_EQ(settings.screenWidth, 320u);
}
