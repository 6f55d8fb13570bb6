#include "Base/IniUtils.h"

#include <gtest/gtest.h>
#include <cstring>
#include <vector>

namespace {

std::vector<IniUtils::Entry> parseAll(const char* const pText) {
    std::vector<IniUtils::Entry> entries;
    IniUtils::parseIniFromString(pText, std::strlen(pText), [&](const IniUtils::Entry& entry) {
        entries.push_back(entry);
    });
    return entries;
}

}  // namespace

TEST(IniUtilsTest, ParsesSectionsKeysAndValuesInOrder) {
    const auto entries = parseAll(
        "[Video]\n"
        "Fullscreen = 1\n"
        "  [ Renderer ]  \n"
        "ScreenWidth=640\r\n"
        "Name =  hello world  \n"
    );

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].section, "Video");
    EXPECT_EQ(entries[0].key, "Fullscreen");
    EXPECT_EQ(entries[0].value, "1");
    EXPECT_EQ(entries[1].section, "Renderer");
    EXPECT_EQ(entries[1].key, "ScreenWidth");
    EXPECT_EQ(entries[1].value, "640");
    EXPECT_EQ(entries[2].value, "hello world");
}

TEST(IniUtilsTest, SkipsCommentsBlankLinesAndLinesWithoutEquals) {
    const auto entries = parseAll(
        "# comment = not an entry\n"
        "; another comment\n"
        "\n"
        "garbage line\n"
        "Key = Value\n"
    );

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].section, "");
    EXPECT_EQ(entries[0].key, "Key");
}

TEST(IniUtilsTest, EmptyValueIsAllowed) {
    const auto entries = parseAll("[Level]\nFile =\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].value.empty());
}

TEST(IniUtilsTest, ValueConversionsFallBackToDefault) {
    IniUtils::Entry entry;

    entry.value = "42";
    EXPECT_EQ(entry.getIntValue(7), 42);
    entry.value = "42abc";
    EXPECT_EQ(entry.getIntValue(7), 7);
    entry.value = "";
    EXPECT_EQ(entry.getIntValue(7), 7);

    entry.value = "0.5";
    EXPECT_FLOAT_EQ(entry.getFloatValue(1.0f), 0.5f);
    entry.value = "half";
    EXPECT_FLOAT_EQ(entry.getFloatValue(1.0f), 1.0f);
    entry.value = "nan";
    EXPECT_FLOAT_EQ(entry.getFloatValue(1.0f), 1.0f);
    entry.value = "-inf";
    EXPECT_FLOAT_EQ(entry.getFloatValue(1.0f), 1.0f);
    entry.value = "1e60";
    EXPECT_FLOAT_EQ(entry.getFloatValue(1.0f), 1.0f);

    entry.value = "true";
    EXPECT_TRUE(entry.getBoolValue(false));
    entry.value = "0";
    EXPECT_FALSE(entry.getBoolValue(true));
    entry.value = "maybe";
    EXPECT_TRUE(entry.getBoolValue(true));
}
