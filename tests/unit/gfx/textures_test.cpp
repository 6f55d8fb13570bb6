#include "GFX/Textures.h"

#include <gtest/gtest.h>

TEST(TexturesTest, PlaceholderIsACheckerboard) {
    const TextureBank textures;
    const Texture& placeholder = textures.lookup(TextureBank::PLACEHOLDER_TEX_ID);

    ASSERT_EQ(placeholder.data.width, TextureBank::PLACEHOLDER_SIZE);
    ASSERT_EQ(placeholder.data.height, TextureBank::PLACEHOLDER_SIZE);
    EXPECT_EQ(placeholder.data.getWrappedTexel(0, 0), TextureBank::PLACEHOLDER_COLOR_1);
    EXPECT_EQ(placeholder.data.getWrappedTexel(1, 0), TextureBank::PLACEHOLDER_COLOR_2);
    EXPECT_EQ(placeholder.data.getWrappedTexel(1, 1), TextureBank::PLACEHOLDER_COLOR_1);
}

TEST(TexturesTest, UnknownIdsGiveThePlaceholder) {
    const TextureBank textures;

    EXPECT_FALSE(textures.contains(57));
    EXPECT_EQ(&textures.lookup(57), &textures.lookup(TextureBank::PLACEHOLDER_TEX_ID));
    EXPECT_EQ(&textures.lookup(TextureBank::INVALID_TEX_ID), &textures.lookup(TextureBank::PLACEHOLDER_TEX_ID));
}

TEST(TexturesTest, AddAndFindByName) {
    TextureBank textures;
    const uint32_t texId = textures.addTexture("RED", 2, 2, std::vector<uint32_t>(4, 0xFFFF0000u));

    ASSERT_NE(texId, TextureBank::INVALID_TEX_ID);
    EXPECT_NE(texId, TextureBank::PLACEHOLDER_TEX_ID);
    EXPECT_EQ(textures.findTexture("RED"), texId);
    EXPECT_EQ(textures.findTexture("BLUE"), TextureBank::INVALID_TEX_ID);
    EXPECT_EQ(textures.lookup(texId).data.getWrappedTexel(1, 1), 0xFFFF0000u);
}

TEST(TexturesTest, RejectsDuplicateNamesAndBadSizes) {
    TextureBank textures;
    ASSERT_NE(textures.addTexture("WALL", 1, 1, { 0xFF000000u }), TextureBank::INVALID_TEX_ID);

    EXPECT_EQ(textures.addTexture("WALL", 1, 1, { 0xFF000000u }), TextureBank::INVALID_TEX_ID);
    EXPECT_EQ(textures.addTexture("EMPTY", 0, 4, {}), TextureBank::INVALID_TEX_ID);
    EXPECT_EQ(textures.addTexture("SHORT", 2, 2, { 0xFF000000u }), TextureBank::INVALID_TEX_ID);
    EXPECT_EQ(textures.getNumTextures(), 2u);
}

TEST(TexturesTest, TexelFetchWrapsInBothDirections) {
    TextureBank textures;
    const uint32_t texId = textures.addTexture("GRAD", 2, 2, { 1u, 2u, 3u, 4u });
    const ImageData& img = textures.lookup(texId).data;

    EXPECT_EQ(img.getWrappedTexel(2, 0), 1u);
    EXPECT_EQ(img.getWrappedTexel(-1, 0), 2u);
    EXPECT_EQ(img.getWrappedTexel(0, -1), 3u);
    EXPECT_EQ(img.getWrappedTexel(-3, 5), 4u);
}
