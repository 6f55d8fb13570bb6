#include "Textures.h"

#include <cstdio>
#include <utility>

TextureBank::TextureBank() noexcept {
    // Make the checkerboard placeholder, 1 texel per checker square
    std::vector<uint32_t> pixels(PLACEHOLDER_SIZE * PLACEHOLDER_SIZE);

    for (uint32_t y = 0; y < PLACEHOLDER_SIZE; ++y) {
        for (uint32_t x = 0; x < PLACEHOLDER_SIZE; ++x) {
            pixels[y * PLACEHOLDER_SIZE + x] = ((x + y) & 1) ? PLACEHOLDER_COLOR_2 : PLACEHOLDER_COLOR_1;
        }
    }

    const uint32_t texId = addTexture("-", PLACEHOLDER_SIZE, PLACEHOLDER_SIZE, std::move(pixels));
    ASSERT(texId == PLACEHOLDER_TEX_ID);
    MARK_UNUSED(texId);
}

uint32_t TextureBank::addTexture(
    const std::string& name,
    const uint32_t width,
    const uint32_t height,
    std::vector<uint32_t> pixels
) noexcept {
    const bool bBadSize = (
        (width == 0) ||
        (height == 0) ||
        (width > MAX_TEXTURE_SIZE) ||
        (height > MAX_TEXTURE_SIZE) ||
        (pixels.size() != (size_t) width * height)
    );

    if (bBadSize) {
        std::printf("Texture '%s' has an invalid size (%u x %u, %zu pixels) and was not added!\n", name.c_str(), width, height, pixels.size());
        return INVALID_TEX_ID;
    }

    if (findTexture(name) != INVALID_TEX_ID) {
        std::printf("Texture name '%s' is already in use!\n", name.c_str());
        return INVALID_TEX_ID;
    }

    Texture& tex = mTextures.emplace_back();
    tex.data.width = width;
    tex.data.height = height;
    tex.data.pixels = std::move(pixels);
    tex.name = name;

    return (uint32_t) mTextures.size() - 1;
}

uint32_t TextureBank::findTexture(const std::string& name) const noexcept {
    // Note: texture counts are small and this is only done at load time, so a linear search is fine
    for (uint32_t texId = 0; texId < mTextures.size(); ++texId) {
        if (mTextures[texId].name == name)
            return texId;
    }

    return INVALID_TEX_ID;
}
