#pragma once

#include "Base/Macros.h"
#include "ImageData.h"
#include <cstdint>
#include <string>
#include <vector>

//------------------------------------------------------------------------------------------------------------------------------------------
// Describes a texture for a wall or flat (floor/ceiling)
//------------------------------------------------------------------------------------------------------------------------------------------
struct Texture {
    ImageData   data;       // The image data for the texture
    std::string name;       // Unique name of the texture
};

//------------------------------------------------------------------------------------------------------------------------------------------
// Holds all textures the renderer can use, keyed by a numeric texture id.
// Id '0' is always a checkerboard placeholder: looking up an id which was never registered gives the placeholder
// rather than failing, so a bad texture reference only ever shows up as a visible checker pattern.
//------------------------------------------------------------------------------------------------------------------------------------------
class TextureBank {
public:
    static constexpr uint32_t   PLACEHOLDER_TEX_ID      = 0;
    static constexpr uint32_t   INVALID_TEX_ID          = UINT32_MAX;
    static constexpr uint32_t   PLACEHOLDER_SIZE        = 8;
    static constexpr uint32_t   PLACEHOLDER_COLOR_1     = 0xFF909090u;
    static constexpr uint32_t   PLACEHOLDER_COLOR_2     = 0xFF303030u;
    static constexpr uint32_t   MAX_TEXTURE_SIZE        = 4096;

    TextureBank() noexcept;

    // Add a texture with the given name and ARGB8888 row major pixels, returning the id assigned to it.
    // Returns 'INVALID_TEX_ID' if the name is already in use or the size/pixel count is invalid.
    uint32_t addTexture(const std::string& name, const uint32_t width, const uint32_t height, std::vector<uint32_t> pixels) noexcept;

    // Find the id of the texture with the given name, or 'INVALID_TEX_ID' if not found
    uint32_t findTexture(const std::string& name) const noexcept;

    inline bool contains(const uint32_t texId) const noexcept {
        return (texId < mTextures.size());
    }

    inline uint32_t getNumTextures() const noexcept {
        return (uint32_t) mTextures.size();
    }

    // Get the texture with the given id, or the placeholder if there is no such texture
    inline const Texture& lookup(const uint32_t texId) const noexcept {
        return (contains(texId)) ? mTextures[texId] : mTextures[PLACEHOLDER_TEX_ID];
    }

private:
    std::vector<Texture> mTextures;
};
