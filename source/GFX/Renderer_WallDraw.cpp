#include "Renderer_Internal.h"

#include "Textures.h"
#include <cmath>

//----------------------------------------------------------------------------------------------------------------------
// Code for drawing wall columns.
//
// Notes:
//  (1) Each job covers an inclusive range of rows which the wall prep code has already clipped to the screen.
//  (2) Texture coordinates wrap in both directions, so offsets and pegging never need to be normalized.
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(Renderer)

void drawWallColumn(const WallColumnJob& column, const TextureBank& textures, ImageData& frameBuffer) noexcept {
    ASSERT(column.x < frameBuffer.width);
    ASSERT(column.yBottom < frameBuffer.height);

    const ImageData& texImg = textures.lookup(column.texId).data;
    const int32_t texX = (int32_t) std::floor(column.texU);
    const uint32_t dstPitch = frameBuffer.width;

    uint32_t* pDstPixel = frameBuffer.pixels.data() + (uint32_t) column.yTop * dstPitch + column.x;
    float texY = column.texV;

    for (uint32_t y = column.yTop; y <= column.yBottom; ++y) {
        const uint32_t texel = texImg.getWrappedTexel(texX, (int32_t) std::floor(texY));
        *pDstPixel = ImageDataUtils::applyLightMul(texel, column.lightMul);
        pDstPixel += dstPitch;
        texY += column.texVStep;
    }
}

END_NAMESPACE(Renderer)
