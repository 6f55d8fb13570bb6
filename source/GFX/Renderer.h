#pragma once

#include "Camera.h"
#include "FrameContext.h"
#include "ImageData.h"

class TextureBank;

BEGIN_NAMESPACE(Renderer)

// Color for any pixel that nothing in the level covers
static constexpr uint32_t CLEAR_COLOR = 0xFF000000u;

//----------------------------------------------------------------------------------------------------------------------
// Render the view from the given camera pose into the frame buffer, which is resized to the screen size in the
// settings if required. All working state for the frame lives in 'frame', which is reset first; statistics for the
// frame are left in 'frame.stats' afterwards. The level and textures are only ever read.
//----------------------------------------------------------------------------------------------------------------------
void drawFrame(
    const LevelGeometry& level,
    const TextureBank& textures,
    const CameraPose& pose,
    const RenderSettings& settings,
    FrameContext& frame,
    ImageData& frameBuffer
) noexcept;

END_NAMESPACE(Renderer)
