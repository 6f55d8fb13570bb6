#include "Renderer_Internal.h"

#include "Map/LevelGeometry.h"
#include "Textures.h"
#include <algorithm>

BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// Size the frame buffer for the screen and clear it, so anything the level doesn't cover gets a known color
//----------------------------------------------------------------------------------------------------------------------
static void prepFrameBuffer(const RenderSettings& settings, ImageData& frameBuffer) noexcept {
    frameBuffer.width = settings.screenWidth;
    frameBuffer.height = settings.screenHeight;
    frameBuffer.pixels.resize((size_t) settings.screenWidth * settings.screenHeight);
    std::fill(frameBuffer.pixels.begin(), frameBuffer.pixels.end(), CLEAR_COLOR);
}

void drawFrame(
    const LevelGeometry& level,
    const TextureBank& textures,
    const CameraPose& pose,
    const RenderSettings& settings,
    FrameContext& frame,
    ImageData& frameBuffer
) noexcept {
    frame.beginFrame(settings);
    prepFrameBuffer(settings, frameBuffer);

    const Camera camera(pose, settings);
    const RenderView view = { level, textures, camera };

    // Traverse the BSP tree and build the list of wall columns to draw plus the floor and ceiling coverage
    doBspTraversal(view, frame);

    // Turn the floor and ceiling coverage into spans: merge what can be drawn together first to get longer spans
    VisplanePool& visplanes = frame.visplanes;
    visplanes.mergeCompatiblePlanes();

    FrameStats& stats = frame.stats;
    stats.numVisplanes = visplanes.getNumPlanesCreated();
    stats.numMergedVisplanes = visplanes.getNumMerges();
    stats.numOverflowFlushes = visplanes.getNumOverflowFlushes();

    visplanes.emitAllSpans(frame.drawJobs);

    stats.numSpans = (uint32_t) std::count_if(
        frame.drawJobs.begin(),
        frame.drawJobs.end(),
        [](const DrawJob& job) noexcept { return job.isSpan(); }
    );

    // Now actually draw everything
    drawAllJobs(view, frame.drawJobs, settings.spanThreads, frameBuffer);
}

END_NAMESPACE(Renderer)
