#include "FrameContext.h"

BEGIN_NAMESPACE(Renderer)

void FrameStats::clear() noexcept {
    numWallColumns = 0;
    numSpans = 0;
    numVisplanes = 0;
    numMergedVisplanes = 0;
    numOverflowFlushes = 0;
    numMissingTextures = 0;
    numCulledNodes = 0;
    numSegsDrawn = 0;
    subsectorOrder.clear();
}

void FrameContext::beginFrame(const RenderSettings& settings) noexcept {
    clipSpans.reset(settings.screenWidth, settings.screenHeight);
    visplanes.reset(settings.screenWidth, settings.screenHeight, settings.maxVisplanes);
    drawJobs.clear();
    stats.clear();
    visibleRanges.clear();
}

END_NAMESPACE(Renderer)
