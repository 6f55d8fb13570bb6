#pragma once

#include "ClipSpans.h"
#include "DrawJobs.h"
#include "RenderSettings.h"
#include "Visplanes.h"

BEGIN_NAMESPACE(Renderer)

//----------------------------------------------------------------------------------------------------------------------
// All of the state which is built up while rendering one frame.
// Reset at the start of every frame: the same context can be reused for any number of frames, and a frame can be
// abandoned at any point simply by starting the next one. Holds nothing which refers to level data.
//----------------------------------------------------------------------------------------------------------------------
struct FrameContext {
    ClipSpans               clipSpans;
    VisplanePool            visplanes;
    std::vector<DrawJob>    drawJobs;
    FrameStats              stats;
    std::vector<ClipRange>  visibleRanges;      // Scratch list for the visible parts of the seg being drawn

    void beginFrame(const RenderSettings& settings) noexcept;
};

END_NAMESPACE(Renderer)
