#include "Renderer_Internal.h"

#include "Textures.h"
#include <algorithm>
#include <cmath>
#include <system_error>
#include <thread>

BEGIN_NAMESPACE(Renderer)

void drawFlatSpan(const FlatSpanJob& span, const Camera& camera, const TextureBank& textures, ImageData& frameBuffer) noexcept {
    ASSERT(span.x1 <= span.x2);
    ASSERT(span.x2 < frameBuffer.width);
    ASSERT(span.y < frameBuffer.height);

    // Everything along a row of a horizontal plane is at the same view depth.
    // A row grazing the horizon can't be unprojected: use the smallest allowed depth instead of dividing by zero.
    const float rowCenterY = (float) span.y + 0.5f;
    float depth = camera.getPlaneDepthForRow(rowCenterY, span.planeZ);

    if (depth <= 0.0f) {
        depth = camera.getDepthEpsilon();
    }

    // World position at the center of the first pixel and how much it moves for each pixel to the right
    const CameraPose& pose = camera.getPose();
    const float worldStep = depth / camera.getFocalLength();
    const float lateral = ((float) span.x1 + 0.5f - camera.getCenterX()) * worldStep;

    float worldX = pose.x + camera.getForwardX() * depth + camera.getRightX() * lateral;
    float worldY = pose.y + camera.getForwardY() * depth + camera.getRightY() * lateral;
    const float worldStepX = camera.getRightX() * worldStep;
    const float worldStepY = camera.getRightY() * worldStep;

    const ImageData& texImg = textures.lookup(span.texId).data;
    const float lightMul = getLightParams(span.lightLevel).getLightMulForDist(depth);
    uint32_t* pDstPixel = frameBuffer.pixels.data() + (uint32_t) span.y * frameBuffer.width + span.x1;

    // Flats are aligned to the world grid: texture 'y' runs opposite to world 'y'
    for (uint32_t x = span.x1; x <= span.x2; ++x) {
        const int32_t texX = (int32_t) std::floor(worldX);
        const int32_t texY = (int32_t) std::floor(-worldY);
        *pDstPixel = ImageDataUtils::applyLightMul(texImg.getWrappedTexel(texX, texY), lightMul);
        ++pDstPixel;
        worldX += worldStepX;
        worldY += worldStepY;
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Draws every n-th span job, starting at the given job offset
//----------------------------------------------------------------------------------------------------------------------
static void drawSpanJobSubset(
    const RenderView& view,
    const std::vector<DrawJob>& jobs,
    const uint32_t firstJob,
    const uint32_t jobStride,
    ImageData& frameBuffer
) noexcept {
    const uint32_t numJobs = (uint32_t) jobs.size();

    for (uint32_t jobIdx = firstJob; jobIdx < numJobs; jobIdx += jobStride) {
        const DrawJob& job = jobs[jobIdx];

        if (job.isSpan()) {
            drawFlatSpan(job.span, view.camera, view.textures, frameBuffer);
        }
    }
}

void drawAllJobs(
    const RenderView& view,
    const std::vector<DrawJob>& jobs,
    const uint32_t numSpanThreads,
    ImageData& frameBuffer
) noexcept {
    // Walls are cheap: always do them on this thread
    for (const DrawJob& job : jobs) {
        if (job.kind == DrawJob::Kind::WallColumn) {
            drawWallColumn(job.wall, view.textures, frameBuffer);
        }
    }

    // No two jobs touch the same pixel, so spans can be split between threads any way we like
    const uint32_t numThreads = std::max(std::min(numSpanThreads, RenderSettings::MAX_SPAN_THREADS), 1u);

    if (numThreads <= 1) {
        drawSpanJobSubset(view, jobs, 0, 1, frameBuffer);
        return;
    }

    std::vector<std::thread> workers;
    workers.reserve(numThreads - 1);
    uint32_t numJobSubsetsStarted = 1;      // Subset '0' is always drawn on this thread

    try {
        for (uint32_t threadIdx = 1; threadIdx < numThreads; ++threadIdx) {
            workers.emplace_back(
                [&view, &jobs, &frameBuffer, threadIdx, numThreads]() noexcept {
                    drawSpanJobSubset(view, jobs, threadIdx, numThreads, frameBuffer);
                }
            );

            ++numJobSubsetsStarted;
        }
    }
    catch (const std::system_error& err) {
        std::printf("Failed to start a span drawing thread, drawing the remaining spans serially: %s\n", err.what());
    }

    drawSpanJobSubset(view, jobs, 0, numThreads, frameBuffer);

    // Anything that didn't get a thread gets done here
    for (uint32_t subsetIdx = numJobSubsetsStarted; subsetIdx < numThreads; ++subsetIdx) {
        drawSpanJobSubset(view, jobs, subsetIdx, numThreads, frameBuffer);
    }

    for (std::thread& worker : workers) {
        worker.join();
    }
}

END_NAMESPACE(Renderer)
