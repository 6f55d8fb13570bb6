#include "Viewer.h"

#include "Base/Finally.h"
#include "Base/FMath.h"
#include "Base/Input.h"
#include "Config.h"
#include "GFX/FrameContext.h"
#include "GFX/Renderer.h"
#include "GFX/Textures.h"
#include "GFX/Video.h"
#include "Map/DemoLevels.h"
#include "Map/LevelFile.h"
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <SDL.h>

BEGIN_NAMESPACE(Viewer)

static constexpr float MOVE_SPEED = 256.0f;             // World units per second
static constexpr float TURN_SPEED = FMath::ANGLE_90<float>;    // Radians per second
static constexpr float MAX_FRAME_TIME = 0.1f;           // Clamp for long frames, in seconds

// How many frames to average the frame time over when showing performance stats
static constexpr uint32_t PERF_NUM_FRAMES_TO_AVERAGE = 60;

//----------------------------------------------------------------------------------------------------------------------
// Show an error message box to the user, and log the message too
//----------------------------------------------------------------------------------------------------------------------
static void showError(const char* const title, const std::string& message) noexcept {
    std::printf("%s: %s\n", title, message.c_str());
    SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, title, message.c_str(), Video::getWindow());
}

//----------------------------------------------------------------------------------------------------------------------
// Load the config ini from the user's preferences folder
//----------------------------------------------------------------------------------------------------------------------
static void initConfig() noexcept {
    char* const pPrefPath = SDL_GetPrefPath("RetroBSP", "RetroBSP");

    if (!pPrefPath) {
        FATAL_ERROR_F("Failed to determine the user preferences folder: %s", SDL_GetError());
    }

    auto freePrefPath = finally([&]() noexcept { SDL_free(pPrefPath); });
    const std::string iniFilePath = std::string(pPrefPath) + "config.ini";

    Config::init(iniFilePath);
}

//----------------------------------------------------------------------------------------------------------------------
// Load the level to view: either the given level file or the built in demo level if no file is given.
// The demo textures are always added to the texture bank; texture ids in level files refer to the same bank.
// On failure an error is shown to the user and nothing is returned.
//----------------------------------------------------------------------------------------------------------------------
static std::optional<LevelGeometry> loadLevel(
    const std::string& levelFile,
    TextureBank& textures,
    DemoLevels::StartPoint& startPoint
) noexcept {
    const DemoLevels::DemoTextures demoTextures = DemoLevels::addDemoTextures(textures);
    startPoint = DemoLevels::getTwoRoomLevelStart();

    try {
        LevelRecords records;

        if (levelFile.empty()) {
            records = DemoLevels::makeTwoRoomLevel(demoTextures);
        } else {
            records = LevelFile::loadFromFile(levelFile.c_str());

            // Start in the middle of the first subsector's first seg's bounding area: as good a guess as any
            if ((!records.segs.empty()) && (!records.vertexes.empty())) {
                const SegRecord& seg = records.segs[0];

                if ((seg.v1 < records.vertexes.size()) && (seg.v2 < records.vertexes.size())) {
                    const Vertex& v1 = records.vertexes[seg.v1];
                    const Vertex& v2 = records.vertexes[seg.v2];
                    const float dx = v2.x - v1.x;
                    const float dy = v2.y - v1.y;
                    const float len = std::sqrt(dx * dx + dy * dy);

                    if (len > 0.0f) {
                        // Step a little way in front of the seg (the front is the right hand side)
                        startPoint.x = (v1.x + v2.x) * 0.5f + (dy / len) * 32.0f;
                        startPoint.y = (v1.y + v2.y) * 0.5f - (dx / len) * 32.0f;
                        startPoint.angle = std::atan2(-dx, dy);
                    }
                }
            }
        }

        LevelGeometry level = LevelGeometry::load(records, Config::gbDoFakeContrast);
        std::printf(
            "Loaded level '%s': %u vertexes, %u sectors, %u lines, %u segs, %u subsectors, %u nodes\n",
            (levelFile.empty()) ? "<demo>" : levelFile.c_str(),
            (uint32_t) level.getVertexes().size(),
            (uint32_t) level.getSectors().size(),
            (uint32_t) level.getLines().size(),
            (uint32_t) level.getSegs().size(),
            (uint32_t) level.getSubsectors().size(),
            (uint32_t) level.getNodes().size()
        );

        return level;
    }
    catch (const MalformedLevelException& exception) {
        showError("Failed to load level", exception.what());
        return std::nullopt;
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Move and turn the camera based on which movement actions are held
//----------------------------------------------------------------------------------------------------------------------
static void updateCamera(const LevelGeometry& level, const float frameTime, CameraPose& pose) noexcept {
    const bool bForward = Input::isActionActive(Input::Action::MoveForward);
    const bool bBack = Input::isActionActive(Input::Action::MoveBack);
    const bool bTurnLeft = Input::isActionActive(Input::Action::TurnLeft);
    const bool bTurnRight = Input::isActionActive(Input::Action::TurnRight);
    const bool bStrafeLeft = Input::isActionActive(Input::Action::StrafeLeft);
    const bool bStrafeRight = Input::isActionActive(Input::Action::StrafeRight);

    // Angles increase counter clockwise, so turning left is a positive turn
    float turn = 0.0f;
    turn += (bTurnLeft) ? TURN_SPEED : 0.0f;
    turn -= (bTurnRight) ? TURN_SPEED : 0.0f;
    pose.angle = FMath::normalizeRadians(pose.angle + turn * frameTime);

    float forwardMove = 0.0f;
    forwardMove += (bForward) ? MOVE_SPEED : 0.0f;
    forwardMove -= (bBack) ? MOVE_SPEED : 0.0f;

    float sideMove = 0.0f;
    sideMove += (bStrafeRight) ? MOVE_SPEED : 0.0f;
    sideMove -= (bStrafeLeft) ? MOVE_SPEED : 0.0f;

    const float cosA = std::cos(pose.angle);
    const float sinA = std::sin(pose.angle);
    pose.x += (cosA * forwardMove + sinA * sideMove) * frameTime;
    pose.y += (sinA * forwardMove - cosA * sideMove) * frameTime;

    // Keep the eye at a fixed height above whatever floor is below
    pose.z = level.getFloorHeightAt(pose.x, pose.y) + Config::gEyeHeight;
}

//----------------------------------------------------------------------------------------------------------------------
// Print the stats for the last frame
//----------------------------------------------------------------------------------------------------------------------
static void printFrameStats(const Renderer::FrameStats& stats, const uint64_t avgFrameUSec) noexcept {
    std::printf(
        "Frame: %llu usec, %u segs, %u wall columns, %u spans, %u visplanes (%u merged, %u overflow flushes), "
        "%u missing textures, %u culled nodes, %u subsectors\n",
        (unsigned long long) avgFrameUSec,
        stats.numSegsDrawn,
        stats.numWallColumns,
        stats.numSpans,
        stats.numVisplanes,
        stats.numMergedVisplanes,
        stats.numOverflowFlushes,
        stats.numMissingTextures,
        stats.numCulledNodes,
        (uint32_t) stats.subsectorOrder.size()
    );
}

int run(const char* const levelFileOverride) noexcept {
    // Init main subsystems
    if (SDL_Init(SDL_INIT_EVENTS) != 0) {
        FATAL_ERROR_F("Unable to initialize SDL: %s", SDL_GetError());
    }

    auto quitSdl = finally([]() noexcept { SDL_Quit(); });

    initConfig();
    auto shutdownConfig = finally([]() noexcept { Config::shutdown(); });

    Video::init();
    auto shutdownVideo = finally([]() noexcept { Video::shutdown(); });

    Input::init();
    auto shutdownInput = finally([]() noexcept { Input::shutdown(); });

    // Load the level
    TextureBank textures;
    DemoLevels::StartPoint startPoint = {};
    const std::string levelFile = (levelFileOverride) ? levelFileOverride : Config::gLevelFile;
    std::optional<LevelGeometry> level = loadLevel(levelFile, textures, startPoint);

    if (!level) {
        return 1;
    }

    // Setup the camera and frame state
    const RenderSettings renderSettings = Config::getRenderSettings();
    Renderer::FrameContext frame;
    ImageData frameBuffer = {};

    CameraPose pose = {};
    pose.x = startPoint.x;
    pose.y = startPoint.y;
    pose.angle = startPoint.angle;
    pose.z = level->getFloorHeightAt(pose.x, pose.y) + Config::gEyeHeight;

    // Performance counters: toggled with the 'P' key
    bool bShowPerfStats = false;
    uint64_t perfRunningTotal = 0;
    uint32_t perfFramesDone = 0;
    const uint64_t perfClocksPerSecond = SDL_GetPerformanceFrequency();
    uint64_t lastFrameClock = SDL_GetPerformanceCounter();

    // Run the main loop until instructed to exit
    while (true) {
        Input::update();

        if (Input::isQuitRequested())
            break;

        if (Input::isActionJustStarted(Input::Action::ToggleStats)) {
            bShowPerfStats = (!bShowPerfStats);
        }

        // Figure out how much time has passed since the last frame and update the camera
        const uint64_t frameStartClock = SDL_GetPerformanceCounter();
        const float frameTime = std::fmin(
            (float)((double)(frameStartClock - lastFrameClock) / (double) perfClocksPerSecond),
            MAX_FRAME_TIME
        );

        lastFrameClock = frameStartClock;
        updateCamera(*level, frameTime, pose);

        // Render and present the frame
        Renderer::drawFrame(*level, textures, pose, renderSettings, frame, frameBuffer);
        const uint64_t frameEndClock = SDL_GetPerformanceCounter();
        Video::present(frameBuffer);

        // Performance profiling: if it's time to show the averaged result then do that now
        perfRunningTotal += frameEndClock - frameStartClock;
        ++perfFramesDone;

        if (perfFramesDone >= PERF_NUM_FRAMES_TO_AVERAGE) {
            const uint64_t perfAvgClocks = perfRunningTotal / PERF_NUM_FRAMES_TO_AVERAGE;
            perfRunningTotal = 0;
            perfFramesDone = 0;

            if (bShowPerfStats) {
                const double perfSeconds = (double) perfAvgClocks / (double) perfClocksPerSecond;
                printFrameStats(frame.stats, (uint64_t)(perfSeconds * 1000000.0));
            }
        }
    }

    return 0;
}

END_NAMESPACE(Viewer)
