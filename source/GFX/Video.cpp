#include "Video.h"

#include "Game/Config.h"
#include "ImageData.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <SDL.h>

BEGIN_NAMESPACE(Video)

static SDL_Window*     gWindow;
static SDL_Renderer*   gRenderer;
static SDL_Texture*    gFramebufferTexture;

uint32_t    gScreenWidth;
uint32_t    gScreenHeight;
uint32_t    gVideoOutputWidth;
uint32_t    gVideoOutputHeight;
SDL_Rect    gOutputRect;
bool        gbIsFullscreen;

static void determineTargetVideoMode() noexcept {
    // Fullscreen mode and render resolution
    gbIsFullscreen = Config::gbFullscreen;
    gScreenWidth = Config::gScreenWidth;
    gScreenHeight = Config::gScreenHeight;

    // Get the current screen resolution.
    // Note: MAY not be correct for multiple monitors.
    SDL_DisplayMode screenMode = {};

    if (SDL_GetCurrentDisplayMode(0, &screenMode) != 0) {
        FATAL_ERROR_F("Failed to determine current screen video mode: %s", SDL_GetError());
    }

    // Determine output width and height.
    // In fullscreen mode use the screen resolution, otherwise the window is an integer multiple of the render size.
    if (gbIsFullscreen) {
        gVideoOutputWidth = (uint32_t) screenMode.w;
        gVideoOutputHeight = (uint32_t) screenMode.h;
    } else {
        gVideoOutputWidth = gScreenWidth * Config::gOutputScale;
        gVideoOutputHeight = gScreenHeight * Config::gOutputScale;
    }

    const bool bInvalidOutputSize = (
        (gVideoOutputWidth < gScreenWidth) ||
        (gVideoOutputHeight < gScreenHeight)
    );

    if (bInvalidOutputSize) {
        FATAL_ERROR_F(
            "Size of rendered image (%u x %u) exceeds output area size (%u x %u)! "
            "Downscaling is not supported!",
            gScreenWidth,
            gScreenHeight,
            gVideoOutputWidth,
            gVideoOutputHeight
        );
    }

    // Determine the width and height of the output rect: keep the aspect ratio and center the output
    const float outputScaleX = (float) gVideoOutputWidth / (float) gScreenWidth;
    const float outputScaleY = (float) gVideoOutputHeight / (float) gScreenHeight;
    const float outputScale = std::min(outputScaleX, outputScaleY);

    gOutputRect.w = (int)((float) gScreenWidth * outputScale);
    gOutputRect.h = (int)((float) gScreenHeight * outputScale);
    gOutputRect.x = ((int) gVideoOutputWidth - gOutputRect.w) / 2;
    gOutputRect.y = ((int) gVideoOutputHeight - gOutputRect.h) / 2;
}

void init() noexcept {
    // Initialize SDL subsystems
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
        FATAL_ERROR_F("Unable to initialize SDL: %s", SDL_GetError());
    }

    // Determine the video mode to use
    determineTargetVideoMode();

    // Create the window
    const Uint32 windowCreateFlags = (gbIsFullscreen) ? SDL_WINDOW_FULLSCREEN : 0;

    gWindow = SDL_CreateWindow(
        "RetroBSP",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        (int) gVideoOutputWidth,
        (int) gVideoOutputHeight,
        windowCreateFlags
    );

    if (!gWindow) {
        FATAL_ERROR_F("Unable to create a window: %s", SDL_GetError());
    }

    // Create the renderer and framebuffer texture
    gRenderer = SDL_CreateRenderer(gWindow, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);

    if (!gRenderer) {
        FATAL_ERROR_F("Failed to create renderer: %s", SDL_GetError());
    }

    gFramebufferTexture = SDL_CreateTexture(
        gRenderer,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING,
        (int) gScreenWidth,
        (int) gScreenHeight
    );

    if (!gFramebufferTexture) {
        FATAL_ERROR_F("Failed to create a framebuffer texture: %s", SDL_GetError());
    }

    // Clear the renderer to black
    SDL_SetRenderDrawColor(gRenderer, 0, 0, 0, 0);
    SDL_RenderClear(gRenderer);
}

void shutdown() noexcept {
    SDL_DestroyTexture(gFramebufferTexture);
    gFramebufferTexture = nullptr;
    SDL_DestroyRenderer(gRenderer);
    gRenderer = nullptr;
    SDL_DestroyWindow(gWindow);
    gWindow = nullptr;
    SDL_QuitSubSystem(SDL_INIT_VIDEO);

    gScreenWidth = 0;
    gScreenHeight = 0;
    gVideoOutputWidth = 0;
    gVideoOutputHeight = 0;
    gOutputRect = {};
    gbIsFullscreen = false;
}

SDL_Window* getWindow() noexcept {
    return gWindow;
}

void present(const ImageData& frame) noexcept {
    ASSERT(frame.width == gScreenWidth);
    ASSERT(frame.height == gScreenHeight);

    // Copy the frame into the texture row by row, since the texture rows may be padded
    void* pTexPixels = nullptr;
    int texPitch = 0;

    if (SDL_LockTexture(gFramebufferTexture, nullptr, &pTexPixels, &texPitch) != 0) {
        FATAL_ERROR_F("Failed to lock the framebuffer texture for writing: %s", SDL_GetError());
    }

    const size_t rowSize = (size_t) frame.width * sizeof(uint32_t);

    for (uint32_t y = 0; y < frame.height; ++y) {
        uint8_t* const pDstRow = (uint8_t*) pTexPixels + (size_t) y * (size_t) texPitch;
        std::memcpy(pDstRow, frame.pixels.data() + (size_t) y * frame.width, rowSize);
    }

    SDL_UnlockTexture(gFramebufferTexture);

    SDL_RenderClear(gRenderer);
    SDL_RenderCopy(gRenderer, gFramebufferTexture, nullptr, &gOutputRect);
    SDL_RenderPresent(gRenderer);
}

END_NAMESPACE(Video)
