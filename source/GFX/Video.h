#pragma once

#include "Base/Macros.h"
#include <cstdint>

struct ImageData;
struct SDL_Window;

BEGIN_NAMESPACE(Video)

// The resolution that the renderer draws at.
// This is NOT the output resolution.
extern uint32_t gScreenWidth;
extern uint32_t gScreenHeight;

// This is the actual resolution of the window outputted to.
// In fullscreen mode this is the screen resolution.
extern uint32_t gVideoOutputWidth;
extern uint32_t gVideoOutputHeight;

// If true then the viewer is in fullscreen mode.
extern bool gbIsFullscreen;

// Create and destroy the display: the screen size and output settings come from the config
void init() noexcept;
void shutdown() noexcept;

// Get a handle to the underlying SDL window
SDL_Window* getWindow() noexcept;

// Copies the given frame (which must be the screen size) to the screen and presents it
void present(const ImageData& frame) noexcept;

END_NAMESPACE(Video)
