#pragma once

#include "GFX/RenderSettings.h"
#include <string>

BEGIN_NAMESPACE(Config)

// Video settings
extern bool         gbFullscreen;
extern uint32_t     gOutputScale;

// Renderer settings
extern uint32_t     gScreenWidth;
extern uint32_t     gScreenHeight;
extern float        gFieldOfView;           // In degrees
extern float        gDepthEpsilon;
extern uint32_t     gMaxVisplanes;
extern uint32_t     gSpanThreads;
extern bool         gbDoFakeContrast;

// Level settings
extern std::string  gLevelFile;             // Empty to use the built in demo level
extern float        gEyeHeight;

// Startup and shutdown the config module.
// Init reads the given config ini, writing one with the default settings first if it doesn't exist yet.
// Returns 'true' if a default config file had to be generated.
bool init(const std::string& iniFilePath) noexcept;
void shutdown() noexcept;

// Reset all settings to their defaults
void clear() noexcept;

// Apply the settings in the given ini text on top of the current settings
void parseConfigText(const char* const pText, const size_t textLen) noexcept;

// The text of the default config file
const char* getDefaultConfigText() noexcept;

// Make the settings for the renderer from the current config
RenderSettings getRenderSettings() noexcept;

END_NAMESPACE(Config)
