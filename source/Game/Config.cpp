#include "Config.h"

#include "Base/FileUtils.h"
#include "Base/IniUtils.h"
#include <algorithm>
#include <filesystem>
#include <system_error>

BEGIN_NAMESPACE(Config)

static constexpr const char* const DEFAULT_CONFIG_INI =
R"(#---------------------------------------------------------------------------------------------------
# === RetroBSP config file ===
#
# If you want to regenerate this file to the defaults, just delete it and restart the viewer!
#---------------------------------------------------------------------------------------------------

####################################################################################################
[Video]
####################################################################################################

#---------------------------------------------------------------------------------------------------
# Fullscreen or windowed mode toggle.
# Set to '1' cause the app to launch in fullscreen mode, and '0' to use windowed mode.
#---------------------------------------------------------------------------------------------------
Fullscreen = 0

#---------------------------------------------------------------------------------------------------
# In windowed mode the window is this integer multiple of the screen size below.
#---------------------------------------------------------------------------------------------------
OutputScale = 3

####################################################################################################
[Renderer]
####################################################################################################

#---------------------------------------------------------------------------------------------------
# Resolution that the renderer draws at internally, before being scaled up to the window.
# Higher resolutions will be MUCH slower due to the demands of software rendering on the CPU.
#---------------------------------------------------------------------------------------------------
ScreenWidth = 320
ScreenHeight = 200

#---------------------------------------------------------------------------------------------------
# Horizontal field of view in degrees.
#---------------------------------------------------------------------------------------------------
FieldOfView = 90

#---------------------------------------------------------------------------------------------------
# View depths are never allowed to go below this value before dividing by them.
# Stops walls right in front of the camera from producing infinite screen coordinates.
#---------------------------------------------------------------------------------------------------
DepthEpsilon = 0.00390625

#---------------------------------------------------------------------------------------------------
# Maximum number of floor/ceiling planes that can be batched up at once.
# When this runs out the oldest plane is drawn early to make room: nothing goes missing, but the
# batching of floor and ceiling spans gets worse.
#---------------------------------------------------------------------------------------------------
MaxVisplanes = 128

#---------------------------------------------------------------------------------------------------
# Number of threads used to draw floors and ceilings.
#---------------------------------------------------------------------------------------------------
SpanThreads = 1

#---------------------------------------------------------------------------------------------------
# If set to '0' then the renderer will NOT apply so called 'fake contrast', a technique which
# darkens walls at certain orientations in order to make corners stand out more.
#---------------------------------------------------------------------------------------------------
DoFakeContrast = 1

####################################################################################################
[Level]
####################################################################################################

#---------------------------------------------------------------------------------------------------
# Path to a level file to view. Leave empty to view the built in demo level.
#---------------------------------------------------------------------------------------------------
File =

#---------------------------------------------------------------------------------------------------
# Height of the eye above the floor.
#---------------------------------------------------------------------------------------------------
EyeHeight = 41
)";

// Limits for settings which are not renderer limits
static constexpr uint32_t   MAX_OUTPUT_SCALE    = 16;
static constexpr float      MIN_FIELD_OF_VIEW   = 30.0f;
static constexpr float      MAX_FIELD_OF_VIEW   = 150.0f;
static constexpr float      MIN_DEPTH_EPSILON   = 1.0f / 65536.0f;
static constexpr float      MAX_DEPTH_EPSILON   = 1.0f;
static constexpr float      MAX_EYE_HEIGHT      = 1024.0f;

bool            gbFullscreen;
uint32_t        gOutputScale;
uint32_t        gScreenWidth;
uint32_t        gScreenHeight;
float           gFieldOfView;
float           gDepthEpsilon;
uint32_t        gMaxVisplanes;
uint32_t        gSpanThreads;
bool            gbDoFakeContrast;
std::string     gLevelFile;
float           gEyeHeight;

//----------------------------------------------------------------------------------------------------------------------
// Read an unsigned int setting and clamp it to the given range
//----------------------------------------------------------------------------------------------------------------------
static uint32_t getClampedUIntValue(
    const IniUtils::Entry& entry,
    const uint32_t defaultValue,
    const uint32_t minValue,
    const uint32_t maxValue
) noexcept {
    const int32_t value = entry.getIntValue((int32_t) defaultValue);
    return (uint32_t) std::min(std::max(value, (int32_t) minValue), (int32_t) maxValue);
}

//----------------------------------------------------------------------------------------------------------------------
// Writes the default config ini file if it doesn't exist on disk.
// Returns 'true' if a new file was written.
//----------------------------------------------------------------------------------------------------------------------
static bool regenerateDefaultConfigFileIfNotPresent(const std::string& iniFilePath) noexcept {
    std::error_code fsError;
    const bool bCfgFileExists = std::filesystem::exists(iniFilePath, fsError);

    if (fsError) {
        FATAL_ERROR_F("Unable to determine if the config file '%s' exists: %s", iniFilePath.c_str(), fsError.message().c_str());
    }

    if (bCfgFileExists)
        return false;

    std::printf("No config file found! Generating a new one with the default settings at: %s\n", iniFilePath.c_str());
    const std::string configFile = DEFAULT_CONFIG_INI;

    if (!FileUtils::writeFile(iniFilePath.c_str(), (const std::byte*) configFile.data(), configFile.length())) {
        FATAL_ERROR_F(
            "Failed to generate/write the default config file to path '%s'! "
            "Is there write access to this location, or is the disk full?",
            iniFilePath.c_str()
        );
    }

    return true;
}

static void handleConfigEntry(const IniUtils::Entry& entry) noexcept {
    if (entry.section == "Video") {
        if (entry.key == "Fullscreen") {
            gbFullscreen = entry.getBoolValue(gbFullscreen);
        }
        else if (entry.key == "OutputScale") {
            gOutputScale = getClampedUIntValue(entry, gOutputScale, 1, MAX_OUTPUT_SCALE);
        }
    }
    else if (entry.section == "Renderer") {
        if (entry.key == "ScreenWidth") {
            gScreenWidth = getClampedUIntValue(entry, gScreenWidth, RenderSettings::MIN_SCREEN_SIZE, RenderSettings::MAX_SCREEN_SIZE);
        }
        else if (entry.key == "ScreenHeight") {
            gScreenHeight = getClampedUIntValue(entry, gScreenHeight, RenderSettings::MIN_SCREEN_SIZE, RenderSettings::MAX_SCREEN_SIZE);
        }
        else if (entry.key == "FieldOfView") {
            gFieldOfView = FMath::clamp(entry.getFloatValue(gFieldOfView), MIN_FIELD_OF_VIEW, MAX_FIELD_OF_VIEW);
        }
        else if (entry.key == "DepthEpsilon") {
            gDepthEpsilon = FMath::clamp(entry.getFloatValue(gDepthEpsilon), MIN_DEPTH_EPSILON, MAX_DEPTH_EPSILON);
        }
        else if (entry.key == "MaxVisplanes") {
            gMaxVisplanes = getClampedUIntValue(entry, gMaxVisplanes, RenderSettings::MIN_VISPLANES, RenderSettings::MAX_VISPLANES);
        }
        else if (entry.key == "SpanThreads") {
            gSpanThreads = getClampedUIntValue(entry, gSpanThreads, 1, RenderSettings::MAX_SPAN_THREADS);
        }
        else if (entry.key == "DoFakeContrast") {
            gbDoFakeContrast = entry.getBoolValue(gbDoFakeContrast);
        }
    }
    else if (entry.section == "Level") {
        if (entry.key == "File") {
            gLevelFile = entry.value;
        }
        else if (entry.key == "EyeHeight") {
            gEyeHeight = FMath::clamp(entry.getFloatValue(gEyeHeight), 0.0f, MAX_EYE_HEIGHT);
        }
    }
    else {
        std::printf("Config: ignoring setting '%s' in unknown section '%s'\n", entry.key.c_str(), entry.section.c_str());
    }
}

void clear() noexcept {
    gbFullscreen = false;
    gOutputScale = 3;

    gScreenWidth = 320;
    gScreenHeight = 200;
    gFieldOfView = 90.0f;
    gDepthEpsilon = 1.0f / 256.0f;
    gMaxVisplanes = 128;
    gSpanThreads = 1;
    gbDoFakeContrast = true;

    gLevelFile.clear();
    gEyeHeight = 41.0f;
}

void parseConfigText(const char* const pText, const size_t textLen) noexcept {
    IniUtils::parseIniFromString(pText, textLen, handleConfigEntry);
}

const char* getDefaultConfigText() noexcept {
    return DEFAULT_CONFIG_INI;
}

bool init(const std::string& iniFilePath) noexcept {
    clear();

    // Regenerate the config file if it doesn't exist
    const bool bGeneratedConfig = regenerateDefaultConfigFileIfNotPresent(iniFilePath);

    // Firstly read the ini file bytes, if that fails then abort with an error
    std::vector<std::byte> iniFileData;

    if (!FileUtils::readFile(iniFilePath.c_str(), iniFileData)) {
        FATAL_ERROR_F("Failed to read the config file at path '%s'!", iniFilePath.c_str());
    }

    // Parse the ini file
    parseConfigText((const char*) iniFileData.data(), iniFileData.size());
    return bGeneratedConfig;
}

void shutdown() noexcept {
    gLevelFile.clear();
    gLevelFile.shrink_to_fit();
}

RenderSettings getRenderSettings() noexcept {
    RenderSettings settings;
    settings.screenWidth = gScreenWidth;
    settings.screenHeight = gScreenHeight;
    settings.fieldOfView = FMath::degToRad(gFieldOfView);
    settings.depthEpsilon = gDepthEpsilon;
    settings.maxVisplanes = gMaxVisplanes;
    settings.spanThreads = gSpanThreads;
    return settings;
}

END_NAMESPACE(Config)
