#include "Input.h"

#include <algorithm>
#include <SDL.h>
#include <vector>

BEGIN_NAMESPACE(Input)

static constexpr uint32_t NUM_ACTIONS = (uint32_t) Action::NUM_ACTIONS;

struct KeyBinding {
    SDL_Scancode    key;
    Action          action;
};

static constexpr KeyBinding KEY_BINDINGS[] = {
    { SDL_SCANCODE_W,       Action::MoveForward },
    { SDL_SCANCODE_UP,      Action::MoveForward },
    { SDL_SCANCODE_S,       Action::MoveBack    },
    { SDL_SCANCODE_DOWN,    Action::MoveBack    },
    { SDL_SCANCODE_LEFT,    Action::TurnLeft    },
    { SDL_SCANCODE_RIGHT,   Action::TurnRight   },
    { SDL_SCANCODE_A,       Action::StrafeLeft  },
    { SDL_SCANCODE_D,       Action::StrafeRight },
    { SDL_SCANCODE_P,       Action::ToggleStats },
    { SDL_SCANCODE_ESCAPE,  Action::Quit        },
};

static bool                         gbIsQuitRequested;
static std::vector<SDL_Scancode>    gKeysHeld;
static uint8_t                      gActionKeyCounts[NUM_ACTIONS];      // How many bound keys are held, per action
static bool                         gbActionJustStarted[NUM_ACTIONS];

//----------------------------------------------------------------------------------------------------------------------
// Update the actions bound to a key when it goes up or down
//----------------------------------------------------------------------------------------------------------------------
static void onKeyDown(const SDL_Scancode key) noexcept {
    // Ignore key repeats: the key is already held
    if (std::find(gKeysHeld.begin(), gKeysHeld.end(), key) != gKeysHeld.end())
        return;

    gKeysHeld.push_back(key);

    for (const KeyBinding& binding : KEY_BINDINGS) {
        if (binding.key == key) {
            const uint32_t actionIdx = (uint32_t) binding.action;
            gbActionJustStarted[actionIdx] |= (gActionKeyCounts[actionIdx] == 0);
            ++gActionKeyCounts[actionIdx];
        }
    }
}

static void onKeyUp(const SDL_Scancode key) noexcept {
    const auto keyIter = std::find(gKeysHeld.begin(), gKeysHeld.end(), key);

    if (keyIter == gKeysHeld.end())
        return;

    gKeysHeld.erase(keyIter);

    for (const KeyBinding& binding : KEY_BINDINGS) {
        if (binding.key == key) {
            --gActionKeyCounts[(uint32_t) binding.action];
        }
    }
}

static void releaseAllKeys() noexcept {
    gKeysHeld.clear();
    std::fill(std::begin(gActionKeyCounts), std::end(gActionKeyCounts), (uint8_t) 0);
    std::fill(std::begin(gbActionJustStarted), std::end(gbActionJustStarted), false);
}

//----------------------------------------------------------------------------------------------------------------------
// Handle events sent by SDL (keypresses and such)
//----------------------------------------------------------------------------------------------------------------------
static void handleSdlEvents() noexcept {
    SDL_Event sdlEvent;

    while (SDL_PollEvent(&sdlEvent) != 0) {
        switch (sdlEvent.type) {
            case SDL_QUIT:
                gbIsQuitRequested = true;
                break;

            case SDL_KEYDOWN:
                onKeyDown(sdlEvent.key.keysym.scancode);
                break;

            case SDL_KEYUP:
                onKeyUp(sdlEvent.key.keysym.scancode);
                break;

            case SDL_WINDOWEVENT: {
                // Don't leave keys stuck down if the window loses focus while they are held
                if (sdlEvent.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
                    releaseAllKeys();
                }
            }   break;
        }
    }
}

void init() noexcept {
    gbIsQuitRequested = false;
    gKeysHeld.reserve(16);
    releaseAllKeys();
}

void shutdown() noexcept {
    releaseAllKeys();
    gKeysHeld.shrink_to_fit();
    gbIsQuitRequested = false;
}

void update() noexcept {
    std::fill(std::begin(gbActionJustStarted), std::end(gbActionJustStarted), false);
    handleSdlEvents();

    if (gbActionJustStarted[(uint32_t) Action::Quit]) {
        gbIsQuitRequested = true;
    }
}

bool isQuitRequested() noexcept {
    return gbIsQuitRequested;
}

bool isActionActive(const Action action) noexcept {
    ASSERT(action < Action::NUM_ACTIONS);
    return (gActionKeyCounts[(uint32_t) action] > 0);
}

bool isActionJustStarted(const Action action) noexcept {
    ASSERT(action < Action::NUM_ACTIONS);
    return gbActionJustStarted[(uint32_t) action];
}

END_NAMESPACE(Input)
