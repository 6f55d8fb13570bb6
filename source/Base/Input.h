#pragma once

#include "Macros.h"
#include <cstdint>

//----------------------------------------------------------------------------------------------------------------------
// Turns SDL window and keyboard events into the actions used to drive the viewer.
// Several keys may be bound to the same action; the action is active while any of them is held.
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(Input)

enum class Action : uint8_t {
    MoveForward,
    MoveBack,
    TurnLeft,
    TurnRight,
    StrafeLeft,
    StrafeRight,
    ToggleStats,
    Quit,
    NUM_ACTIONS
};

void init() noexcept;
void shutdown() noexcept;

// Process pending SDL events. Should be called once per frame, before querying actions.
void update() noexcept;

// True if the window was closed or the quit action was triggered
bool isQuitRequested() noexcept;

// Whether an action is held, and whether it only started being held this frame
bool isActionActive(const Action action) noexcept;
bool isActionJustStarted(const Action action) noexcept;

END_NAMESPACE(Input)
