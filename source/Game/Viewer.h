#pragma once

#include "Base/Macros.h"

//----------------------------------------------------------------------------------------------------------------------
// The interactive level viewer: sets up the display, loads a level and runs the main loop until the user quits.
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(Viewer)

// Runs the viewer, returning the exit code for the program.
// If 'levelFileOverride' is not null then it is loaded instead of the level file named in the config.
int run(const char* const levelFileOverride) noexcept;

END_NAMESPACE(Viewer)
