#pragma once

#include "LevelGeometry.h"

class TextureBank;

//----------------------------------------------------------------------------------------------------------------------
// Small levels built in code along with procedurally generated textures for them.
// Used by the viewer when no level file is given, and by tests.
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(DemoLevels)

// Ids of the demo textures in a texture bank
struct DemoTextures {
    uint32_t brickWall;
    uint32_t stoneWall;
    uint32_t stepWall;
    uint32_t floorTiles;
    uint32_t ceilingPanels;
    uint32_t grassFloor;
};

// Where the viewer starts out in a demo level
struct StartPoint {
    float x;
    float y;
    float angle;
};

// Generate the demo textures and add them to the texture bank
DemoTextures addDemoTextures(TextureBank& textures) noexcept;

//----------------------------------------------------------------------------------------------------------------------
// A single sector rectangular room with corners (0, 0) and (width, depth).
// It is convex so it is a single subsector and needs no BSP nodes.
//----------------------------------------------------------------------------------------------------------------------
LevelRecords makeRectangularRoom(
    const float width,
    const float depth,
    const float floorHeight,
    const float ceilingHeight,
    const uint32_t lightLevel,
    const uint32_t wallTex,
    const uint32_t floorTex,
    const uint32_t ceilingTex
) noexcept;

//----------------------------------------------------------------------------------------------------------------------
// Two rooms side by side, joined by an opening in the middle of the wall between them.
// The second room has a raised floor and a lower ceiling, so the opening has a step below it and a lintel above it.
// One BSP node splits the level along the shared wall.
//----------------------------------------------------------------------------------------------------------------------
LevelRecords makeTwoRoomLevel(const DemoTextures& tex) noexcept;

StartPoint getTwoRoomLevelStart() noexcept;

END_NAMESPACE(DemoLevels)
