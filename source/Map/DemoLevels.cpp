#include "DemoLevels.h"

#include "GFX/Textures.h"

BEGIN_NAMESPACE(DemoLevels)

static constexpr uint32_t DEMO_TEX_SIZE = 64;

// Size of each room in the two room level and the extents of the opening between them
static constexpr float ROOM_SIZE = 512.0f;
static constexpr float OPENING_Y1 = 192.0f;
static constexpr float OPENING_Y2 = 320.0f;

//----------------------------------------------------------------------------------------------------------------------
// Texture generation helpers
//----------------------------------------------------------------------------------------------------------------------
static uint32_t makeColor(const uint32_t r, const uint32_t g, const uint32_t b) noexcept {
    return ImageDataUtils::encodeRGB(r, g, b);
}

// Cheap deterministic noise for giving the textures some grain
static uint32_t hashNoise(const uint32_t x, const uint32_t y, const uint32_t seed) noexcept {
    uint32_t h = x * 374761393u + y * 668265263u + seed * 2246822519u;
    h = (h ^ (h >> 13)) * 1274126177u;
    return (h ^ (h >> 16)) & 0xFu;
}

template <class PixelFunc>
static uint32_t addGeneratedTexture(
    TextureBank& textures,
    const char* const name,
    const uint32_t width,
    const uint32_t height,
    const PixelFunc& pixelFunc
) noexcept {
    std::vector<uint32_t> pixels(width * height);

    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            pixels[y * width + x] = pixelFunc(x, y);
        }
    }

    return textures.addTexture(name, width, height, std::move(pixels));
}

DemoTextures addDemoTextures(TextureBank& textures) noexcept {
    DemoTextures tex = {};

    // Red bricks: 16 rows high, 32 wide, every second row offset by half a brick
    tex.brickWall = addGeneratedTexture(textures, "BRICK", DEMO_TEX_SIZE, DEMO_TEX_SIZE,
        [](const uint32_t x, const uint32_t y) noexcept {
            const uint32_t row = y / 16;
            const uint32_t brickX = (x + ((row & 1) ? 16 : 0)) % 32;
            const bool bMortar = ((y % 16) == 0) || (brickX == 0);
            const uint32_t noise = hashNoise(x, y, 1);
            return (bMortar) ? makeColor(120 + noise, 120 + noise, 110 + noise) : makeColor(150 + noise * 2, 50 + noise, 40);
        }
    );

    // Grey stone blocks
    tex.stoneWall = addGeneratedTexture(textures, "STONE", DEMO_TEX_SIZE, DEMO_TEX_SIZE,
        [](const uint32_t x, const uint32_t y) noexcept {
            const bool bSeam = ((x % 32) == 0) || ((y % 32) == 0);
            const uint32_t noise = hashNoise(x, y, 2) * 3;
            return (bSeam) ? makeColor(60, 60, 64) : makeColor(110 + noise, 110 + noise, 116 + noise);
        }
    );

    // Yellow and black hazard stripes for step faces
    tex.stepWall = addGeneratedTexture(textures, "STEP", DEMO_TEX_SIZE, 16,
        [](const uint32_t x, const uint32_t y) noexcept {
            const bool bStripe = (((x + y) / 8) & 1) != 0;
            return (bStripe) ? makeColor(200, 170, 20) : makeColor(30, 30, 30);
        }
    );

    // Floor tiles
    tex.floorTiles = addGeneratedTexture(textures, "FLOOR", DEMO_TEX_SIZE, DEMO_TEX_SIZE,
        [](const uint32_t x, const uint32_t y) noexcept {
            const bool bGrout = ((x % 32) == 0) || ((y % 32) == 0);
            const bool bDarkTile = (((x / 32) + (y / 32)) & 1) != 0;
            const uint32_t noise = hashNoise(x, y, 3);

            if (bGrout)
                return makeColor(40, 40, 40);

            return (bDarkTile) ? makeColor(90 + noise, 80 + noise, 70) : makeColor(150 + noise, 140 + noise, 120);
        }
    );

    // Ceiling panels
    tex.ceilingPanels = addGeneratedTexture(textures, "CEIL", DEMO_TEX_SIZE, DEMO_TEX_SIZE,
        [](const uint32_t x, const uint32_t y) noexcept {
            const bool bFrame = ((x % 16) == 0) || ((y % 16) == 0);
            return (bFrame) ? makeColor(70, 70, 80) : makeColor(170, 170, 180);
        }
    );

    // Grass
    tex.grassFloor = addGeneratedTexture(textures, "GRASS", DEMO_TEX_SIZE, DEMO_TEX_SIZE,
        [](const uint32_t x, const uint32_t y) noexcept {
            const uint32_t noise = hashNoise(x, y, 4) * 4;
            return makeColor(30 + noise / 2, 90 + noise, 30);
        }
    );

    return tex;
}

//----------------------------------------------------------------------------------------------------------------------
// Level building helpers
//----------------------------------------------------------------------------------------------------------------------
static uint32_t addSide(LevelRecords& level, const uint32_t sector, const uint32_t top, const uint32_t bottom, const uint32_t mid) noexcept {
    level.sides.push_back(SideDef{ 0.0f, 0.0f, top, bottom, mid, sector });
    return (uint32_t) level.sides.size() - 1;
}

static uint32_t addLine(
    LevelRecords& level,
    const uint32_t v1,
    const uint32_t v2,
    const uint32_t flags,
    const uint32_t frontSide,
    const uint32_t backSide
) noexcept {
    level.lines.push_back(LineDef{ v1, v2, flags, 0, 0, { frontSide, backSide } });
    return (uint32_t) level.lines.size() - 1;
}

// Add a seg covering a whole line on the given side
static uint32_t addSeg(LevelRecords& level, const uint32_t lineIdx, const uint32_t side) noexcept {
    const LineDef& line = level.lines[lineIdx];
    const uint32_t v1 = (side == 0) ? line.v1 : line.v2;
    const uint32_t v2 = (side == 0) ? line.v2 : line.v1;
    level.segs.push_back(SegRecord{ v1, v2, 0.0f, lineIdx, side, INVALID_INDEX });
    return (uint32_t) level.segs.size() - 1;
}

LevelRecords makeRectangularRoom(
    const float width,
    const float depth,
    const float floorHeight,
    const float ceilingHeight,
    const uint32_t lightLevel,
    const uint32_t wallTex,
    const uint32_t floorTex,
    const uint32_t ceilingTex
) noexcept {
    LevelRecords level;
    level.vertexes = {
        { 0.0f, 0.0f },
        { 0.0f, depth },
        { width, depth },
        { width, 0.0f }
    };

    level.sectors.push_back(Sector{ floorHeight, ceilingHeight, floorTex, ceilingTex, lightLevel, 0, 0 });

    // Walk the walls clockwise so the inside of the room is on the front (right) side of every line
    for (uint32_t i = 0; i < 4; ++i) {
        const uint32_t sideIdx = addSide(level, 0, TextureBank::INVALID_TEX_ID, TextureBank::INVALID_TEX_ID, wallTex);
        const uint32_t lineIdx = addLine(level, i, (i + 1) % 4, ML_BLOCKING, sideIdx, INVALID_INDEX);
        addSeg(level, lineIdx, 0);
    }

    level.subsectors.push_back(SubsectorRecord{ 0, 4 });
    return level;
}

LevelRecords makeTwoRoomLevel(const DemoTextures& tex) noexcept {
    LevelRecords level;

    // Room A is x = [0, 512] and room B is x = [512, 1024], both are y = [0, 512]
    level.vertexes = {
        { 0.0f,                 0.0f        },      // 0
        { 0.0f,                 ROOM_SIZE   },      // 1
        { ROOM_SIZE,            ROOM_SIZE   },      // 2
        { ROOM_SIZE,            OPENING_Y2  },      // 3
        { ROOM_SIZE,            OPENING_Y1  },      // 4
        { ROOM_SIZE,            0.0f        },      // 5
        { ROOM_SIZE * 2.0f,     ROOM_SIZE   },      // 6
        { ROOM_SIZE * 2.0f,     0.0f        },      // 7
    };

    constexpr uint32_t SECTOR_A = 0;
    constexpr uint32_t SECTOR_B = 1;
    level.sectors.push_back(Sector{ 0.0f, 128.0f, tex.floorTiles, tex.ceilingPanels, 200, 0, 0 });
    level.sectors.push_back(Sector{ 24.0f, 104.0f, tex.grassFloor, tex.ceilingPanels, 160, 0, 0 });

    const uint32_t noTex = TextureBank::INVALID_TEX_ID;

    // Room A walls, clockwise: west, north, upper east, the opening, lower east, south
    const uint32_t lineAWest = addLine(level, 0, 1, ML_BLOCKING, addSide(level, SECTOR_A, noTex, noTex, tex.brickWall), INVALID_INDEX);
    const uint32_t lineANorth = addLine(level, 1, 2, ML_BLOCKING, addSide(level, SECTOR_A, noTex, noTex, tex.brickWall), INVALID_INDEX);
    const uint32_t lineAEast1 = addLine(level, 2, 3, ML_BLOCKING, addSide(level, SECTOR_A, noTex, noTex, tex.brickWall), INVALID_INDEX);

    const uint32_t openingFront = addSide(level, SECTOR_A, tex.stoneWall, tex.stepWall, noTex);
    const uint32_t openingBack = addSide(level, SECTOR_B, noTex, noTex, noTex);
    const uint32_t lineOpening = addLine(level, 3, 4, ML_TWOSIDED, openingFront, openingBack);

    const uint32_t lineAEast2 = addLine(level, 4, 5, ML_BLOCKING, addSide(level, SECTOR_A, noTex, noTex, tex.brickWall), INVALID_INDEX);
    const uint32_t lineASouth = addLine(level, 5, 0, ML_BLOCKING, addSide(level, SECTOR_A, noTex, noTex, tex.brickWall), INVALID_INDEX);

    // Room B walls, clockwise: lower west, upper west, north, east, south
    const uint32_t lineBWest1 = addLine(level, 5, 4, ML_BLOCKING, addSide(level, SECTOR_B, noTex, noTex, tex.stoneWall), INVALID_INDEX);
    const uint32_t lineBWest2 = addLine(level, 3, 2, ML_BLOCKING, addSide(level, SECTOR_B, noTex, noTex, tex.stoneWall), INVALID_INDEX);
    const uint32_t lineBNorth = addLine(level, 2, 6, ML_BLOCKING, addSide(level, SECTOR_B, noTex, noTex, tex.stoneWall), INVALID_INDEX);
    const uint32_t lineBEast = addLine(level, 6, 7, ML_BLOCKING, addSide(level, SECTOR_B, noTex, noTex, tex.stoneWall), INVALID_INDEX);
    const uint32_t lineBSouth = addLine(level, 7, 5, ML_BLOCKING, addSide(level, SECTOR_B, noTex, noTex, tex.stoneWall), INVALID_INDEX);

    // Subsector 0: room A
    addSeg(level, lineAWest, 0);
    addSeg(level, lineANorth, 0);
    addSeg(level, lineAEast1, 0);
    const uint32_t openingSegA = addSeg(level, lineOpening, 0);
    addSeg(level, lineAEast2, 0);
    addSeg(level, lineASouth, 0);
    level.subsectors.push_back(SubsectorRecord{ 0, 6 });

    // Subsector 1: room B
    addSeg(level, lineBWest1, 0);
    const uint32_t openingSegB = addSeg(level, lineOpening, 1);
    addSeg(level, lineBWest2, 0);
    addSeg(level, lineBNorth, 0);
    addSeg(level, lineBEast, 0);
    addSeg(level, lineBSouth, 0);
    level.subsectors.push_back(SubsectorRecord{ 6, 6 });

    level.segs[openingSegA].partnerSeg = openingSegB;
    level.segs[openingSegB].partnerSeg = openingSegA;

    // Split along the shared wall: room B (x > 512) is in front of the partition
    NodeRecord node = {};
    node.line = Partition{ ROOM_SIZE, 0.0f, 0.0f, ROOM_SIZE };
    node.bbox[0][BOXTOP] = ROOM_SIZE;
    node.bbox[0][BOXBOTTOM] = 0.0f;
    node.bbox[0][BOXLEFT] = ROOM_SIZE;
    node.bbox[0][BOXRIGHT] = ROOM_SIZE * 2.0f;
    node.bbox[1][BOXTOP] = ROOM_SIZE;
    node.bbox[1][BOXBOTTOM] = 0.0f;
    node.bbox[1][BOXLEFT] = 0.0f;
    node.bbox[1][BOXRIGHT] = ROOM_SIZE;
    node.children[0] = NF_SUBSECTOR | 1;
    node.children[1] = NF_SUBSECTOR | 0;
    level.nodes.push_back(node);

    return level;
}

StartPoint getTwoRoomLevelStart() noexcept {
    // In room A looking east through the opening
    return StartPoint{ 128.0f, ROOM_SIZE * 0.5f, 0.0f };
}

END_NAMESPACE(DemoLevels)
