#pragma once

#include "Base/Macros.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

//----------------------------------------------------------------------------------------------------------------------
// Level geometry: the static spatial data for a level plus the BSP tree over it.
// Built once from typed level records and then read-only for the rest of the session, so it can be shared by any
// number of frames without synchronization.
//----------------------------------------------------------------------------------------------------------------------

// Marks an unused index reference (e.g the back side of a one sided line)
static constexpr uint32_t INVALID_INDEX = UINT32_MAX;

// In node records: if this bit is set on a child reference then the child is a subsector index, otherwise a node index
static constexpr uint32_t NF_SUBSECTOR = 0x80000000u;

// Indexes into a bounding box array
enum : uint32_t {
    BOXTOP,
    BOXBOTTOM,
    BOXLEFT,
    BOXRIGHT,
    BOXCOUNT
};

// Flags that can be applied to a line
static constexpr uint32_t ML_BLOCKING       = 0x1;      // Line blocks all movement
static constexpr uint32_t ML_BLOCKMONSTERS  = 0x2;      // Line blocks monster movement
static constexpr uint32_t ML_TWOSIDED       = 0x4;      // This line has two sides
static constexpr uint32_t ML_DONTPEGTOP     = 0x8;      // Upper texture is anchored at the front ceiling
static constexpr uint32_t ML_DONTPEGBOTTOM  = 0x10;     // Lower/middle texture is anchored at the bottom
static constexpr uint32_t ML_SECRET         = 0x20;     // Don't map as two sided: IT'S A SECRET!
static constexpr uint32_t ML_SOUNDBLOCK     = 0x40;     // Don't let sound cross two of these
static constexpr uint32_t ML_DONTDRAW       = 0x80;     // Don't draw on the automap

// Point in a map (2d coords)
struct Vertex {
    float x;
    float y;
};

// Describe a playfield sector (Polygon)
struct Sector {
    float       floorHeight;
    float       ceilingHeight;
    uint32_t    floorPic;           // Floor texture id
    uint32_t    ceilingPic;         // Ceiling texture id
    uint32_t    lightLevel;         // 0-255
    uint32_t    special;            // Game logic fields: not used for rendering, kept so level files round trip
    uint32_t    tag;
};

// Data for a line side
struct SideDef {
    float       texXOffset;         // Column texture offset (X)
    float       texYOffset;         // Row texture offset (Y)
    uint32_t    topTexture;         // Wall textures, ids in the texture bank (unknown ids draw as the placeholder)
    uint32_t    bottomTexture;
    uint32_t    midTexture;
    uint32_t    sector;             // Owning sector
};

// Data for a line
struct LineDef {
    uint32_t    v1;
    uint32_t    v2;
    uint32_t    flags;              // ML_ flags
    uint32_t    special;            // Game logic fields: not used for rendering, kept so level files round trip
    uint32_t    tag;
    uint32_t    sideNum[2];         // sideNum[1] is INVALID_INDEX if one sided

    inline bool hasBackSide() const noexcept {
        return (sideNum[1] != INVALID_INDEX);
    }
};

// An oriented piece of a line, owned by exactly one subsector
struct Seg {
    Vertex      v1;                 // Source and dest points
    Vertex      v2;
    float       offset;             // Distance along the linedef to the start of this seg (texture offset)
    float       length;             // World length of the seg
    float       lightMul;           // Wall light multiplier (used for fake contrast)
    uint32_t    lineDef;
    uint32_t    side;               // Which side of the line this seg is on (0 = front)
    uint32_t    sideDef;            // The sidedef the seg is drawn with
    uint32_t    frontSector;
    uint32_t    backSector;         // INVALID_INDEX for one sided lines
    uint32_t    partnerSeg;         // Seg on the other side of a two sided line, or INVALID_INDEX

    inline bool isTwoSided() const noexcept {
        return (backSector != INVALID_INDEX);
    }
};

// Convex leaf region of the BSP
struct Subsector {
    uint32_t    firstSeg;
    uint32_t    numSegs;
    uint32_t    sector;             // Sector of the first seg's sidedef
};

// BSP partition line
struct Partition {
    float x;
    float y;
    float dx;
    float dy;
};

//----------------------------------------------------------------------------------------------------------------------
// Tagged reference to a BSP node child: either another node or a leaf (subsector)
//----------------------------------------------------------------------------------------------------------------------
struct BspChild {
    enum class Kind : uint8_t {
        Node,
        Leaf
    };

    Kind        kind;
    uint32_t    index;

    static inline constexpr BspChild Node(const uint32_t nodeIdx) noexcept {
        return BspChild{ Kind::Node, nodeIdx };
    }

    static inline constexpr BspChild Leaf(const uint32_t subsectorIdx) noexcept {
        return BspChild{ Kind::Leaf, subsectorIdx };
    }

    inline constexpr bool isLeaf() const noexcept {
        return (kind == Kind::Leaf);
    }

    inline constexpr bool operator == (const BspChild& other) const noexcept {
        return ((kind == other.kind) && (index == other.index));
    }
};

struct BspNode {
    Partition   line;
    float       bbox[2][BOXCOUNT];      // Bounding box for each child
    BspChild    children[2];            // Front child is [0], back child is [1]
};

//----------------------------------------------------------------------------------------------------------------------
// Which side of a partition line a point is on.
// Uses the cross product of the line direction and the vector to the point: a point that is exactly on the line is
// deterministically treated as being on the front side.
//----------------------------------------------------------------------------------------------------------------------
enum class NodeSide : uint8_t {
    Front = 0,
    Back = 1
};

inline NodeSide pointOnPartitionSide(const Partition& line, const float px, const float py) noexcept {
    const float cross = (px - line.x) * line.dy - (py - line.y) * line.dx;
    return (cross >= 0.0f) ? NodeSide::Front : NodeSide::Back;
}

//----------------------------------------------------------------------------------------------------------------------
// Typed level records handed over by whatever extracts them from a level archive or builds them in code
//----------------------------------------------------------------------------------------------------------------------
struct SegRecord {
    uint32_t    v1;             // Vertex index: 1
    uint32_t    v2;             // Vertex index: 2
    float       offset;         // Texture offset along the line
    uint32_t    lineDef;        // Line definition
    uint32_t    side;           // Side of the line (0 or 1)
    uint32_t    partnerSeg;     // Partner seg index or INVALID_INDEX
};

struct SubsectorRecord {
    uint32_t    firstSeg;       // Note: segs are stored sequentially
    uint32_t    numSegs;
};

struct NodeRecord {
    Partition   line;
    float       bbox[2][BOXCOUNT];
    uint32_t    children[2];    // If NF_SUBSECTOR is set it's a subsector index, else a node index
};

struct LevelRecords {
    std::vector<Vertex>             vertexes;
    std::vector<Sector>             sectors;
    std::vector<SideDef>            sides;
    std::vector<LineDef>            lines;
    std::vector<SegRecord>          segs;
    std::vector<SubsectorRecord>    subsectors;
    std::vector<NodeRecord>         nodes;          // The last node is the root of the tree
};

//----------------------------------------------------------------------------------------------------------------------
// Exception thrown when level records contain bad index references or a broken BSP tree
//----------------------------------------------------------------------------------------------------------------------
class MalformedLevelException {
public:
    inline explicit MalformedLevelException(std::string message) noexcept
        : mMessage(std::move(message))
    {
    }

    inline const char* what() const noexcept {
        return mMessage.c_str();
    }

private:
    std::string mMessage;
};

//----------------------------------------------------------------------------------------------------------------------
// The immutable level data
//----------------------------------------------------------------------------------------------------------------------
class LevelGeometry {
public:
    // A contiguous range of segs (the segs of one subsector)
    struct SegRange {
        const Seg* pBeg;
        const Seg* pEnd;

        inline const Seg* begin() const noexcept { return pBeg; }
        inline const Seg* end() const noexcept { return pEnd; }
        inline uint32_t size() const noexcept { return (uint32_t)(pEnd - pBeg); }
    };

    // Validate the given records and build the level from them.
    // If 'bDoFakeContrast' is set then segs get a light multiplier based on their orientation.
    static LevelGeometry load(const LevelRecords& records, const bool bDoFakeContrast = true) THROWS;

    LevelGeometry(LevelGeometry&& other) noexcept = default;
    LevelGeometry& operator = (LevelGeometry&& other) noexcept = default;

    inline const std::vector<Vertex>& getVertexes() const noexcept { return mVertexes; }
    inline const std::vector<Sector>& getSectors() const noexcept { return mSectors; }
    inline const std::vector<SideDef>& getSides() const noexcept { return mSides; }
    inline const std::vector<LineDef>& getLines() const noexcept { return mLines; }
    inline const std::vector<Seg>& getSegs() const noexcept { return mSegs; }
    inline const std::vector<Subsector>& getSubsectors() const noexcept { return mSubsectors; }
    inline const std::vector<BspNode>& getNodes() const noexcept { return mNodes; }

    // Root of the BSP tree: the last node, or the only subsector if the level has no nodes
    inline BspChild getRoot() const noexcept { return mRoot; }

    // N.B: indexes must be in range!
    inline const BspNode& getNode(const uint32_t nodeIdx) const noexcept { return mNodes[nodeIdx]; }
    inline const Sector& getSector(const uint32_t sectorIdx) const noexcept { return mSectors[sectorIdx]; }
    inline const SideDef& getSide(const uint32_t sideIdx) const noexcept { return mSides[sideIdx]; }
    inline const LineDef& getLine(const uint32_t lineIdx) const noexcept { return mLines[lineIdx]; }

    const float* getNodeChildBBox(const uint32_t nodeIdx, const NodeSide side) const noexcept;
    const Sector& getSubsectorSector(const uint32_t subsectorIdx) const noexcept;
    SegRange getSubsectorSegs(const uint32_t subsectorIdx) const noexcept;

    // Walks the BSP tree to find the subsector containing the given point
    uint32_t locateSubsector(const float x, const float y) const noexcept;

    // Floor height of the sector containing the given point
    float getFloorHeightAt(const float x, const float y) const noexcept;

private:
    LevelGeometry() noexcept = default;

    std::vector<Vertex>     mVertexes;
    std::vector<Sector>     mSectors;
    std::vector<SideDef>    mSides;
    std::vector<LineDef>    mLines;
    std::vector<Seg>        mSegs;
    std::vector<Subsector>  mSubsectors;
    std::vector<BspNode>    mNodes;
    BspChild                mRoot;
};
