#include "LevelGeometry.h"

#include "Base/FMath.h"
#include <cmath>
#include <cstdarg>
#include <cstdio>

//----------------------------------------------------------------------------------------------------------------------
// Throws a 'MalformedLevelException' with a printf style formatted message
//----------------------------------------------------------------------------------------------------------------------
[[noreturn]] static void throwMalformed(const char* const format, ...) THROWS {
    char message[256];

    va_list args;
    va_start(args, format);
    std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    throw MalformedLevelException(message);
}

static void loadVertexes(const LevelRecords& records, std::vector<Vertex>& vertexes) noexcept {
    vertexes = records.vertexes;
}

static void loadSectors(const LevelRecords& records, std::vector<Sector>& sectors) noexcept {
    sectors = records.sectors;
}

static void loadSides(const LevelRecords& records, const uint32_t numSectors, std::vector<SideDef>& sides) THROWS {
    sides.clear();
    sides.reserve(records.sides.size());

    for (const SideDef& side : records.sides) {
        if (side.sector >= numSectors) {
            throwMalformed("Side %u references sector %u which does not exist!", (uint32_t) sides.size(), side.sector);
        }

        sides.push_back(side);
    }
}

static void loadLines(
    const LevelRecords& records,
    const uint32_t numVertexes,
    const uint32_t numSides,
    std::vector<LineDef>& lines
) THROWS {
    lines.clear();
    lines.reserve(records.lines.size());

    for (const LineDef& line : records.lines) {
        const uint32_t lineIdx = (uint32_t) lines.size();

        if (line.v1 >= numVertexes || line.v2 >= numVertexes) {
            throwMalformed("Line %u references a vertex which does not exist!", lineIdx);
        }

        // Note: all lines have a front side, but not necessarily a back side!
        if (line.sideNum[0] >= numSides) {
            throwMalformed("Line %u references front side %u which does not exist!", lineIdx, line.sideNum[0]);
        }

        if (line.hasBackSide() && line.sideNum[1] >= numSides) {
            throwMalformed("Line %u references back side %u which does not exist!", lineIdx, line.sideNum[1]);
        }

        if ((line.flags & ML_TWOSIDED) && (!line.hasBackSide())) {
            throwMalformed("Line %u is flagged as two sided but has no back side!", lineIdx);
        }

        lines.push_back(line);
    }
}

static void loadSegs(
    const LevelRecords& records,
    const std::vector<Vertex>& vertexes,
    const std::vector<SideDef>& sides,
    const std::vector<LineDef>& lines,
    std::vector<Seg>& segs
) THROWS {
    const uint32_t numSegs = (uint32_t) records.segs.size();
    segs.clear();
    segs.resize(numSegs);

    for (uint32_t segIdx = 0; segIdx < numSegs; ++segIdx) {
        const SegRecord& src = records.segs[segIdx];
        Seg& seg = segs[segIdx];

        if (src.v1 >= vertexes.size() || src.v2 >= vertexes.size()) {
            throwMalformed("Seg %u references a vertex which does not exist!", segIdx);
        }

        if (src.lineDef >= lines.size()) {
            throwMalformed("Seg %u references line %u which does not exist!", segIdx, src.lineDef);
        }

        if (src.side > 1) {
            throwMalformed("Seg %u has invalid line side %u!", segIdx, src.side);
        }

        if (src.partnerSeg != INVALID_INDEX && src.partnerSeg >= numSegs) {
            throwMalformed("Seg %u references partner seg %u which does not exist!", segIdx, src.partnerSeg);
        }

        const LineDef& line = lines[src.lineDef];
        const uint32_t sideNum = line.sideNum[src.side];

        if (sideNum == INVALID_INDEX) {
            throwMalformed("Seg %u is on side %u of line %u but the line has no such side!", segIdx, src.side, src.lineDef);
        }

        seg.v1 = vertexes[src.v1];
        seg.v2 = vertexes[src.v2];
        seg.offset = src.offset;
        seg.length = FMath::distance2d(seg.v1.x, seg.v1.y, seg.v2.x, seg.v2.y);
        seg.lightMul = 1.0f;
        seg.lineDef = src.lineDef;
        seg.side = src.side;
        seg.sideDef = sideNum;
        seg.frontSector = sides[sideNum].sector;
        seg.partnerSeg = src.partnerSeg;

        // Store a reference to the joining sector as well for segs on a two sided line
        const uint32_t otherSideNum = line.sideNum[src.side ^ 1];
        seg.backSector = (otherSideNum != INVALID_INDEX) ? sides[otherSideNum].sector : INVALID_INDEX;
    }
}

static void loadSubsectors(
    const LevelRecords& records,
    const std::vector<Seg>& segs,
    std::vector<Subsector>& subsectors
) THROWS {
    const uint32_t numSubsectors = (uint32_t) records.subsectors.size();
    const uint32_t numSegs = (uint32_t) segs.size();

    if (numSubsectors == 0) {
        throwMalformed("Level has no subsectors!");
    }

    // Which subsector owns each seg: every seg must be owned by exactly one
    std::vector<uint32_t> segOwners(numSegs, INVALID_INDEX);

    subsectors.clear();
    subsectors.resize(numSubsectors);

    for (uint32_t subsecIdx = 0; subsecIdx < numSubsectors; ++subsecIdx) {
        const SubsectorRecord& src = records.subsectors[subsecIdx];

        if (src.numSegs == 0) {
            throwMalformed("Subsector %u has no segs!", subsecIdx);
        }

        if (src.firstSeg >= numSegs || src.numSegs > numSegs - src.firstSeg) {
            throwMalformed("Subsector %u references segs outside of the seg list!", subsecIdx);
        }

        for (uint32_t segIdx = src.firstSeg; segIdx < src.firstSeg + src.numSegs; ++segIdx) {
            if (segOwners[segIdx] != INVALID_INDEX) {
                throwMalformed("Seg %u is owned by both subsector %u and %u!", segIdx, segOwners[segIdx], subsecIdx);
            }

            segOwners[segIdx] = subsecIdx;
        }

        Subsector& subsec = subsectors[subsecIdx];
        subsec.firstSeg = src.firstSeg;
        subsec.numSegs = src.numSegs;
        subsec.sector = segs[src.firstSeg].frontSector;
    }

    for (uint32_t segIdx = 0; segIdx < numSegs; ++segIdx) {
        if (segOwners[segIdx] == INVALID_INDEX) {
            throwMalformed("Seg %u is not owned by any subsector!", segIdx);
        }
    }
}

static void loadNodes(
    const LevelRecords& records,
    const uint32_t numSubsectors,
    std::vector<BspNode>& nodes
) THROWS {
    const uint32_t numNodes = (uint32_t) records.nodes.size();
    nodes.clear();
    nodes.resize(numNodes);

    for (uint32_t nodeIdx = 0; nodeIdx < numNodes; ++nodeIdx) {
        const NodeRecord& src = records.nodes[nodeIdx];
        BspNode& node = nodes[nodeIdx];
        node.line = src.line;

        if (src.line.dx == 0.0f && src.line.dy == 0.0f) {
            throwMalformed("Node %u has a zero length partition line!", nodeIdx);
        }

        for (uint32_t childNum = 0; childNum < 2; ++childNum) {
            for (uint32_t coord = 0; coord < BOXCOUNT; ++coord) {
                node.bbox[childNum][coord] = src.bbox[childNum][coord];
            }

            // See if this child is a leaf (subsector) or another node
            const uint32_t childRef = src.children[childNum];

            if (childRef & NF_SUBSECTOR) {
                const uint32_t subsecIdx = childRef & (~NF_SUBSECTOR);

                if (subsecIdx >= numSubsectors) {
                    throwMalformed("Node %u references subsector %u which does not exist!", nodeIdx, subsecIdx);
                }

                node.children[childNum] = BspChild::Leaf(subsecIdx);
            } else {
                if (childRef >= numNodes) {
                    throwMalformed("Node %u references node %u which does not exist!", nodeIdx, childRef);
                }

                node.children[childNum] = BspChild::Node(childRef);
            }
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Makes sure the tree reachable from the root really is a tree: no node or leaf is reached twice.
// This rules out cycles, which would otherwise make traversal loop forever.
//----------------------------------------------------------------------------------------------------------------------
static void verifyBspTree(
    const std::vector<BspNode>& nodes,
    const uint32_t numSubsectors,
    const BspChild root
) THROWS {
    std::vector<bool> bNodeVisited(nodes.size(), false);
    std::vector<bool> bLeafVisited(numSubsectors, false);
    std::vector<BspChild> toVisit;
    toVisit.push_back(root);

    while (!toVisit.empty()) {
        const BspChild child = toVisit.back();
        toVisit.pop_back();

        if (child.isLeaf()) {
            if (bLeafVisited[child.index]) {
                throwMalformed("Subsector %u is referenced more than once in the BSP tree!", child.index);
            }

            bLeafVisited[child.index] = true;
            continue;
        }

        if (bNodeVisited[child.index]) {
            throwMalformed("Node %u is referenced more than once in the BSP tree (cycle or shared child)!", child.index);
        }

        bNodeVisited[child.index] = true;
        toVisit.push_back(nodes[child.index].children[0]);
        toVisit.push_back(nodes[child.index].children[1]);
    }
}

//----------------------------------------------------------------------------------------------------------------------
// Computes the 'light multiplier' for each line segment.
// This multiplier is used to achieve so called 'fake contrast'.
//----------------------------------------------------------------------------------------------------------------------
static void calcSegLightMultipliers(std::vector<Seg>& segs, const bool bDoFakeContrast) noexcept {
    if (bDoFakeContrast) {
        constexpr float MIN_LIGHT_MUL = 0.75f;
        constexpr float MAX_LIGHT_MUL = 1.05f;

        for (Seg& seg : segs) {
            const float segAngle = FMath::angleFromPointToPoint(seg.v1.x, seg.v1.y, seg.v2.x, seg.v2.y) + FMath::ANGLE_90<float>;
            const float lerpFactor = std::abs(std::cos(segAngle));
            seg.lightMul = MIN_LIGHT_MUL * lerpFactor + MAX_LIGHT_MUL * (1.0f - lerpFactor);
        }
    } else {
        for (Seg& seg : segs) {
            seg.lightMul = 1.0f;
        }
    }
}

LevelGeometry LevelGeometry::load(const LevelRecords& records, const bool bDoFakeContrast) THROWS {
    LevelGeometry level;

    // Note: order matters here, each step validates references into the previous ones
    loadVertexes(records, level.mVertexes);
    loadSectors(records, level.mSectors);
    loadSides(records, (uint32_t) level.mSectors.size(), level.mSides);
    loadLines(records, (uint32_t) level.mVertexes.size(), (uint32_t) level.mSides.size(), level.mLines);
    loadSegs(records, level.mVertexes, level.mSides, level.mLines, level.mSegs);
    loadSubsectors(records, level.mSegs, level.mSubsectors);
    loadNodes(records, (uint32_t) level.mSubsectors.size(), level.mNodes);

    // The last node in the nodes array is the root of the BSP tree.
    // A level with a single convex subsector needs no nodes at all.
    if (level.mNodes.empty()) {
        if (level.mSubsectors.size() != 1) {
            throwMalformed("Level has %u subsectors but no BSP nodes!", (uint32_t) level.mSubsectors.size());
        }

        level.mRoot = BspChild::Leaf(0);
    } else {
        level.mRoot = BspChild::Node((uint32_t) level.mNodes.size() - 1);
    }

    verifyBspTree(level.mNodes, (uint32_t) level.mSubsectors.size(), level.mRoot);
    calcSegLightMultipliers(level.mSegs, bDoFakeContrast);
    return level;
}

const float* LevelGeometry::getNodeChildBBox(const uint32_t nodeIdx, const NodeSide side) const noexcept {
    ASSERT(nodeIdx < mNodes.size());
    return mNodes[nodeIdx].bbox[(uint32_t) side];
}

const Sector& LevelGeometry::getSubsectorSector(const uint32_t subsectorIdx) const noexcept {
    ASSERT(subsectorIdx < mSubsectors.size());
    return mSectors[mSubsectors[subsectorIdx].sector];
}

LevelGeometry::SegRange LevelGeometry::getSubsectorSegs(const uint32_t subsectorIdx) const noexcept {
    ASSERT(subsectorIdx < mSubsectors.size());
    const Subsector& subsec = mSubsectors[subsectorIdx];
    const Seg* const pFirstSeg = mSegs.data() + subsec.firstSeg;
    return SegRange{ pFirstSeg, pFirstSeg + subsec.numSegs };
}

uint32_t LevelGeometry::locateSubsector(const float x, const float y) const noexcept {
    BspChild child = mRoot;

    while (!child.isLeaf()) {
        const BspNode& node = mNodes[child.index];
        const NodeSide side = pointOnPartitionSide(node.line, x, y);
        child = node.children[(uint32_t) side];
    }

    return child.index;
}

float LevelGeometry::getFloorHeightAt(const float x, const float y) const noexcept {
    return getSubsectorSector(locateSubsector(x, y)).floorHeight;
}
