#include "LevelFile.h"

#include "Base/Endian.h"
#include "Base/FileUtils.h"
#include "Base/Fixed.h"
#include "Base/FourCID.h"
#include "Base/MemStream.h"
#include <cstdint>
#include <string>

BEGIN_NAMESPACE(LevelFile)

static constexpr FourCID FILE_ID = FourCID::make("RBSP");

// On-disk sizes of each record type, used to sanity check element counts before allocating
static constexpr uint32_t VERTEX_SIZE       = 4 * 2;
static constexpr uint32_t SECTOR_SIZE       = 4 * 7;
static constexpr uint32_t SIDE_SIZE         = 4 * 6;
static constexpr uint32_t LINE_SIZE         = 4 * 7;
static constexpr uint32_t SEG_SIZE          = 4 * 6;
static constexpr uint32_t SUBSECTOR_SIZE    = 4 * 2;
static constexpr uint32_t NODE_SIZE         = 4 * 14;

static inline float readFixed(MemStream& stream) THROWS {
    return fixed16ToFloat(stream.readBig<Fixed>());
}

//----------------------------------------------------------------------------------------------------------------------
// Reads the element count for a record list and checks the stream holds that many records
//----------------------------------------------------------------------------------------------------------------------
static uint32_t readCount(MemStream& stream, const uint32_t recordSize) THROWS {
    const uint32_t count = stream.readBig<uint32_t>();

    if (count > stream.getNumBytesLeft() / recordSize) {
        throw MemStreamException(stream.tell(), count * recordSize);
    }

    return count;
}

static void readRecords(MemStream& stream, LevelRecords& records) THROWS {
    records.vertexes.resize(readCount(stream, VERTEX_SIZE));

    for (Vertex& vertex : records.vertexes) {
        vertex.x = readFixed(stream);
        vertex.y = readFixed(stream);
    }

    records.sectors.resize(readCount(stream, SECTOR_SIZE));

    for (Sector& sector : records.sectors) {
        sector.floorHeight = readFixed(stream);
        sector.ceilingHeight = readFixed(stream);
        sector.floorPic = stream.readBig<uint32_t>();
        sector.ceilingPic = stream.readBig<uint32_t>();
        sector.lightLevel = stream.readBig<uint32_t>();
        sector.special = stream.readBig<uint32_t>();
        sector.tag = stream.readBig<uint32_t>();
    }

    records.sides.resize(readCount(stream, SIDE_SIZE));

    for (SideDef& side : records.sides) {
        side.texXOffset = readFixed(stream);
        side.texYOffset = readFixed(stream);
        side.topTexture = stream.readBig<uint32_t>();
        side.bottomTexture = stream.readBig<uint32_t>();
        side.midTexture = stream.readBig<uint32_t>();
        side.sector = stream.readBig<uint32_t>();
    }

    records.lines.resize(readCount(stream, LINE_SIZE));

    for (LineDef& line : records.lines) {
        line.v1 = stream.readBig<uint32_t>();
        line.v2 = stream.readBig<uint32_t>();
        line.flags = stream.readBig<uint32_t>();
        line.special = stream.readBig<uint32_t>();
        line.tag = stream.readBig<uint32_t>();
        line.sideNum[0] = stream.readBig<uint32_t>();
        line.sideNum[1] = stream.readBig<uint32_t>();
    }

    records.segs.resize(readCount(stream, SEG_SIZE));

    for (SegRecord& seg : records.segs) {
        seg.v1 = stream.readBig<uint32_t>();
        seg.v2 = stream.readBig<uint32_t>();
        seg.offset = readFixed(stream);
        seg.lineDef = stream.readBig<uint32_t>();
        seg.side = stream.readBig<uint32_t>();
        seg.partnerSeg = stream.readBig<uint32_t>();
    }

    records.subsectors.resize(readCount(stream, SUBSECTOR_SIZE));

    for (SubsectorRecord& subsec : records.subsectors) {
        subsec.numSegs = stream.readBig<uint32_t>();
        subsec.firstSeg = stream.readBig<uint32_t>();
    }

    records.nodes.resize(readCount(stream, NODE_SIZE));

    for (NodeRecord& node : records.nodes) {
        node.line.x = readFixed(stream);
        node.line.y = readFixed(stream);
        node.line.dx = readFixed(stream);
        node.line.dy = readFixed(stream);

        for (uint32_t childNum = 0; childNum < 2; ++childNum) {
            for (uint32_t coord = 0; coord < BOXCOUNT; ++coord) {
                node.bbox[childNum][coord] = readFixed(stream);
            }
        }

        node.children[0] = stream.readBig<uint32_t>();
        node.children[1] = stream.readBig<uint32_t>();
    }
}

LevelRecords loadFromMemory(const std::byte* const pData, const size_t dataSize) THROWS {
    if (dataSize > UINT32_MAX) {
        throw MalformedLevelException("Level file is too large!");
    }

    LevelRecords records;
    MemStream stream(pData, (uint32_t) dataSize);

    try {
        FourCID fileId = {};
        stream.readBytes(reinterpret_cast<std::byte*>(fileId.idChars), 4);

        if (fileId != FILE_ID) {
            throw MalformedLevelException("Not a level file: bad file id!");
        }

        const uint32_t version = stream.readBig<uint32_t>();

        if (version != FILE_VERSION) {
            throw MalformedLevelException("Unsupported level file version " + std::to_string(version) + "!");
        }

        readRecords(stream, records);
    }
    catch (const MemStreamException& e) {
        throw MalformedLevelException(
            "Level file is truncated: wanted " + std::to_string(e.numBytesWanted) +
            " bytes at offset " + std::to_string(e.offset) + "!"
        );
    }

    return records;
}

LevelRecords loadFromFile(const char* const filePath) THROWS {
    std::vector<std::byte> fileData;

    if (!FileUtils::readFile(filePath, fileData)) {
        throw MalformedLevelException(std::string("Unable to read level file '") + filePath + "'!");
    }

    return loadFromMemory(fileData.data(), fileData.size());
}

//----------------------------------------------------------------------------------------------------------------------
// Helpers for writing big endian values
//----------------------------------------------------------------------------------------------------------------------
static void writeU32(std::vector<std::byte>& out, const uint32_t value) noexcept {
    const uint32_t bigValue = Endian::hostToBig(value);
    const std::byte* const pBytes = reinterpret_cast<const std::byte*>(&bigValue);
    out.insert(out.end(), pBytes, pBytes + sizeof(uint32_t));
}

static void writeFixed(std::vector<std::byte>& out, const float value) noexcept {
    writeU32(out, (uint32_t) floatToFixed16(value));
}

std::vector<std::byte> saveToMemory(const LevelRecords& records) noexcept {
    std::vector<std::byte> out;

    for (const uint8_t c : FILE_ID.idChars) {
        out.push_back(std::byte(c));
    }

    writeU32(out, FILE_VERSION);
    writeU32(out, (uint32_t) records.vertexes.size());

    for (const Vertex& vertex : records.vertexes) {
        writeFixed(out, vertex.x);
        writeFixed(out, vertex.y);
    }

    writeU32(out, (uint32_t) records.sectors.size());

    for (const Sector& sector : records.sectors) {
        writeFixed(out, sector.floorHeight);
        writeFixed(out, sector.ceilingHeight);
        writeU32(out, sector.floorPic);
        writeU32(out, sector.ceilingPic);
        writeU32(out, sector.lightLevel);
        writeU32(out, sector.special);
        writeU32(out, sector.tag);
    }

    writeU32(out, (uint32_t) records.sides.size());

    for (const SideDef& side : records.sides) {
        writeFixed(out, side.texXOffset);
        writeFixed(out, side.texYOffset);
        writeU32(out, side.topTexture);
        writeU32(out, side.bottomTexture);
        writeU32(out, side.midTexture);
        writeU32(out, side.sector);
    }

    writeU32(out, (uint32_t) records.lines.size());

    for (const LineDef& line : records.lines) {
        writeU32(out, line.v1);
        writeU32(out, line.v2);
        writeU32(out, line.flags);
        writeU32(out, line.special);
        writeU32(out, line.tag);
        writeU32(out, line.sideNum[0]);
        writeU32(out, line.sideNum[1]);
    }

    writeU32(out, (uint32_t) records.segs.size());

    for (const SegRecord& seg : records.segs) {
        writeU32(out, seg.v1);
        writeU32(out, seg.v2);
        writeFixed(out, seg.offset);
        writeU32(out, seg.lineDef);
        writeU32(out, seg.side);
        writeU32(out, seg.partnerSeg);
    }

    writeU32(out, (uint32_t) records.subsectors.size());

    for (const SubsectorRecord& subsec : records.subsectors) {
        writeU32(out, subsec.numSegs);
        writeU32(out, subsec.firstSeg);
    }

    writeU32(out, (uint32_t) records.nodes.size());

    for (const NodeRecord& node : records.nodes) {
        writeFixed(out, node.line.x);
        writeFixed(out, node.line.y);
        writeFixed(out, node.line.dx);
        writeFixed(out, node.line.dy);

        for (uint32_t childNum = 0; childNum < 2; ++childNum) {
            for (uint32_t coord = 0; coord < BOXCOUNT; ++coord) {
                writeFixed(out, node.bbox[childNum][coord]);
            }
        }

        writeU32(out, node.children[0]);
        writeU32(out, node.children[1]);
    }

    return out;
}

bool saveToFile(const char* const filePath, const LevelRecords& records) noexcept {
    const std::vector<std::byte> fileData = saveToMemory(records);
    return FileUtils::writeFile(filePath, fileData.data(), fileData.size());
}

END_NAMESPACE(LevelFile)
