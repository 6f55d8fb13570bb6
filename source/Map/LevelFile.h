#pragma once

#include "LevelGeometry.h"
#include <cstddef>
#include <vector>

//----------------------------------------------------------------------------------------------------------------------
// Reading and writing level records in a flat binary file.
//
// The file is big endian throughout and stores coordinates and heights in 16.16 fixed point:
//  (1) Header: four character id 'RBSP' and a u32 version number.
//  (2) Then each record list in turn, prefixed by its u32 element count:
//      vertexes, sectors, sides, lines, segs, subsectors, nodes.
//
// Loading only checks that the data is complete; index validation is done by 'LevelGeometry::load'.
//----------------------------------------------------------------------------------------------------------------------
BEGIN_NAMESPACE(LevelFile)

static constexpr uint32_t FILE_VERSION = 1;

// Parse records from a level file already in memory
LevelRecords loadFromMemory(const std::byte* const pData, const size_t dataSize) THROWS;

// Read and parse a level file on disk
LevelRecords loadFromFile(const char* const filePath) THROWS;

// Serialize records to the level file format
std::vector<std::byte> saveToMemory(const LevelRecords& records) noexcept;

// Serialize records and write them to disk, returning 'true' on success
bool saveToFile(const char* const filePath, const LevelRecords& records) noexcept;

END_NAMESPACE(LevelFile)
