#pragma once

#include "Macros.h"
#include <cstddef>
#include <vector>

BEGIN_NAMESPACE(FileUtils)

//----------------------------------------------------------------------------------------------------------------------
// Read the entire contents of the given file into 'output', returning 'true' on success.
// On failure the output is left empty. Empty files and files of 2 GiB or more are treated as failures.
//----------------------------------------------------------------------------------------------------------------------
bool readFile(const char* const filePath, std::vector<std::byte>& output) noexcept;

// Write the given bytes to a file, replacing whatever it held before. Returns 'true' on success.
bool writeFile(const char* const filePath, const std::byte* const pData, const size_t dataSize) noexcept;

END_NAMESPACE(FileUtils)
