#include "FileUtils.h"

#include "Finally.h"
#include <climits>
#include <cstdint>
#include <cstdio>

BEGIN_NAMESPACE(FileUtils)

bool readFile(const char* const filePath, std::vector<std::byte>& output) noexcept {
    ASSERT(filePath);
    output.clear();

    FILE* const pFile = std::fopen(filePath, "rb");

    if (!pFile)
        return false;

    auto closeFile = finally([&]() noexcept {
        std::fclose(pFile);
    });

    // Size up the file then go back to the start for reading
    if (std::fseek(pFile, 0, SEEK_END) != 0)
        return false;

    const long fileSize = std::ftell(pFile);

    if ((fileSize <= 0) || (fileSize >= INT32_MAX))
        return false;

    if (std::fseek(pFile, 0, SEEK_SET) != 0)
        return false;

    output.resize((size_t) fileSize);

    if (std::fread(output.data(), output.size(), 1, pFile) != 1) {
        output.clear();
        return false;
    }

    return true;
}

bool writeFile(const char* const filePath, const std::byte* const pData, const size_t dataSize) noexcept {
    ASSERT(filePath);
    ASSERT(pData || (dataSize == 0));

    FILE* const pFile = std::fopen(filePath, "wb");

    if (!pFile)
        return false;

    const bool bWroteOk = (dataSize == 0) || (std::fwrite(pData, dataSize, 1, pFile) == 1);

    // Closing flushes any buffered data, so it can fail too
    const bool bClosedOk = (std::fclose(pFile) == 0);
    return (bWroteOk && bClosedOk);
}

END_NAMESPACE(FileUtils)
