#pragma once

#include "Base/Endian.h"
#include <cstddef>
#include <cstdint>
#include <cstring>

//----------------------------------------------------------------------------------------------------------------------
// Exception thrown when there are not enough bytes to read in a memory stream
//----------------------------------------------------------------------------------------------------------------------
class MemStreamException {
public:
    inline MemStreamException(const uint32_t offset, const uint32_t numBytesWanted) noexcept
        : offset(offset)
        , numBytesWanted(numBytesWanted)
    {
    }

    const uint32_t offset;              // Where the read was attempted
    const uint32_t numBytesWanted;      // How much was asked for
};

//----------------------------------------------------------------------------------------------------------------------
// Allows reading from a stream in memory
//----------------------------------------------------------------------------------------------------------------------
class MemStream {
public:
    inline MemStream(const std::byte* const pData, const uint32_t size) noexcept
        : mpData(pData)
        , mSize(size)
        , mCurByteIdx(0)
    {
    }

    inline uint32_t tell() const noexcept {
        return mCurByteIdx;
    }

    inline uint32_t getNumBytesLeft() const noexcept {
        return mSize - mCurByteIdx;
    }

    inline bool hasBytesLeft(const uint32_t numBytes = 1) const noexcept {
        return (getNumBytesLeft() >= numBytes);
    }

    inline void ensureBytesLeft(const uint32_t numBytes) THROWS {
        if (!hasBytesLeft(numBytes)) {
            throw MemStreamException(mCurByteIdx, numBytes);
        }
    }

    template <class T>
    inline T read() THROWS {
        ensureBytesLeft(sizeof(T));

        T output;
        std::memcpy(&output, mpData + mCurByteIdx, sizeof(T));
        mCurByteIdx += sizeof(T);

        return output;
    }

    // Read a big endian value and convert it to host byte order
    template <class T>
    inline T readBig() THROWS {
        T output = read<T>();
        Endian::convertBigToHost(output);
        return output;
    }

    inline void readBytes(std::byte* const pDst, const uint32_t numBytes) THROWS {
        ensureBytesLeft(numBytes);
        std::memcpy(pDst, mpData + mCurByteIdx, numBytes);
        mCurByteIdx += numBytes;
    }

private:
    const std::byte* const  mpData;
    const uint32_t          mSize;
    uint32_t                mCurByteIdx;
};
