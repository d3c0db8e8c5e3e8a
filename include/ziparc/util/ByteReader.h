// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <cstdint>
#include <string>
#include <ziparc/zip/ZipException.h>

namespace ziparc {

/// @brief A bounds-checked cursor over a little-endian byte buffer.
///
/// Every read either advances the cursor or throws a ZipException
/// (TRUNCATED_BUFFER) without consuming anything. The reader never
/// owns the bytes it walks.
///
class ByteReader
{
public:
    ByteReader(const uint8_t* data, size_t size) :
        start_(data), p_(data), end_(data + size) {}

    const uint8_t* ptr() const { return p_; }
    size_t offset() const { return p_ - start_; }
    size_t remaining() const { return end_ - p_; }
    bool atEnd() const { return p_ == end_; }

    uint8_t readByte()
    {
        require(1);
        return *p_++;
    }

    uint16_t readUnsignedShort()
    {
        require(2);
        uint16_t v = static_cast<uint16_t>(p_[0] | (p_[1] << 8));
        p_ += 2;
        return v;
    }

    uint32_t readUnsignedInt()
    {
        require(4);
        uint32_t v = static_cast<uint32_t>(p_[0])
            | (static_cast<uint32_t>(p_[1]) << 8)
            | (static_cast<uint32_t>(p_[2]) << 16)
            | (static_cast<uint32_t>(p_[3]) << 24);
        p_ += 4;
        return v;
    }

    /// @brief Reads the next 32-bit word without consuming it.
    uint32_t peekUnsignedInt() const
    {
        ByteReader copy(*this);
        return copy.readUnsignedInt();
    }

    /// @brief Returns a pointer to the next `len` bytes and skips them.
    const uint8_t* readBytes(size_t len)
    {
        require(len);
        const uint8_t* bytes = p_;
        p_ += len;
        return bytes;
    }

    std::string readString(size_t len)
    {
        const uint8_t* bytes = readBytes(len);
        return std::string(reinterpret_cast<const char*>(bytes), len);
    }

    void skip(size_t len)
    {
        require(len);
        p_ += len;
    }

    /// @brief Reads a 32-bit word and fails unless it equals `magic`.
    /// On mismatch, the cursor is left where it was.
    void expectSignature(uint32_t magic, const char* what)
    {
        uint32_t sig = peekUnsignedInt();
        if (sig != magic)
        {
            throw ZipException(ZipError::MALFORMED_SIGNATURE,
                "Expected %s signature 0x%08X at offset %zu, found 0x%08X",
                what, magic, offset(), sig);
        }
        p_ += 4;
    }

    /// @brief Creates a reader over `len` bytes starting at absolute
    /// offset `ofs` of this reader's buffer.
    ByteReader slice(size_t ofs, size_t len) const
    {
        size_t total = end_ - start_;
        if (ofs > total || len > total - ofs)
        {
            throw ZipException(ZipError::TRUNCATED_BUFFER,
                "Range %zu+%zu exceeds buffer of %zu bytes", ofs, len, total);
        }
        return ByteReader(start_ + ofs, len);
    }

    /// @brief Creates a reader from absolute offset `ofs` to the end.
    ByteReader sliceFrom(size_t ofs) const
    {
        size_t total = end_ - start_;
        if (ofs > total) return slice(ofs, 0);      // throws
        return ByteReader(start_ + ofs, total - ofs);
    }

private:
    void require(size_t len) const
    {
        if (len > remaining())
        {
            throw ZipException(ZipError::TRUNCATED_BUFFER,
                "Need %zu bytes at offset %zu, but only %zu remain",
                len, offset(), remaining());
        }
    }

    const uint8_t* start_;
    const uint8_t* p_;
    const uint8_t* end_;
};

} // namespace ziparc
