// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <cstdint>
#include <string>

namespace ziparc {

class ByteReader;
class DynamicBuffer;

namespace ZipArchive
{
/// @brief ZIP header signatures.
enum : uint32_t
{
    MAGIC_LOCAL_FILE_HEADER = 0x04034b50u,
    MAGIC_DATA_DESCRIPTOR   = 0x08074b50u,
    MAGIC_CENTRAL_DIR       = 0x02014b50u,
    MAGIC_EOCD              = 0x06054b50u
};

/// @brief Sizes of the fixed parts, including the signature.
enum : uint32_t
{
    LOCAL_FILE_HEADER_SIZE  = 30,
    CENTRAL_DIR_HEADER_SIZE = 46,
    TRAILER_SIZE            = 22
};

/// @brief General-purpose bit flags.
enum : uint16_t
{
    FLAG_DATA_DESCRIPTOR = 1 << 3
};

constexpr uint16_t VERSION_NEEDED = 20;     // 2.0: deflate
constexpr uint16_t VERSION_MADE_BY = 20;    // MS-DOS, 2.0

/// @brief MS-DOS date of 1980-01-01, the earliest representable.
constexpr uint16_t DOS_EPOCH_DATE = (1 << 5) | 1;

/// @brief Largest size or offset a 32-bit field can hold (no Zip64).
constexpr uint64_t MAX_FIELD_VALUE = 0xffffffffu;

/// @throws std::invalid_argument if `value` does not fit into a
///   32-bit size or offset field
void checkFieldValue(uint64_t value, const char* what);
}

enum class CompressionMethod : uint16_t
{
    STORE = 0,
    DEFLATE = 8
};

///
/// @brief Local file header.
/// @details Fixed 30-byte header followed by name and extra.
///
struct LocalFileHeader
{
    uint16_t versionNeeded = ZipArchive::VERSION_NEEDED;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint16_t modTime = 0;
    uint16_t modDate = ZipArchive::DOS_EPOCH_DATE;
    uint32_t crc32 = 0;
    uint32_t compressedSize = 0;
    uint32_t uncompressedSize = 0;
    std::string fileName;
    std::string extra;

    bool hasDataDescriptor() const
    {
        return flags & ZipArchive::FLAG_DATA_DESCRIPTOR;
    }

    size_t encodedSize() const
    {
        return ZipArchive::LOCAL_FILE_HEADER_SIZE + fileName.size() + extra.size();
    }

    static LocalFileHeader read(ByteReader& in);
    void write(DynamicBuffer& out) const;
};

///
/// @brief Trailing record carrying CRC and sizes of an entry whose
/// local header has FLAG_DATA_DESCRIPTOR set. The signature is optional.
///
struct DataDescriptor
{
    bool hasSignature = true;
    uint32_t crc32 = 0;
    uint32_t compressedSize = 0;
    uint32_t uncompressedSize = 0;

    size_t encodedSize() const { return hasSignature ? 16 : 12; }

    static DataDescriptor read(ByteReader& in);
    void write(DynamicBuffer& out) const;
};

///
/// @brief Central directory file header.
/// @details Fixed 46-byte header followed by name, extra, comment.
///
struct CentralDirHeader
{
    uint16_t versionMadeBy = ZipArchive::VERSION_MADE_BY;
    uint16_t versionNeeded = ZipArchive::VERSION_NEEDED;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint16_t modTime = 0;
    uint16_t modDate = ZipArchive::DOS_EPOCH_DATE;
    uint32_t crc32 = 0;
    uint32_t compressedSize = 0;
    uint32_t uncompressedSize = 0;
    std::string fileName;
    std::string extra;
    std::string comment;
    uint16_t diskNumberStart = 0;
    uint16_t internalAttrs = 0;
    uint32_t externalAttrs = 0;
    /// @brief Offset of the entry's LocalFileHeader from the start
    /// of the archive.
    uint32_t localHeaderOffset = 0;

    size_t encodedSize() const
    {
        return ZipArchive::CENTRAL_DIR_HEADER_SIZE + fileName.size()
            + extra.size() + comment.size();
    }

    static CentralDirHeader read(ByteReader& in);
    void write(DynamicBuffer& out) const;
};

///
/// @brief End Of Central Directory record (no ZIP64).
/// @details Fixed 22-byte structure followed by the archive comment.
///
struct Trailer
{
    uint16_t diskNumber = 0;
    uint16_t centralDirDisk = 0;
    uint16_t entriesOnThisDisk = 0;
    uint16_t totalEntries = 0;
    uint32_t centralDirSize = 0;
    uint32_t centralDirOffset = 0;
    std::string comment;

    size_t encodedSize() const
    {
        return ZipArchive::TRAILER_SIZE + comment.size();
    }

    static Trailer read(ByteReader& in);
    void write(DynamicBuffer& out) const;
};

} // namespace ziparc
