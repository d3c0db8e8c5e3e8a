// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <map>
#include <string>
#include <vector>
#include <ziparc/alloc/Block.h>
#include <ziparc/zip/ZipArchive.h>
#include <ziparc/zip/ZipException.h>

namespace ziparc {

/// @brief An entry as found in the archive, not yet decompressed.
struct PendingEntry
{
    LocalFileHeader header;
    ByteBlock compressedContent;
    uint32_t failedAttempts = 0;
};

/// @brief An entry that will never be extracted, and why.
struct RejectedEntry
{
    ZipError reason;
    std::string message;
};

///
/// @brief A decoded archive.
///
/// Every name listed in the central directory is held in exactly one of
/// `possiblyCompressed`, `uncompressed` or `rejected`. Entries only ever
/// move out of `possiblyCompressed`, and only ZipExtractor moves them.
///
struct ZipFile
{
    std::map<std::string, PendingEntry> possiblyCompressed;
    std::map<std::string, ByteBlock> uncompressed;
    std::map<std::string, RejectedEntry> rejected;
    std::vector<CentralDirHeader> centrals;
    Trailer trailer;

    ZipFile() = default;
    ZipFile(ZipFile&&) = default;
    ZipFile& operator=(ZipFile&&) = default;
    ZipFile(const ZipFile&) = delete;
    ZipFile& operator=(const ZipFile&) = delete;
};

struct ZipProgress
{
    size_t uncompressedCount;
    size_t possiblyCompressedCount;
    size_t rejectedCount;
    size_t total;

    bool operator==(const ZipProgress&) const = default;
};

ZipProgress progress(const ZipFile& zip);

enum class EntryState
{
    PENDING,
    UNCOMPRESSED,
    REJECTED
};

/// @brief Descriptive information about a single entry.
struct EntryInfo
{
    std::string name;
    uint16_t method;
    uint32_t compressedSize;
    uint32_t uncompressedSize;
    uint32_t crc32;
    uint32_t localHeaderOffset;
    uint16_t modTime;
    uint16_t modDate;
    uint32_t externalAttrs;
    std::string comment;
    EntryState state;

    bool operator==(const EntryInfo&) const = default;
};

/// @brief Lists the entries in central directory order. Does not
/// modify the archive.
std::vector<EntryInfo> overview(const ZipFile& zip);

const char* methodName(uint16_t method);

} // namespace ziparc
