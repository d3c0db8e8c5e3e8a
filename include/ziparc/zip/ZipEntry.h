// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <functional>
#include <string>
#include <variant>
#include <ziparc/alloc/Block.h>
#include <ziparc/zip/ZipArchive.h>

namespace ziparc {

struct TextEntry
{
    std::string name;
    std::string content;
};

struct RawEntry
{
    std::string name;
    ByteBlock content;
};

/// @brief A named file to be added to an archive.
using ZipEntry = std::variant<TextEntry, RawEntry>;

const std::string& entryName(const ZipEntry& entry);

/// @brief Picks the compression method to try for a given entry.
using CompressionPolicy = std::function<CompressionMethod(const ZipEntry&)>;

/// @brief An entry whose payload and metadata are final.
/// compressedSize never exceeds uncompressedSize; if deflating did not
/// make the payload strictly smaller, the entry is stored.
struct EncodedFile
{
    std::string name;
    ByteBlock payload;
    uint32_t uncompressedSize;
    uint32_t compressedSize;
    CompressionMethod method;
    uint32_t crc32;
};

} // namespace ziparc
