// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <set>
#include <vector>
#include <ziparc/alloc/Block.h>
#include <ziparc/zip/ZipEntry.h>

namespace ziparc {

/// @brief Builds a ZIP archive in memory.
///
/// Entries are written in the order they were added: all local headers
/// with their payloads, then the central directory, then the end record.
/// Attributes and extra fields are fixed defaults; only the timestamp
/// and the archive comment can be changed.
///
class ZipWriter
{
public:
    explicit ZipWriter(CompressionMethod method = CompressionMethod::DEFLATE);
    explicit ZipWriter(CompressionPolicy policy);

    /// @throws std::invalid_argument if the name exceeds 65535 bytes or
    ///   was already added, or the archive would hold more than 65535 entries
    void add(ZipEntry&& entry);
    void addText(std::string name, std::string content)
    {
        add(TextEntry{ std::move(name), std::move(content) });
    }
    void addRaw(std::string name, ByteBlock&& content)
    {
        add(RawEntry{ std::move(name), std::move(content) });
    }

    /// @brief Sets the MS-DOS modification time and date recorded
    /// for all entries.
    void setTimestamp(uint16_t dosTime, uint16_t dosDate)
    {
        modTime_ = dosTime;
        modDate_ = dosDate;
    }

    /// @throws std::invalid_argument if longer than 65535 bytes
    void setComment(std::string comment);

    size_t entryCount() const { return entries_.size(); }

    /// @brief Serializes all added entries. The writer can be reused
    /// afterwards; it keeps its entries.
    ByteBlock build() const;

    /// @brief Compresses a single entry under the given method, keeping
    /// the raw bytes if compression does not make them smaller.
    /// @throws std::invalid_argument if the entry is 4 GB or larger
    static EncodedFile encode(const ZipEntry& entry, CompressionMethod method);

    /// @throws std::invalid_argument for the same limits as add(), or if
    ///   the archive would exceed 4 GB
    static ByteBlock build(const std::vector<ZipEntry>& entries,
        CompressionMethod method);
    static ByteBlock build(const std::vector<ZipEntry>& entries,
        const CompressionPolicy& policy);

private:
    static void checkName(const std::string& name, std::set<std::string>& names);
    static void checkEntryCount(size_t count);
    static ByteBlock write(const std::vector<EncodedFile>& files,
        uint16_t modTime, uint16_t modDate, const std::string& comment);

    CompressionPolicy policy_;
    std::vector<ZipEntry> entries_;
    std::set<std::string> names_;
    std::string comment_;
    uint16_t modTime_ = 0;
    uint16_t modDate_ = ZipArchive::DOS_EPOCH_DATE;
};

} // namespace ziparc
