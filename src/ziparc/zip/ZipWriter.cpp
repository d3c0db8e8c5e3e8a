// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/ZipWriter.h>
#include <stdexcept>
#include <ziparc/text/Format.h>
#include <ziparc/util/Buffer.h>
#include <ziparc/util/log.h>
#include <ziparc/zip/Zip.h>

namespace ziparc {

const std::string& entryName(const ZipEntry& entry)
{
    return std::visit([](const auto& e) -> const std::string& { return e.name; }, entry);
}

ZipWriter::ZipWriter(CompressionMethod method) :
    policy_([method](const ZipEntry&) { return method; })
{
}

ZipWriter::ZipWriter(CompressionPolicy policy) :
    policy_(std::move(policy))
{
}

void ZipWriter::checkName(const std::string& name, std::set<std::string>& names)
{
    if (name.size() > 0xffff)
    {
        throw std::invalid_argument(Format::format(
            "Entry name of %zu bytes exceeds 65535", name.size()));
    }
    if (!names.insert(name).second)
    {
        throw std::invalid_argument("Duplicate entry name: " + name);
    }
}

void ZipWriter::checkEntryCount(size_t count)
{
    if (count > 0xffff)
    {
        throw std::invalid_argument(Format::format(
            "%zu entries exceed the limit of 65535", count));
    }
}

void ZipWriter::add(ZipEntry&& entry)
{
    checkEntryCount(entries_.size() + 1);
    checkName(entryName(entry), names_);
    entries_.push_back(std::move(entry));
}

void ZipWriter::setComment(std::string comment)
{
    if (comment.size() > 0xffff)
    {
        throw std::invalid_argument("Archive comment exceeds 65535 bytes");
    }
    comment_ = std::move(comment);
}

EncodedFile ZipWriter::encode(const ZipEntry& entry, CompressionMethod method)
{
    const uint8_t* data;
    size_t size;
    if (const TextEntry* text = std::get_if<TextEntry>(&entry))
    {
        data = reinterpret_cast<const uint8_t*>(text->content.data());
        size = text->content.size();
    }
    else
    {
        const RawEntry& raw = std::get<RawEntry>(entry);
        data = raw.content.data();
        size = raw.content.size();
    }

    ZipArchive::checkFieldValue(size, "Entry");
    EncodedFile file;
    file.name = entryName(entry);
    file.uncompressedSize = static_cast<uint32_t>(size);
    file.crc32 = Zip::calculateChecksum(data, size);

    if (method == CompressionMethod::DEFLATE)
    {
        ByteBlock compressed = Zip::deflateRaw(data, size);
        if (compressed.size() < size)
        {
            file.compressedSize = static_cast<uint32_t>(compressed.size());
            file.method = CompressionMethod::DEFLATE;
            file.payload = std::move(compressed);
            return file;
        }
        LOGS << file.name << ": deflated size " << compressed.size()
            << " >= " << size << ", storing instead";
    }
    file.compressedSize = file.uncompressedSize;
    file.method = CompressionMethod::STORE;
    file.payload = ByteBlock::copyOf(data, size);
    return file;
}

ByteBlock ZipWriter::write(const std::vector<EncodedFile>& files,
    uint16_t modTime, uint16_t modDate, const std::string& comment)
{
    DynamicBuffer out(64 * 1024);
    std::vector<CentralDirHeader> centrals;
    centrals.reserve(files.size());

    // The offset recorded in each central header is the number of bytes
    // already emitted when the entry's local header starts
    uint64_t offset = 0;
    for (const EncodedFile& file : files)
    {
        ZipArchive::checkFieldValue(offset, "Local header offset");
        LocalFileHeader local;
        local.method = static_cast<uint16_t>(file.method);
        local.modTime = modTime;
        local.modDate = modDate;
        local.crc32 = file.crc32;
        local.compressedSize = file.compressedSize;
        local.uncompressedSize = file.uncompressedSize;
        local.fileName = file.name;
        local.write(out);
        out.putBytes(file.payload.data(), file.payload.size());

        CentralDirHeader& central = centrals.emplace_back();
        central.method = local.method;
        central.modTime = modTime;
        central.modDate = modDate;
        central.crc32 = file.crc32;
        central.compressedSize = file.compressedSize;
        central.uncompressedSize = file.uncompressedSize;
        central.fileName = file.name;
        central.localHeaderOffset = static_cast<uint32_t>(offset);

        offset += local.encodedSize() + file.payload.size();
    }

    uint64_t centralDirOffset = offset;
    ZipArchive::checkFieldValue(centralDirOffset, "Central directory offset");
    for (const CentralDirHeader& central : centrals)
    {
        central.write(out);
        offset += central.encodedSize();
    }
    ZipArchive::checkFieldValue(offset - centralDirOffset, "Central directory");

    Trailer trailer;
    trailer.entriesOnThisDisk = static_cast<uint16_t>(centrals.size());
    trailer.totalEntries = static_cast<uint16_t>(centrals.size());
    trailer.centralDirSize = static_cast<uint32_t>(offset - centralDirOffset);
    trailer.centralDirOffset = static_cast<uint32_t>(centralDirOffset);
    trailer.comment = comment;
    trailer.write(out);

    LOGS << "Wrote " << files.size() << " entries, central directory of "
        << trailer.centralDirSize << " bytes at " << centralDirOffset;
    return out.takeBlock();
}

ByteBlock ZipWriter::build() const
{
    std::vector<EncodedFile> files;
    files.reserve(entries_.size());
    for (const ZipEntry& entry : entries_)
    {
        files.push_back(encode(entry, policy_(entry)));
    }
    return write(files, modTime_, modDate_, comment_);
}

ByteBlock ZipWriter::build(const std::vector<ZipEntry>& entries,
    CompressionMethod method)
{
    return build(entries, [method](const ZipEntry&) { return method; });
}

ByteBlock ZipWriter::build(const std::vector<ZipEntry>& entries,
    const CompressionPolicy& policy)
{
    checkEntryCount(entries.size());
    std::set<std::string> names;
    for (const ZipEntry& entry : entries)
    {
        checkName(entryName(entry), names);
    }
    std::vector<EncodedFile> files;
    files.reserve(entries.size());
    for (const ZipEntry& entry : entries)
    {
        files.push_back(encode(entry, policy(entry)));
    }
    return write(files, 0, ZipArchive::DOS_EPOCH_DATE, std::string());
}

} // namespace ziparc
