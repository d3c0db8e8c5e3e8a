// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/ZipDecoder.h>
#include <ziparc/util/log.h>

namespace ziparc {

std::optional<ZipFile> ZipDecoder::read(const uint8_t* data, size_t size) const
{
    try
    {
        return decode(data, size);
    }
    catch (const ZipException& ex)
    {
        LOG("Failed to decode archive of %zu bytes (%s): %s",
            size, errorName(ex.error()), ex.what());
        return std::nullopt;
    }
}

void ZipDecoder::addEntry(ZipFile& zip, LocalFileHeader&& header,
    const uint8_t* payload)
{
    auto [it, inserted] = zip.possiblyCompressed.try_emplace(header.fileName);
    if (!inserted)
    {
        throw ZipException(ZipError::INCONSISTENT_HEADERS,
            "Duplicate entry \"%s\"", header.fileName.c_str());
    }
    PendingEntry& entry = it->second;
    entry.compressedContent = ByteBlock::copyOf(payload, header.compressedSize);
    entry.header = std::move(header);
}

namespace Zip
{
std::optional<ZipFile> read(const uint8_t* data, size_t size)
{
    return AnchoredZipDecoder().read(data, size);
}
}

} // namespace ziparc
