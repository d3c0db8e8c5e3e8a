// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/ZipFile.h>

namespace ziparc {

ZipProgress progress(const ZipFile& zip)
{
    ZipProgress p;
    p.uncompressedCount = zip.uncompressed.size();
    p.possiblyCompressedCount = zip.possiblyCompressed.size();
    p.rejectedCount = zip.rejected.size();
    p.total = p.uncompressedCount + p.possiblyCompressedCount + p.rejectedCount;
    return p;
}

std::vector<EntryInfo> overview(const ZipFile& zip)
{
    std::vector<EntryInfo> list;
    list.reserve(zip.centrals.size());
    for (const CentralDirHeader& central : zip.centrals)
    {
        EntryInfo& info = list.emplace_back();
        info.name = central.fileName;
        info.method = central.method;
        info.compressedSize = central.compressedSize;
        info.uncompressedSize = central.uncompressedSize;
        info.crc32 = central.crc32;
        info.localHeaderOffset = central.localHeaderOffset;
        info.modTime = central.modTime;
        info.modDate = central.modDate;
        info.externalAttrs = central.externalAttrs;
        info.comment = central.comment;
        if (zip.uncompressed.contains(central.fileName))
        {
            info.state = EntryState::UNCOMPRESSED;
        }
        else if (zip.rejected.contains(central.fileName))
        {
            info.state = EntryState::REJECTED;
        }
        else
        {
            info.state = EntryState::PENDING;
        }
    }
    return list;
}

const char* methodName(uint16_t method)
{
    switch (method)
    {
    case static_cast<uint16_t>(CompressionMethod::STORE):
        return "store";
    case static_cast<uint16_t>(CompressionMethod::DEFLATE):
        return "deflate";
    default:
        return "unsupported";
    }
}

} // namespace ziparc
