// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/ZipDecoder.h>
#include <ziparc/util/ByteReader.h>
#include <ziparc/util/log.h>

namespace ziparc {

ZipFile AnchoredZipDecoder::decode(const uint8_t* data, size_t size) const
{
    ByteReader all(data, size);
    if (size < ZipArchive::TRAILER_SIZE)
    {
        throw ZipException(ZipError::TRUNCATED_BUFFER,
            "%zu bytes are too few to hold an end record", size);
    }

    ZipFile zip;
    ByteReader tail = all.slice(size - ZipArchive::TRAILER_SIZE,
        ZipArchive::TRAILER_SIZE);
    zip.trailer = Trailer::read(tail);

    ByteReader dir = all.slice(zip.trailer.centralDirOffset,
        zip.trailer.centralDirSize);
    zip.centrals.reserve(zip.trailer.totalEntries);
    for (int i = 0; i < zip.trailer.totalEntries; i++)
    {
        zip.centrals.push_back(CentralDirHeader::read(dir));
    }
    LOGS << "Central directory at " << zip.trailer.centralDirOffset
        << " holds " << zip.centrals.size() << " entries";

    for (const CentralDirHeader& central : zip.centrals)
    {
        ByteReader in = all.sliceFrom(central.localHeaderOffset);
        LocalFileHeader header = LocalFileHeader::read(in);
        if (header.fileName != central.fileName)
        {
            throw ZipException(ZipError::INCONSISTENT_HEADERS,
                "Local header at %u names \"%s\" instead of \"%s\"",
                central.localHeaderOffset, header.fileName.c_str(),
                central.fileName.c_str());
        }
        if (header.hasDataDescriptor())
        {
            // Sizes in the local header may be zero; the central
            // directory always has the final values
            header.crc32 = central.crc32;
            header.compressedSize = central.compressedSize;
            header.uncompressedSize = central.uncompressedSize;
        }
        const uint8_t* payload = in.readBytes(header.compressedSize);
        addEntry(zip, std::move(header), payload);
    }
    return zip;
}

} // namespace ziparc
