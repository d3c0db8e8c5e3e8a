// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/ZipDecoder.h>
#include <cstring>
#include <ziparc/util/ByteReader.h>
#include <ziparc/util/log.h>
#include <ziparc/zip/Zip.h>

namespace ziparc {

ZipFile SequentialZipDecoder::decode(const uint8_t* data, size_t size) const
{
    ByteReader in(data, size);
    ZipFile zip;
    for (;;)
    {
        uint32_t signature = in.peekUnsignedInt();
        switch (signature)
        {
        case ZipArchive::MAGIC_LOCAL_FILE_HEADER:
            readLocalEntry(in, zip);
            break;
        case ZipArchive::MAGIC_CENTRAL_DIR:
            zip.centrals.push_back(CentralDirHeader::read(in));
            break;
        case ZipArchive::MAGIC_EOCD:
            zip.trailer = Trailer::read(in);
            verifyDirectory(zip);
            return zip;
        default:
            // There is no way to resynchronize
            throw ZipException(ZipError::MALFORMED_SIGNATURE,
                "Unknown record signature 0x%08X at offset %zu",
                signature, in.offset());
        }
    }
}

void SequentialZipDecoder::readLocalEntry(ByteReader& in, ZipFile& zip)
{
    LocalFileHeader header = LocalFileHeader::read(in);
    if (!header.hasDataDescriptor())
    {
        const uint8_t* payload = in.readBytes(header.compressedSize);
        addEntry(zip, std::move(header), payload);
        return;
    }

    size_t len;
    if (header.compressedSize != 0)
    {
        len = header.compressedSize;
    }
    else if (header.method == static_cast<uint16_t>(CompressionMethod::DEFLATE))
    {
        len = Zip::rawStreamLength(in.ptr(), in.remaining());
    }
    else if (header.method == static_cast<uint16_t>(CompressionMethod::STORE))
    {
        len = findStoredLength(in);
    }
    else
    {
        throw ZipException(ZipError::UNSUPPORTED_COMPRESSION_METHOD,
            "Cannot delimit \"%s\": size deferred and method %d unknown",
            header.fileName.c_str(), header.method);
    }

    const uint8_t* payload = in.readBytes(len);
    DataDescriptor descriptor = DataDescriptor::read(in);
    if (descriptor.compressedSize != len)
    {
        throw ZipException(ZipError::INCONSISTENT_HEADERS,
            "Data descriptor of \"%s\" declares %u bytes, but payload has %zu",
            header.fileName.c_str(), descriptor.compressedSize, len);
    }
    LOGS << header.fileName << ": " << len << " bytes delimited by data descriptor";
    header.crc32 = descriptor.crc32;
    header.compressedSize = descriptor.compressedSize;
    header.uncompressedSize = descriptor.uncompressedSize;
    addEntry(zip, std::move(header), payload);
}

size_t SequentialZipDecoder::findStoredLength(const ByteReader& in)
{
    // A stored payload may itself contain the descriptor signature;
    // accept only a candidate whose declared sizes equal its position
    const uint8_t* p = in.ptr();
    size_t remaining = in.remaining();
    for (size_t pos = 0; pos + 16 <= remaining; pos++)
    {
        ByteReader candidate(p + pos, 16);
        if (candidate.readUnsignedInt() != ZipArchive::MAGIC_DATA_DESCRIPTOR) continue;
        candidate.readUnsignedInt();        // crc
        uint32_t compressedSize = candidate.readUnsignedInt();
        uint32_t uncompressedSize = candidate.readUnsignedInt();
        if (compressedSize == pos && uncompressedSize == pos) return pos;
    }
    throw ZipException(ZipError::TRUNCATED_BUFFER,
        "No data descriptor found after stored entry at offset %zu", in.offset());
}

void SequentialZipDecoder::verifyDirectory(const ZipFile& zip)
{
    if (zip.centrals.size() != zip.trailer.totalEntries)
    {
        throw ZipException(ZipError::INCONSISTENT_HEADERS,
            "End record declares %d entries, but %zu central headers were found",
            zip.trailer.totalEntries, zip.centrals.size());
    }
    if (zip.centrals.size() != zip.possiblyCompressed.size())
    {
        throw ZipException(ZipError::INCONSISTENT_HEADERS,
            "%zu local entries, but %zu central headers",
            zip.possiblyCompressed.size(), zip.centrals.size());
    }
    for (const CentralDirHeader& central : zip.centrals)
    {
        if (!zip.possiblyCompressed.contains(central.fileName))
        {
            throw ZipException(ZipError::INCONSISTENT_HEADERS,
                "Central header names \"%s\", which has no local entry",
                central.fileName.c_str());
        }
    }
}

} // namespace ziparc
