// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/ZipArchive.h>
#include <stdexcept>
#include <ziparc/text/Format.h>
#include <ziparc/util/Buffer.h>
#include <ziparc/util/ByteReader.h>

namespace ziparc {

void ZipArchive::checkFieldValue(uint64_t value, const char* what)
{
    if (value > MAX_FIELD_VALUE)
    {
        throw std::invalid_argument(Format::format(
            "%s of %llu bytes exceeds the 4 GB limit of ZIP archives",
            what, static_cast<unsigned long long>(value)));
    }
}

// The decoders below read the fixed fields strictly in on-disk order.
// The 16-bit length fields must be known before the variable-length
// runs they describe can be consumed.

LocalFileHeader LocalFileHeader::read(ByteReader& in)
{
    in.expectSignature(ZipArchive::MAGIC_LOCAL_FILE_HEADER, "local file header");
    LocalFileHeader h;
    h.versionNeeded = in.readUnsignedShort();
    h.flags = in.readUnsignedShort();
    h.method = in.readUnsignedShort();
    h.modTime = in.readUnsignedShort();
    h.modDate = in.readUnsignedShort();
    h.crc32 = in.readUnsignedInt();
    h.compressedSize = in.readUnsignedInt();
    h.uncompressedSize = in.readUnsignedInt();
    uint16_t fileNameLen = in.readUnsignedShort();
    uint16_t extraLen = in.readUnsignedShort();
    h.fileName = in.readString(fileNameLen);
    h.extra = in.readString(extraLen);
    return h;
}

void LocalFileHeader::write(DynamicBuffer& out) const
{
    out.putUnsignedInt(ZipArchive::MAGIC_LOCAL_FILE_HEADER);
    out.putUnsignedShort(versionNeeded);
    out.putUnsignedShort(flags);
    out.putUnsignedShort(method);
    out.putUnsignedShort(modTime);
    out.putUnsignedShort(modDate);
    out.putUnsignedInt(crc32);
    out.putUnsignedInt(compressedSize);
    out.putUnsignedInt(uncompressedSize);
    out.putUnsignedShort(static_cast<uint16_t>(fileName.size()));
    out.putUnsignedShort(static_cast<uint16_t>(extra.size()));
    out.putBytes(fileName);
    out.putBytes(extra);
}

DataDescriptor DataDescriptor::read(ByteReader& in)
{
    DataDescriptor d;
    // The first word is either the optional signature or already the CRC;
    // only its value tells which
    uint32_t first = in.readUnsignedInt();
    d.hasSignature = first == ZipArchive::MAGIC_DATA_DESCRIPTOR;
    d.crc32 = d.hasSignature ? in.readUnsignedInt() : first;
    d.compressedSize = in.readUnsignedInt();
    d.uncompressedSize = in.readUnsignedInt();
    return d;
}

void DataDescriptor::write(DynamicBuffer& out) const
{
    if (hasSignature) out.putUnsignedInt(ZipArchive::MAGIC_DATA_DESCRIPTOR);
    out.putUnsignedInt(crc32);
    out.putUnsignedInt(compressedSize);
    out.putUnsignedInt(uncompressedSize);
}

CentralDirHeader CentralDirHeader::read(ByteReader& in)
{
    in.expectSignature(ZipArchive::MAGIC_CENTRAL_DIR, "central directory");
    CentralDirHeader h;
    h.versionMadeBy = in.readUnsignedShort();
    h.versionNeeded = in.readUnsignedShort();
    h.flags = in.readUnsignedShort();
    h.method = in.readUnsignedShort();
    h.modTime = in.readUnsignedShort();
    h.modDate = in.readUnsignedShort();
    h.crc32 = in.readUnsignedInt();
    h.compressedSize = in.readUnsignedInt();
    h.uncompressedSize = in.readUnsignedInt();
    uint16_t fileNameLen = in.readUnsignedShort();
    uint16_t extraLen = in.readUnsignedShort();
    uint16_t commentLen = in.readUnsignedShort();
    h.diskNumberStart = in.readUnsignedShort();
    h.internalAttrs = in.readUnsignedShort();
    h.externalAttrs = in.readUnsignedInt();
    h.localHeaderOffset = in.readUnsignedInt();
    h.fileName = in.readString(fileNameLen);
    h.extra = in.readString(extraLen);
    h.comment = in.readString(commentLen);
    return h;
}

void CentralDirHeader::write(DynamicBuffer& out) const
{
    out.putUnsignedInt(ZipArchive::MAGIC_CENTRAL_DIR);
    out.putUnsignedShort(versionMadeBy);
    out.putUnsignedShort(versionNeeded);
    out.putUnsignedShort(flags);
    out.putUnsignedShort(method);
    out.putUnsignedShort(modTime);
    out.putUnsignedShort(modDate);
    out.putUnsignedInt(crc32);
    out.putUnsignedInt(compressedSize);
    out.putUnsignedInt(uncompressedSize);
    out.putUnsignedShort(static_cast<uint16_t>(fileName.size()));
    out.putUnsignedShort(static_cast<uint16_t>(extra.size()));
    out.putUnsignedShort(static_cast<uint16_t>(comment.size()));
    out.putUnsignedShort(diskNumberStart);
    out.putUnsignedShort(internalAttrs);
    out.putUnsignedInt(externalAttrs);
    out.putUnsignedInt(localHeaderOffset);
    out.putBytes(fileName);
    out.putBytes(extra);
    out.putBytes(comment);
}

Trailer Trailer::read(ByteReader& in)
{
    in.expectSignature(ZipArchive::MAGIC_EOCD, "end of central directory");
    Trailer t;
    t.diskNumber = in.readUnsignedShort();
    t.centralDirDisk = in.readUnsignedShort();
    t.entriesOnThisDisk = in.readUnsignedShort();
    t.totalEntries = in.readUnsignedShort();
    t.centralDirSize = in.readUnsignedInt();
    t.centralDirOffset = in.readUnsignedInt();
    uint16_t commentLen = in.readUnsignedShort();
    t.comment = in.readString(commentLen);
    return t;
}

void Trailer::write(DynamicBuffer& out) const
{
    out.putUnsignedInt(ZipArchive::MAGIC_EOCD);
    out.putUnsignedShort(diskNumber);
    out.putUnsignedShort(centralDirDisk);
    out.putUnsignedShort(entriesOnThisDisk);
    out.putUnsignedShort(totalEntries);
    out.putUnsignedInt(centralDirSize);
    out.putUnsignedInt(centralDirOffset);
    out.putUnsignedShort(static_cast<uint16_t>(comment.size()));
    out.putBytes(comment);
}

} // namespace ziparc
