// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <cstring>
#include <gtest/gtest.h>
#include <stdexcept>
#include <ziparc/util/Buffer.h>
#include <ziparc/util/ByteReader.h>
#include <ziparc/zip/ZipArchive.h>
#include "TestUtil.h"

using namespace ziparc;

namespace {

// clang-format off
const uint8_t kLocalHeader[] = {
    /*signature*/ 0x50, 0x4b, 0x03, 0x04,
    /*version*/   0x14, 0x00,
    /*flags*/     0x08, 0x00,
    /*method*/    0x08, 0x00,
    /*time*/      0x00, 0x60,
    /*date*/      0x21, 0x5a,
    /*crc*/       0x78, 0x56, 0x34, 0x12,
    /*csize*/     0x05, 0x00, 0x00, 0x00,
    /*usize*/     0x07, 0x00, 0x00, 0x00,
    /*name len*/  0x03, 0x00,
    /*extra len*/ 0x02, 0x00,
    'a', 'b', 'c',
    0xca, 0xfe
};

// A minimal archive is an empty end record
const uint8_t kMinimalZip[] = {
    /*signature*/ 0x50, 0x4b, 0x05, 0x06,
    /*disk*/      0x00, 0x00, 0x00, 0x00,
    /*entries*/   0x00, 0x00, 0x00, 0x00,
    /*size*/      0x00, 0x00, 0x00, 0x00,
    /*offset*/    0x00, 0x00, 0x00, 0x00,
    /*comment*/   0x00, 0x00
};
// clang-format on

TEST(ZipArchiveTest, DecodeLocalFileHeader)
{
    ByteReader in(kLocalHeader, sizeof(kLocalHeader));
    LocalFileHeader h = LocalFileHeader::read(in);
    EXPECT_TRUE(in.atEnd());
    EXPECT_EQ(h.versionNeeded, 20);
    EXPECT_TRUE(h.hasDataDescriptor());
    EXPECT_EQ(h.method, 8);
    EXPECT_EQ(h.modTime, 0x6000);
    EXPECT_EQ(h.modDate, 0x5a21);
    EXPECT_EQ(h.crc32, 0x12345678u);
    EXPECT_EQ(h.compressedSize, 5u);
    EXPECT_EQ(h.uncompressedSize, 7u);
    EXPECT_EQ(h.fileName, "abc");
    EXPECT_EQ(h.extra, "\xca\xfe");
    EXPECT_EQ(h.encodedSize(), sizeof(kLocalHeader));
}

TEST(ZipArchiveTest, EncodeLocalFileHeaderMatchesLayout)
{
    ByteReader in(kLocalHeader, sizeof(kLocalHeader));
    LocalFileHeader h = LocalFileHeader::read(in);
    DynamicBuffer out;
    h.write(out);
    ASSERT_EQ(out.size(), sizeof(kLocalHeader));
    EXPECT_EQ(0, memcmp(out.data(), kLocalHeader, sizeof(kLocalHeader)));
}

TEST(ZipArchiveTest, NameLongerThanBufferIsTruncation)
{
    // Drop the extra field bytes: the declared lengths now exceed the buffer
    ByteReader in(kLocalHeader, sizeof(kLocalHeader) - 1);
    try
    {
        LocalFileHeader::read(in);
        FAIL() << "expected ZipException";
    }
    catch (const ZipException& ex)
    {
        EXPECT_EQ(ex.error(), ZipError::TRUNCATED_BUFFER);
    }
}

TEST(ZipArchiveTest, WrongRecordIsMalformedSignature)
{
    ByteReader in(kLocalHeader, sizeof(kLocalHeader));
    try
    {
        CentralDirHeader::read(in);
        FAIL() << "expected ZipException";
    }
    catch (const ZipException& ex)
    {
        EXPECT_EQ(ex.error(), ZipError::MALFORMED_SIGNATURE);
    }
}

TEST(ZipArchiveTest, DataDescriptorWithSignature)
{
    const uint8_t data[] = {
        0x50, 0x4b, 0x07, 0x08,
        0x11, 0x22, 0x33, 0x44,
        0x10, 0x00, 0x00, 0x00,
        0x20, 0x00, 0x00, 0x00 };
    ByteReader in(data, sizeof(data));
    DataDescriptor d = DataDescriptor::read(in);
    EXPECT_TRUE(in.atEnd());
    EXPECT_TRUE(d.hasSignature);
    EXPECT_EQ(d.crc32, 0x44332211u);
    EXPECT_EQ(d.compressedSize, 16u);
    EXPECT_EQ(d.uncompressedSize, 32u);
    EXPECT_EQ(d.encodedSize(), 16u);
}

TEST(ZipArchiveTest, DataDescriptorWithoutSignature)
{
    // The first word is the CRC itself; only two more follow
    const uint8_t data[] = {
        0x11, 0x22, 0x33, 0x44,
        0x10, 0x00, 0x00, 0x00,
        0x20, 0x00, 0x00, 0x00,
        0x50, 0x4b, 0x01, 0x02 };
    ByteReader in(data, sizeof(data));
    DataDescriptor d = DataDescriptor::read(in);
    EXPECT_EQ(in.offset(), 12u);
    EXPECT_FALSE(d.hasSignature);
    EXPECT_EQ(d.crc32, 0x44332211u);
    EXPECT_EQ(d.compressedSize, 16u);
    EXPECT_EQ(d.uncompressedSize, 32u);

    DynamicBuffer out;
    d.write(out);
    ASSERT_EQ(out.size(), 12u);
    EXPECT_EQ(0, memcmp(out.data(), data, 12));
}

TEST(ZipArchiveTest, CentralDirHeaderRoundTrip)
{
    CentralDirHeader h;
    h.method = 8;
    h.crc32 = 0xdeadbeef;
    h.compressedSize = 100;
    h.uncompressedSize = 300;
    h.fileName = "dir/file.bin";
    h.extra = std::string("\x01\x00\x00\x00", 4);
    h.comment = "note";
    h.externalAttrs = 0x81a40000;
    h.localHeaderOffset = 0x01020304;

    DynamicBuffer out;
    h.write(out);
    ASSERT_EQ(out.size(), h.encodedSize());
    ASSERT_EQ(out.size(), 46u + 12 + 4 + 4);
    // Offset of the local header is the last fixed field
    EXPECT_EQ(out.data()[42], 0x04);
    EXPECT_EQ(out.data()[45], 0x01);

    ByteReader in(out.data(), out.size());
    CentralDirHeader d = CentralDirHeader::read(in);
    EXPECT_TRUE(in.atEnd());
    EXPECT_EQ(d.fileName, h.fileName);
    EXPECT_EQ(d.extra, h.extra);
    EXPECT_EQ(d.comment, h.comment);
    EXPECT_EQ(d.crc32, h.crc32);
    EXPECT_EQ(d.externalAttrs, h.externalAttrs);
    EXPECT_EQ(d.localHeaderOffset, h.localHeaderOffset);
    EXPECT_EQ(d.versionMadeBy, ZipArchive::VERSION_MADE_BY);
}

TEST(ZipArchiveTest, MinimalTrailer)
{
    ByteReader in(kMinimalZip, sizeof(kMinimalZip));
    Trailer t = Trailer::read(in);
    EXPECT_TRUE(in.atEnd());
    EXPECT_EQ(t.totalEntries, 0);
    EXPECT_EQ(t.centralDirSize, 0u);
    EXPECT_EQ(t.centralDirOffset, 0u);
    EXPECT_TRUE(t.comment.empty());
}

TEST(ZipArchiveTest, TrailerCommentIsLengthPrefixed)
{
    Trailer t;
    t.totalEntries = 2;
    t.entriesOnThisDisk = 2;
    t.centralDirSize = 120;
    t.centralDirOffset = 4000;
    t.comment = "hello";
    DynamicBuffer out;
    t.write(out);
    ASSERT_EQ(out.size(), 27u);
    EXPECT_EQ(out.data()[20], 5);
    EXPECT_EQ(out.data()[21], 0);

    ByteReader in(out.data(), out.size());
    Trailer d = Trailer::read(in);
    EXPECT_EQ(d.comment, "hello");
    EXPECT_EQ(d.centralDirOffset, 4000u);

    // Without the comment bytes, the record is incomplete
    ByteReader shortIn(out.data(), 22);
    EXPECT_THROW(Trailer::read(shortIn), ZipException);
}

TEST(ZipArchiveTest, FieldValuesLimitedTo32Bits)
{
    EXPECT_NO_THROW(ZipArchive::checkFieldValue(0, "Entry"));
    EXPECT_NO_THROW(ZipArchive::checkFieldValue(0xffffffffull, "Entry"));
    EXPECT_THROW(ZipArchive::checkFieldValue(0x100000000ull, "Entry"), std::invalid_argument);
    EXPECT_THROW(ZipArchive::checkFieldValue(5ull << 32, "Central directory offset"),
        std::invalid_argument);
}

} // namespace
