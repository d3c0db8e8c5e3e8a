// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <gtest/gtest.h>
#include <ziparc/util/Buffer.h>
#include <ziparc/zip/Zip.h>
#include <ziparc/zip/ZipDecoder.h>
#include <ziparc/zip/ZipWriter.h>
#include "TestUtil.h"

using namespace ziparc;
using namespace ziparc::test;

namespace {

std::vector<ZipEntry> sampleEntries()
{
    std::vector<ZipEntry> entries;
    entries.push_back(TextEntry{ "readme.txt", repetitiveText(4000) });
    entries.push_back(RawEntry{ "noise.bin", randomBytes(3000) });
    entries.push_back(TextEntry{ "empty.txt", "" });
    return entries;
}

struct StreamedEntry
{
    std::string name;
    std::string content;
    CompressionMethod method;
    bool descriptorSignature;
};

// Lays out entries the way a streaming producer does: local headers with
// flag bit 3 and zero sizes, each payload followed by a data descriptor.
ByteBlock buildStreamed(const std::vector<StreamedEntry>& entries)
{
    DynamicBuffer out;
    std::vector<CentralDirHeader> centrals;
    for (const StreamedEntry& e : entries)
    {
        ByteBlock raw = bytes(e.content);
        ByteBlock payload = e.method == CompressionMethod::DEFLATE ?
            Zip::deflateRaw(raw) : bytes(e.content);

        CentralDirHeader& central = centrals.emplace_back();
        central.flags = ZipArchive::FLAG_DATA_DESCRIPTOR;
        central.method = static_cast<uint16_t>(e.method);
        central.crc32 = Zip::calculateChecksum(raw);
        central.compressedSize = static_cast<uint32_t>(payload.size());
        central.uncompressedSize = static_cast<uint32_t>(raw.size());
        central.fileName = e.name;
        central.localHeaderOffset = static_cast<uint32_t>(out.size());

        LocalFileHeader local;
        local.flags = ZipArchive::FLAG_DATA_DESCRIPTOR;
        local.method = central.method;
        local.fileName = e.name;
        local.write(out);
        out.putBytes(payload.data(), payload.size());

        DataDescriptor descriptor;
        descriptor.hasSignature = e.descriptorSignature;
        descriptor.crc32 = central.crc32;
        descriptor.compressedSize = central.compressedSize;
        descriptor.uncompressedSize = central.uncompressedSize;
        descriptor.write(out);
    }
    Trailer trailer;
    trailer.centralDirOffset = static_cast<uint32_t>(out.size());
    for (const CentralDirHeader& central : centrals) central.write(out);
    trailer.centralDirSize = static_cast<uint32_t>(out.size()) - trailer.centralDirOffset;
    trailer.totalEntries = static_cast<uint16_t>(centrals.size());
    trailer.entriesOnThisDisk = trailer.totalEntries;
    trailer.write(out);
    return out.takeBlock();
}

std::vector<StreamedEntry> streamedSample()
{
    return {
        { "deflated.txt", repetitiveText(5000), CompressionMethod::DEFLATE, true },
        { "stored.txt", "stored PK\x07\x08 with a fake signature", CompressionMethod::STORE, true },
        { "bare.txt", repetitiveText(700, "abc"), CompressionMethod::DEFLATE, false },
    };
}

void expectStreamedSample(const ZipFile& zip)
{
    ASSERT_EQ(zip.possiblyCompressed.size(), 3u);
    for (const StreamedEntry& e : streamedSample())
    {
        const PendingEntry& entry = zip.possiblyCompressed.at(e.name);
        EXPECT_EQ(entry.header.uncompressedSize, e.content.size()) << e.name;
        EXPECT_EQ(entry.header.compressedSize, entry.compressedContent.size()) << e.name;
        EXPECT_EQ(entry.header.crc32, Zip::calculateChecksum(bytes(e.content))) << e.name;
        if (e.method == CompressionMethod::STORE)
        {
            EXPECT_EQ(str(entry.compressedContent), e.content);
        }
        else
        {
            EXPECT_EQ(str(Zip::inflateRaw(entry.compressedContent,
                entry.header.uncompressedSize)), e.content);
        }
    }
}

TEST(ZipDecoderTest, AnchoredSingleStoredEntry)
{
    std::vector<ZipEntry> entries;
    entries.push_back(TextEntry{ "test.txt", "foo bar baz\n" });
    ByteBlock archive = ZipWriter::build(entries, CompressionMethod::STORE);

    std::optional<ZipFile> zip = AnchoredZipDecoder().read(archive);
    ASSERT_TRUE(zip.has_value());
    ASSERT_EQ(zip->centrals.size(), 1u);
    const CentralDirHeader& central = zip->centrals[0];
    EXPECT_EQ(central.fileName, "test.txt");
    EXPECT_EQ(central.uncompressedSize, 12u);
    EXPECT_EQ(central.method, 0);
    EXPECT_EQ(central.crc32, Zip::calculateChecksum(bytes("foo bar baz\n")));

    EXPECT_TRUE(zip->uncompressed.empty());
    ASSERT_EQ(zip->possiblyCompressed.count("test.txt"), 1u);
    EXPECT_EQ(str(zip->possiblyCompressed.at("test.txt").compressedContent), "foo bar baz\n");
    EXPECT_EQ(zip->trailer.totalEntries, 1);
}

TEST(ZipDecoderTest, StrategiesAgree)
{
    ByteBlock archive = ZipWriter::build(sampleEntries(), CompressionMethod::DEFLATE);
    ZipFile anchored = AnchoredZipDecoder().decode(archive);
    ZipFile sequential = SequentialZipDecoder().decode(archive);

    ASSERT_EQ(anchored.centrals.size(), 3u);
    ASSERT_EQ(sequential.centrals.size(), 3u);
    for (size_t i = 0; i < anchored.centrals.size(); i++)
    {
        EXPECT_EQ(anchored.centrals[i].fileName, sequential.centrals[i].fileName);
        EXPECT_EQ(anchored.centrals[i].localHeaderOffset,
            sequential.centrals[i].localHeaderOffset);
    }
    ASSERT_EQ(anchored.possiblyCompressed.size(), sequential.possiblyCompressed.size());
    for (const auto& [name, entry] : anchored.possiblyCompressed)
    {
        const PendingEntry& other = sequential.possiblyCompressed.at(name);
        EXPECT_EQ(entry.header.method, other.header.method) << name;
        EXPECT_EQ(entry.header.crc32, other.header.crc32) << name;
        EXPECT_EQ(entry.compressedContent, other.compressedContent) << name;
    }
}

TEST(ZipDecoderTest, ModuleLevelReadUsesAnchoredStrategy)
{
    ByteBlock archive = ZipWriter::build(sampleEntries(), CompressionMethod::DEFLATE);
    std::optional<ZipFile> zip = Zip::read(archive);
    ASSERT_TRUE(zip.has_value());
    EXPECT_EQ(zip->possiblyCompressed.size(), 3u);
    EXPECT_EQ(zip->possiblyCompressed.at("noise.bin").header.method, 0);
    EXPECT_EQ(zip->possiblyCompressed.at("readme.txt").header.method, 8);
}

TEST(ZipDecoderTest, EmptyArchive)
{
    ZipWriter writer;
    ByteBlock archive = writer.build();
    AnchoredZipDecoder anchored;
    SequentialZipDecoder sequential;
    for (const ZipDecoder* decoder : { static_cast<const ZipDecoder*>(&anchored),
        static_cast<const ZipDecoder*>(&sequential) })
    {
        std::optional<ZipFile> zip = decoder->read(archive);
        ASSERT_TRUE(zip.has_value());
        EXPECT_TRUE(zip->centrals.empty());
        EXPECT_TRUE(zip->possiblyCompressed.empty());
    }
}

TEST(ZipDecoderTest, TruncatedArchiveFails)
{
    ByteBlock archive = ZipWriter::build(sampleEntries(), CompressionMethod::DEFLATE);
    // Cutting anywhere loses the end record or part of what it points to
    for (size_t len : { size_t(0), size_t(10), archive.size() / 2, archive.size() - 1 })
    {
        EXPECT_FALSE(AnchoredZipDecoder().read(archive.data(), len).has_value()) << len;
        EXPECT_FALSE(SequentialZipDecoder().read(archive.data(), len).has_value()) << len;
    }
}

TEST(ZipDecoderTest, GarbageFails)
{
    ByteBlock garbage = randomBytes(500);
    EXPECT_FALSE(Zip::read(garbage).has_value());
    try
    {
        SequentialZipDecoder().decode(garbage);
        FAIL() << "expected ZipException";
    }
    catch (const ZipException& ex)
    {
        EXPECT_EQ(ex.error(), ZipError::MALFORMED_SIGNATURE);
    }
}

TEST(ZipDecoderTest, CentralDirectoryOutOfRange)
{
    ByteBlock archive = ZipWriter::build(sampleEntries(), CompressionMethod::STORE);
    // Point the central directory past the end of the buffer
    size_t offsetField = archive.size() - 22 + 16;
    archive[offsetField + 3] = 0x7f;
    try
    {
        AnchoredZipDecoder().decode(archive);
        FAIL() << "expected ZipException";
    }
    catch (const ZipException& ex)
    {
        EXPECT_EQ(ex.error(), ZipError::TRUNCATED_BUFFER);
    }
}

TEST(ZipDecoderTest, CorruptLocalHeaderFailsWholeArchive)
{
    ByteBlock archive = ZipWriter::build(sampleEntries(), CompressionMethod::STORE);
    ZipFile zip = AnchoredZipDecoder().decode(archive);
    uint32_t ofs = zip.centrals[1].localHeaderOffset;
    archive[ofs] = 'X';
    EXPECT_FALSE(AnchoredZipDecoder().read(archive).has_value());
    try
    {
        AnchoredZipDecoder().decode(archive);
        FAIL() << "expected ZipException";
    }
    catch (const ZipException& ex)
    {
        EXPECT_EQ(ex.error(), ZipError::MALFORMED_SIGNATURE);
    }
}

TEST(ZipDecoderTest, LocalNameMismatch)
{
    std::vector<ZipEntry> entries;
    entries.push_back(TextEntry{ "abc.txt", "content" });
    ByteBlock archive = ZipWriter::build(entries, CompressionMethod::STORE);
    archive[30] = 'x';      // first byte of the local header's name
    try
    {
        AnchoredZipDecoder().decode(archive);
        FAIL() << "expected ZipException";
    }
    catch (const ZipException& ex)
    {
        EXPECT_EQ(ex.error(), ZipError::INCONSISTENT_HEADERS);
    }
}

TEST(ZipDecoderTest, DuplicateNamesRejected)
{
    std::vector<ZipEntry> entries;
    entries.push_back(TextEntry{ "same.txt", "one" });
    entries.push_back(TextEntry{ "same.txt", "two" });
    ByteBlock archive = ZipWriter::build(entries, CompressionMethod::STORE);
    EXPECT_FALSE(AnchoredZipDecoder().read(archive).has_value());
    EXPECT_FALSE(SequentialZipDecoder().read(archive).has_value());
}

TEST(ZipDecoderTest, TrailingCommentOnlyReadSequentially)
{
    ZipWriter writer(CompressionMethod::STORE);
    writer.setComment("archive comment");
    writer.addText("a.txt", "alpha");
    ByteBlock archive = writer.build();

    // The anchored decoder expects the end record in the last 22 bytes
    EXPECT_FALSE(AnchoredZipDecoder().read(archive).has_value());

    std::optional<ZipFile> zip = SequentialZipDecoder().read(archive);
    ASSERT_TRUE(zip.has_value());
    EXPECT_EQ(zip->trailer.comment, "archive comment");
    EXPECT_EQ(str(zip->possiblyCompressed.at("a.txt").compressedContent), "alpha");
}

TEST(ZipDecoderTest, AnchoredDataDescriptors)
{
    ByteBlock archive = buildStreamed(streamedSample());
    ZipFile zip = AnchoredZipDecoder().decode(archive);
    expectStreamedSample(zip);
}

TEST(ZipDecoderTest, SequentialDataDescriptors)
{
    ByteBlock archive = buildStreamed(streamedSample());
    ZipFile zip = SequentialZipDecoder().decode(archive);
    expectStreamedSample(zip);
}

TEST(ZipDecoderTest, SequentialRejectsMissingCentralEntry)
{
    ByteBlock archive = ZipWriter::build(sampleEntries(), CompressionMethod::STORE);
    ZipFile zip = AnchoredZipDecoder().decode(archive);
    // Rename the first entry in the central directory only
    size_t nameOfs = zip.trailer.centralDirOffset + 46;
    archive[nameOfs] = 'X';
    try
    {
        SequentialZipDecoder().decode(archive);
        FAIL() << "expected ZipException";
    }
    catch (const ZipException& ex)
    {
        EXPECT_EQ(ex.error(), ZipError::INCONSISTENT_HEADERS);
    }
}

TEST(ZipDecoderTest, OverviewIsReadOnly)
{
    ByteBlock archive = ZipWriter::build(sampleEntries(), CompressionMethod::DEFLATE);
    ZipFile zip = AnchoredZipDecoder().decode(archive);
    std::vector<EntryInfo> first = overview(zip);
    std::vector<EntryInfo> second = overview(zip);
    EXPECT_EQ(first, second);
    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(first[0].name, "readme.txt");
    EXPECT_EQ(first[0].method, 8);
    EXPECT_EQ(first[0].uncompressedSize, 4000u);
    EXPECT_EQ(first[0].state, EntryState::PENDING);
    EXPECT_EQ(first[1].name, "noise.bin");
    EXPECT_EQ(first[1].method, 0);
    EXPECT_GT(first[1].localHeaderOffset, first[0].localHeaderOffset);
    EXPECT_EQ(zip.possiblyCompressed.size(), 3u);

    ZipProgress p = progress(zip);
    EXPECT_EQ(p.possiblyCompressedCount, 3u);
    EXPECT_EQ(p.uncompressedCount, 0u);
    EXPECT_EQ(p.total, 3u);
    EXPECT_EQ(progress(zip), p);
}

} // namespace
