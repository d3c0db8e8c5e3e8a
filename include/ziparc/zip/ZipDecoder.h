// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <optional>
#include <ziparc/zip/ZipFile.h>

namespace ziparc {

class ByteReader;

///
/// @brief Turns the bytes of a ZIP archive into a ZipFile.
///
/// A decoder treats the archive as a unit: if any part the central
/// directory promises cannot be decoded, the whole archive fails.
/// No entry is decompressed here (see ZipExtractor).
///
class ZipDecoder
{
public:
    virtual ~ZipDecoder() = default;

    /// @throws ZipException describing the first structural problem
    virtual ZipFile decode(const uint8_t* data, size_t size) const = 0;

    ZipFile decode(const ByteBlock& block) const
    {
        return decode(block.data(), block.size());
    }

    /// @brief Like decode(), but reports failure as an empty result.
    std::optional<ZipFile> read(const uint8_t* data, size_t size) const;

    std::optional<ZipFile> read(const ByteBlock& block) const
    {
        return read(block.data(), block.size());
    }

protected:
    static void addEntry(ZipFile& zip, LocalFileHeader&& header,
        const uint8_t* payload);
};

///
/// @brief Random-access decoder: locates the end record in the last
/// 22 bytes, decodes the central directory it points to, and then
/// each local entry at the offset its central header records.
///
/// Archives with a trailing comment are not located.
///
class AnchoredZipDecoder final : public ZipDecoder
{
public:
    using ZipDecoder::decode;
    ZipFile decode(const uint8_t* data, size_t size) const override;
};

///
/// @brief Streaming decoder: reads records front to back, dispatching
/// on each signature, until it reaches the end record.
///
/// Entries whose sizes are deferred to a data descriptor are delimited
/// by the end of their deflate stream, or (if stored) by the first
/// descriptor whose size matches. A stored entry can only be found this
/// way if its descriptor carries the optional signature; deflated
/// entries accept descriptors with or without it.
///
class SequentialZipDecoder final : public ZipDecoder
{
public:
    using ZipDecoder::decode;
    ZipFile decode(const uint8_t* data, size_t size) const override;

private:
    static void readLocalEntry(ByteReader& in, ZipFile& zip);
    static size_t findStoredLength(const ByteReader& in);
    static void verifyDirectory(const ZipFile& zip);
};

namespace Zip
{
/// @brief Decodes an archive using the anchored strategy.
std::optional<ZipFile> read(const uint8_t* data, size_t size);

inline std::optional<ZipFile> read(const ByteBlock& block)
{
    return read(block.data(), block.size());
}
}

} // namespace ziparc
