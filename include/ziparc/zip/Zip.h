// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <ziparc/alloc/Block.h>
#include <ziparc/zip/ZipException.h>

namespace ziparc {

// Raw DEFLATE (RFC 1951, no zlib header or trailer) and CRC-32,
// as used for ZIP entry payloads.

namespace Zip
{
ByteBlock deflateRaw(const uint8_t* data, size_t size);
inline ByteBlock deflateRaw(const ByteBlock& block)
{
    return deflateRaw(block.data(), block.size());
}

/// @brief Inflates a raw deflate stream whose uncompressed size is known.
/// @throws ZipException if the stream is corrupt, ends early, or does not
///   produce exactly `sizeUncompressed` bytes.
ByteBlock inflateRaw(const uint8_t* data, size_t size, size_t sizeUncompressed);
inline ByteBlock inflateRaw(const ByteBlock& block, size_t sizeUncompressed)
{
    return inflateRaw(block.data(), block.size(), sizeUncompressed);
}

/// @brief Determines how many bytes of `data` belong to the raw deflate
/// stream that starts there, by inflating it into a scratch buffer.
/// @throws ZipException if no complete stream is found.
size_t rawStreamLength(const uint8_t* data, size_t size);

uint32_t calculateChecksum(const uint8_t* data, size_t size);
inline uint32_t calculateChecksum(const ByteBlock& block)
{
    return calculateChecksum(block.data(), block.size());
}

void verifyChecksum(const ByteBlock& block, uint32_t checksum);
}

} // namespace ziparc
