// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/Zip.h>
#include <zlib.h>
#include <ziparc/util/log.h>

namespace ziparc {

const char* errorName(ZipError error)
{
    switch (error)
    {
    case ZipError::MALFORMED_SIGNATURE:
        return "malformed signature";
    case ZipError::TRUNCATED_BUFFER:
        return "truncated buffer";
    case ZipError::INCONSISTENT_HEADERS:
        return "inconsistent headers";
    case ZipError::UNSUPPORTED_COMPRESSION_METHOD:
        return "unsupported compression method";
    case ZipError::DECOMPRESSION_FAILED:
        return "decompression failed";
    case ZipError::CHECKSUM_MISMATCH:
        return "checksum mismatch";
    case ZipError::TEXT_DECODE_FAILED:
        return "text decode failed";
    }
    return "unknown error";
}

namespace Zip
{
ByteBlock deflateRaw(const uint8_t* data, size_t size)
{
    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    strm.avail_in = static_cast<uInt>(size);

    // windowBits < 0 → raw deflate (no header, no checksum)
    int ret = deflateInit2(
        &strm,
        Z_DEFAULT_COMPRESSION,
        Z_DEFLATED,
        -MAX_WBITS,
        8,
        Z_DEFAULT_STRATEGY);

    if (ret != Z_OK)
    {
        throw ZipException(ret);
    }

    uLong bound = deflateBound(&strm, static_cast<uLong>(size));
    std::unique_ptr<uint8_t[]> out(new uint8_t[bound]);
    strm.next_out = out.get();
    strm.avail_out = static_cast<uInt>(bound);

    ret = deflate(&strm, Z_FINISH);
    if (ret != Z_STREAM_END)
    {
        deflateEnd(&strm);
        throw ZipException(ret);
    }

    size_t compressedSize = strm.total_out;
    deflateEnd(&strm);

    return ByteBlock(std::move(out), compressedSize);
}

ByteBlock inflateRaw(const uint8_t* data, size_t size, size_t sizeUncompressed)
{
    // Reserve one spare byte so that a stream producing more than the
    // declared size is detected rather than truncated
    std::unique_ptr<uint8_t[]> uncompressedData(new uint8_t[sizeUncompressed + 1]);

    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = static_cast<uInt>(size);
    strm.next_in = const_cast<Bytef*>(data);

    // Initialize inflate for raw DEFLATE (negative windowBits)
    int ret = inflateInit2(&strm, -MAX_WBITS);
    if (ret != Z_OK)
    {
        throw ZipException(ret);
    }

    strm.avail_out = static_cast<uInt>(sizeUncompressed + 1);
    strm.next_out = uncompressedData.get();

    ret = inflate(&strm, Z_FINISH);
    size_t produced = strm.total_out;
    inflateEnd(&strm);
        // inflateEnd only reports usage errors, not data errors

    if (ret != Z_STREAM_END)
    {
        if (ret == Z_BUF_ERROR || ret == Z_OK)
        {
            throw ZipException(ZipError::DECOMPRESSION_FAILED,
                produced > sizeUncompressed ?
                    "Inflated data exceeds declared size of %zu bytes" :
                    "Deflate stream ends early (%zu bytes declared)",
                sizeUncompressed);
        }
        throw ZipException(ret);
    }
    if (produced != sizeUncompressed)
    {
        throw ZipException(ZipError::DECOMPRESSION_FAILED,
            "Inflated %zu bytes instead of %zu", produced, sizeUncompressed);
    }
    return ByteBlock(std::move(uncompressedData), sizeUncompressed);
}

size_t rawStreamLength(const uint8_t* data, size_t size)
{
    z_stream strm{};
    strm.avail_in = static_cast<uInt>(size);
    strm.next_in = const_cast<Bytef*>(data);

    int ret = inflateInit2(&strm, -MAX_WBITS);
    if (ret != Z_OK)
    {
        throw ZipException(ret);
    }

    uint8_t scratch[16 * 1024];
    for (;;)
    {
        strm.next_out = scratch;
        strm.avail_out = sizeof(scratch);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK) break;
    }
    size_t consumed = strm.total_in;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END)
    {
        if (ret == Z_BUF_ERROR)
        {
            throw ZipException(ZipError::TRUNCATED_BUFFER,
                "Deflate stream does not end within %zu bytes", size);
        }
        throw ZipException(ret);
    }
    LOGS << "Deflate stream occupies " << consumed << " of " << size << " bytes";
    return consumed;
}

uint32_t calculateChecksum(const uint8_t* data, size_t size)
{
    return static_cast<uint32_t>(
        crc32_z(0, data, static_cast<z_size_t>(size)));
}

void verifyChecksum(const ByteBlock& block, uint32_t checksum)
{
    uint32_t actual = calculateChecksum(block);
    if (actual != checksum)
    {
        throw ZipException(ZipError::CHECKSUM_MISMATCH,
            "Checksum mismatch (expected %08X, found %08X)", checksum, actual);
    }
}

}  // end namespace Zip

} // namespace ziparc
