// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include <ziparc/zip/ZipExtractor.h>
#include <stdexcept>
#include <ziparc/text/Format.h>
#include <ziparc/text/Utf8.h>
#include <ziparc/util/log.h>
#include <ziparc/zip/Zip.h>

namespace ziparc {

void ExtractConfig::validate() const
{
    if (maxEntriesPerStep < 1)
    {
        throw std::invalid_argument(Format::format(
            "maxEntriesPerStep must be at least 1 (is %d)", maxEntriesPerStep));
    }
    if (maxAttempts < 1)
    {
        throw std::invalid_argument(Format::format(
            "maxAttempts must be at least 1 (is %d)", maxAttempts));
    }
}

ZipExtractor::ZipExtractor(ExtractConfig config) :
    config_(std::move(config))
{
    config_.validate();
}

ExtractStep ZipExtractor::step(ZipFile&& zip) const
{
    int inflatedCount = 0;
    uint64_t bytesInflated = 0;

    auto it = zip.possiblyCompressed.begin();
    while (it != zip.possiblyCompressed.end())
    {
        const std::string& name = it->first;
        PendingEntry& entry = it->second;
        uint16_t method = entry.header.method;

        if (method == static_cast<uint16_t>(CompressionMethod::STORE))
        {
            zip.uncompressed.emplace(name, std::move(entry.compressedContent));
            it = zip.possiblyCompressed.erase(it);
            continue;
        }

        if (method != static_cast<uint16_t>(CompressionMethod::DEFLATE))
        {
            LOGS << name << ": compression method " << method << " not supported";
            zip.rejected.emplace(name, RejectedEntry{
                ZipError::UNSUPPORTED_COMPRESSION_METHOD,
                Format::format("Unsupported compression method %d", method) });
            it = zip.possiblyCompressed.erase(it);
            continue;
        }

        uint64_t size = entry.header.compressedSize;
        bool eligible = inflatedCount < config_.maxEntriesPerStep;
        if (eligible && config_.maxBytesPerStep && inflatedCount > 0)
        {
            eligible = size < *config_.maxBytesPerStep - bytesInflated;
        }
        if (!eligible)
        {
            // Later entries may still be stored ones, which are free
            ++it;
            continue;
        }

        inflatedCount++;
        if (inflateEntry(name, entry, zip))
        {
            bytesInflated += size;
            if (config_.maxBytesPerStep && bytesInflated > *config_.maxBytesPerStep)
            {
                bytesInflated = *config_.maxBytesPerStep;
            }
            it = zip.possiblyCompressed.erase(it);
        }
        else if (entry.failedAttempts >= static_cast<uint32_t>(config_.maxAttempts))
        {
            it = zip.possiblyCompressed.erase(it);
        }
        else
        {
            ++it;
        }
    }

    if (!zip.possiblyCompressed.empty())
    {
        return ExtractLoop{ std::move(zip) };
    }
    return ExtractDone{ finish(std::move(zip)) };
}

// Returns true if the entry was inflated and moved to `uncompressed`.
// On failure, the entry stays pending unless it has run out of attempts,
// in which case it is added to `rejected` (the caller erases it).
bool ZipExtractor::inflateEntry(const std::string& name, PendingEntry& entry,
    ZipFile& zip) const
{
    try
    {
        ByteBlock bytes = Zip::inflateRaw(entry.compressedContent,
            entry.header.uncompressedSize);
        Zip::verifyChecksum(bytes, entry.header.crc32);
        zip.uncompressed.emplace(name, std::move(bytes));
        return true;
    }
    catch (const ZipException& ex)
    {
        entry.failedAttempts++;
        LOG("%s: attempt %u failed: %s", name.c_str(),
            entry.failedAttempts, ex.what());
        if (entry.failedAttempts >= static_cast<uint32_t>(config_.maxAttempts))
        {
            zip.rejected.emplace(name, RejectedEntry{
                ZipError::DECOMPRESSION_FAILED, ex.what() });
        }
        return false;
    }
}

ExtractionContent ZipExtractor::classify(const std::string& name, ByteBlock&& bytes) const
{
    if (!config_.classifyAsText || !config_.classifyAsText(name))
    {
        return BinaryContent{ std::move(bytes) };
    }
    if (!Utf8::isValid(bytes.data(), bytes.size()))
    {
        LOGS << name << ": not valid UTF-8, returning raw bytes";
        return FailedContent{ std::move(bytes), ZipError::TEXT_DECODE_FAILED };
    }
    return TextContent{ std::string(asStringView(bytes)) };
}

ExtractionResult ZipExtractor::finish(ZipFile&& zip) const
{
    ExtractionResult result;
    result.contents.reserve(zip.uncompressed.size());
    for (auto& [name, bytes] : zip.uncompressed)
    {
        result.contents.emplace_back(name, classify(name, std::move(bytes)));
    }
    result.rejected.reserve(zip.rejected.size());
    for (auto& [name, rejected] : zip.rejected)
    {
        result.rejected.emplace_back(name, std::move(rejected));
    }
    return result;
}

ExtractionResult ZipExtractor::extractAll(ZipFile&& zip) const
{
    for (;;)
    {
        ExtractStep next = step(std::move(zip));
        if (ExtractDone* done = std::get_if<ExtractDone>(&next))
        {
            return std::move(done->result);
        }
        zip = std::move(std::get<ExtractLoop>(next).zip);
    }
}

} // namespace ziparc
