// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <ziparc/zip/ZipFile.h>

namespace ziparc {

struct ExtractConfig
{
    /// @brief Maximum number of entries inflated in one step (at least 1).
    /// Stored entries are free.
    int maxEntriesPerStep = 16;

    /// @brief Maximum number of compressed bytes inflated in one step.
    /// The first entry of a step is inflated even if it alone exceeds
    /// the budget.
    std::optional<uint64_t> maxBytesPerStep;

    /// @brief Number of failed inflate attempts after which an entry
    /// is rejected (at least 1).
    int maxAttempts = 3;

    /// @brief Decides which entries are interpreted as UTF-8 text.
    /// If unset, all entries are binary.
    std::function<bool(const std::string&)> classifyAsText;

    /// @throws std::invalid_argument if a limit is out of range
    void validate() const;
};

struct TextContent
{
    std::string text;
};

struct BinaryContent
{
    ByteBlock bytes;
};

/// @brief Bytes of an entry that was meant to be text, but is not
/// valid UTF-8.
struct FailedContent
{
    ByteBlock bytes;
    ZipError reason;
};

using ExtractionContent = std::variant<TextContent, BinaryContent, FailedContent>;

struct ExtractionResult
{
    /// @brief Extracted entries, ordered by name.
    std::vector<std::pair<std::string, ExtractionContent>> contents;

    /// @brief Entries left out of `contents`, ordered by name.
    std::vector<std::pair<std::string, RejectedEntry>> rejected;
};

/// @brief More work remains; pass the archive to the next step.
struct ExtractLoop
{
    ZipFile zip;
};

struct ExtractDone
{
    ExtractionResult result;
};

using ExtractStep = std::variant<ExtractLoop, ExtractDone>;

///
/// @brief Decompresses the entries of a ZipFile in bounded steps.
///
/// Each call to step() does a limited amount of work and returns,
/// either with the updated archive (to be passed into the next call)
/// or with the final result. The caller decides when to take the next
/// step; abandoning the loop simply means not calling step() again.
///
/// An entry that fails to inflate is retried on later steps, and
/// rejected once it has failed `maxAttempts` times. Entries with
/// unsupported methods are rejected right away. Neither kind aborts
/// the extraction of the others.
///
class ZipExtractor
{
public:
    explicit ZipExtractor(ExtractConfig config);

    ExtractStep step(ZipFile&& zip) const;

    /// @brief Takes steps until done.
    ExtractionResult extractAll(ZipFile&& zip) const;

private:
    bool inflateEntry(const std::string& name, PendingEntry& entry,
        ZipFile& zip) const;
    ExtractionResult finish(ZipFile&& zip) const;
    ExtractionContent classify(const std::string& name, ByteBlock&& bytes) const;

    ExtractConfig config_;
};

inline ExtractStep extract(const ExtractConfig& config, ZipFile&& zip)
{
    return ZipExtractor(config).step(std::move(zip));
}

} // namespace ziparc
