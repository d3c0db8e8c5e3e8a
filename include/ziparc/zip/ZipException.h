// Copyright (c) 2024 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <stdexcept>
#include <string>
#include <zlib.h>
#include <ziparc/text/Format.h>

namespace ziparc {

enum class ZipError
{
    MALFORMED_SIGNATURE,
    TRUNCATED_BUFFER,
    INCONSISTENT_HEADERS,
    UNSUPPORTED_COMPRESSION_METHOD,
    DECOMPRESSION_FAILED,
    CHECKSUM_MISMATCH,
    TEXT_DECODE_FAILED
};

const char* errorName(ZipError error);

class ZipException : public std::runtime_error
{
public:
    explicit ZipException(int zlibErrorCode) :
        std::runtime_error(zError(zlibErrorCode)),
        error_(ZipError::DECOMPRESSION_FAILED),
        zlibErrorCode_(zlibErrorCode)
    {
    }

    ZipException(ZipError error, const char* message) :
        std::runtime_error(message),
        error_(error),
        zlibErrorCode_(0)
    {
    }

    ZipException(ZipError error, const std::string& message) :
        std::runtime_error(message),
        error_(error),
        zlibErrorCode_(0)
    {
    }

    template <typename... Args>
    ZipException(ZipError error, const char* message, Args... args) :
        std::runtime_error(Format::format(message, args...)),
        error_(error),
        zlibErrorCode_(0)
    {
    }

    ZipError error() const noexcept { return error_; }
    int zlibErrorCode() const noexcept { return zlibErrorCode_; }

private:
    ZipError error_;
    int zlibErrorCode_;
};

} // namespace ziparc
