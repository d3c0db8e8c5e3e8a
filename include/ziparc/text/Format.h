// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstdint>
#include <string>

namespace ziparc {

namespace Format
{
/// @brief printf-style formatting into a std::string.
std::string format(const char* fmt, ...);

/// @brief Renders a byte count as "812 bytes", "4.2 KB", "17.0 MB" etc.
std::string fileSize(uint64_t bytes);
}

} // namespace ziparc
