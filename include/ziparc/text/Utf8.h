// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <cstddef>
#include <cstdint>

namespace ziparc {

namespace Utf8
{
/// @brief Checks whether the bytes form well-formed UTF-8
/// (no overlong forms, no surrogates, nothing above U+10FFFF).
bool isValid(const uint8_t* p, size_t len);
}

} // namespace ziparc
