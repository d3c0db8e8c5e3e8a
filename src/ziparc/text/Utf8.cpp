// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <ziparc/text/Utf8.h>

namespace ziparc {

namespace Utf8
{
bool isValid(const uint8_t* p, size_t len)
{
    const uint8_t* end = p + len;
    while (p < end)
    {
        uint8_t ch = *p;
        if (ch < 0x80)
        {
            p++;
            continue;
        }

        int trailing;
        uint32_t cp;
        uint32_t min;
        if ((ch & 0xE0) == 0xC0)
        {
            trailing = 1;
            cp = ch & 0x1F;
            min = 0x80;
        }
        else if ((ch & 0xF0) == 0xE0)
        {
            trailing = 2;
            cp = ch & 0x0F;
            min = 0x800;
        }
        else if ((ch & 0xF8) == 0xF0)
        {
            trailing = 3;
            cp = ch & 0x07;
            min = 0x10000;
        }
        else
        {
            return false;
        }
        if (end - p <= trailing) return false;
        for (int i = 1; i <= trailing; i++)
        {
            if ((p[i] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i] & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        p += trailing + 1;
    }
    return true;
}
}

} // namespace ziparc
