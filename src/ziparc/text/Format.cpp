// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <ziparc/text/Format.h>
#include <cstdarg>
#include <cstdint>
#include <cstdio>

namespace ziparc {

namespace Format
{
std::string format(const char* fmt, ...)
{
    char buf[256];
    va_list args;
    va_start(args, fmt);
    va_list argsCopy;
    va_copy(argsCopy, args);
    int len = vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (len < 0)
    {
        va_end(argsCopy);
        return fmt;
    }
    if (static_cast<size_t>(len) < sizeof(buf))
    {
        va_end(argsCopy);
        return std::string(buf, len);
    }
    std::string s(len, '\0');
    vsnprintf(s.data(), len + 1, fmt, argsCopy);
    va_end(argsCopy);
    return s;
}

std::string fileSize(uint64_t bytes)
{
    static const char* UNITS[] = { "KB", "MB", "GB", "TB" };
    if (bytes < 1024)
    {
        return format("%llu %s", static_cast<unsigned long long>(bytes),
            bytes == 1 ? "byte" : "bytes");
    }
    double size = static_cast<double>(bytes) / 1024;
    int unit = 0;
    while (size >= 1024 && unit < 3)
    {
        size /= 1024;
        unit++;
    }
    return format("%.1f %s", size, UNITS[unit]);
}
}

} // namespace ziparc
