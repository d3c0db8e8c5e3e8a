// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <ziparc/util/log.h>
#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace ziparc {

namespace {

std::mutex logMutex;

double elapsedSeconds()
{
    static const auto start = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
}

void writeLine(const char* func, const char* msg, size_t len)
{
    std::lock_guard<std::mutex> lock(logMutex);
    fprintf(stderr, "[%10.4f] %-28s ", elapsedSeconds(), func);
    fwrite(msg, 1, len, stderr);
    if (len == 0 || msg[len - 1] != '\n') fputc('\n', stderr);
}

} // namespace

void writeLogLine(const char* func, const char* fmt, ...)
{
    char buf[1024];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (len < 0) return;
    writeLine(func, buf, std::min(static_cast<size_t>(len), sizeof(buf) - 1));
}

LogStream::~LogStream()
{
    std::string s = str();
    writeLine(func_, s.data(), s.size());
}

} // namespace ziparc
