// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once

#include <sstream>

// LOG("fmt", ...) and LOGS << ... write a timestamped line (tagged with the
// calling function) to stderr. Both compile to nothing unless
// ZIPARC_ENABLE_LOG is defined.

namespace ziparc {

void writeLogLine(const char* func, const char* fmt, ...);

class LogStream : public std::ostringstream
{
public:
    explicit LogStream(const char* func) : func_(func) {}
    ~LogStream() override;

private:
    const char* func_;
};

} // namespace ziparc

#ifdef ZIPARC_ENABLE_LOG
#define LOG(...) ziparc::writeLogLine(__func__, __VA_ARGS__)
#define LOGS ziparc::LogStream(__func__)
#else
#define LOG(...) do {} while(0)
#define LOGS if (true) {} else ziparc::LogStream(__func__)
#endif
