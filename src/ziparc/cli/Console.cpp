// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <ziparc/cli/Console.h>
#include <streambuf>

namespace ziparc {

namespace {

class NullBuffer : public std::streambuf
{
protected:
    int overflow(int ch) override { return ch; }
};

NullBuffer nullBuffer;
std::ostream nullStream(&nullBuffer);

} // namespace

Console::Verbosity Console::verbosity_ = Console::Verbosity::NORMAL;

std::ostream& Console::out(Verbosity level)
{
    return verbosity_ >= level ? std::cout : nullStream;
}

std::ostream& Console::err()
{
    return verbosity_ > Verbosity::SILENT ? std::cerr : nullStream;
}

} // namespace ziparc
