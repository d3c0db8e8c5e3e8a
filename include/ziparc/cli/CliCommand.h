// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <string_view>

namespace ziparc {

///
/// @brief Base for a command that takes positional parameters and
/// options (`-x`, `--name`, `--name=value` or `--name value`).
///
/// Parameter 0 is the command name itself.
///
class CliCommand
{
public:
    virtual ~CliCommand() = default;

    /// @brief Parses the arguments.
    /// @return 0 if all were accepted, 2 on a usage error
    virtual int run(char* argv[]);

protected:
    /// @return false if the parameter is not accepted
    virtual bool setParam(int number, std::string_view value)
    {
        return false;
    }

    /// @return the number of values consumed (0 or 1), or -1 if the
    ///   option is unknown
    virtual int setOption(std::string_view name, std::string_view value)
    {
        return -1;
    }
};

} // namespace ziparc
