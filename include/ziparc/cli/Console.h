// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#pragma once
#include <iostream>

namespace ziparc {

class Console
{
public:
    enum class Verbosity
    {
        SILENT,
        QUIET,
        NORMAL,
        VERBOSE
    };

    static Verbosity verbosity() { return verbosity_; }
    static void setVerbosity(Verbosity verbosity) { verbosity_ = verbosity; }

    /// @brief Stream for regular output, or a null stream if the
    /// verbosity is below `level`.
    static std::ostream& out(Verbosity level = Verbosity::NORMAL);
    static std::ostream& err();

private:
    static Verbosity verbosity_;
};

} // namespace ziparc
