// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: LGPL-3.0-only

#include <ziparc/cli/CliCommand.h>
#include <ziparc/cli/Console.h>

namespace ziparc {

int CliCommand::run(char* argv[])
{
    int paramCount = 0;
    for (int i = 0; argv[i]; i++)
    {
        std::string_view arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-')
        {
            if (!setParam(paramCount, arg))
            {
                Console::err() << "Unexpected argument: " << arg << "\n";
                return 2;
            }
            paramCount++;
            continue;
        }

        std::string_view name = arg.substr(arg[1] == '-' ? 2 : 1);
        size_t eq = name.find('=');
        if (eq != std::string_view::npos)
        {
            if (setOption(name.substr(0, eq), name.substr(eq + 1)) < 0)
            {
                Console::err() << "Unknown option: " << arg << "\n";
                return 2;
            }
            continue;
        }

        std::string_view next;
        if (argv[i + 1] && argv[i + 1][0] != '-') next = argv[i + 1];
        int consumed = setOption(name, next);
        if (consumed < 0)
        {
            Console::err() << "Unknown option: " << arg << "\n";
            return 2;
        }
        if (consumed > 0 && !next.empty()) i++;
    }
    return 0;
}

} // namespace ziparc
