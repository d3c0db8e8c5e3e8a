// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "BasicCommand.h"

using namespace ziparc;

BasicCommand::Option BasicCommand::BASIC_OPTIONS[] =
{
	{ "h", &BasicCommand::setHelp },
	{ "help", &BasicCommand::setHelp },
	{ "s", &BasicCommand::setSilent },
	{ "silent", &BasicCommand::setSilent },
	{ "q", &BasicCommand::setQuiet },
	{ "quiet", &BasicCommand::setQuiet },
	{ "v", &BasicCommand::setVerbose },
	{ "verbose", &BasicCommand::setVerbose }
};

BasicCommand::BasicCommand()
{
	addOptions(BASIC_OPTIONS, sizeof(BASIC_OPTIONS) / sizeof(Option));
}

void BasicCommand::addOptions(const Option* options, size_t count)
{
	for (size_t i = 0; i < count; i++)
	{
		options_[options[i].name] = options[i].method;
	}
}

int BasicCommand::setOption(std::string_view name, std::string_view value)
{
	auto it = options_.find(name);
	if (it == options_.end()) return -1;
	return (this->*(it->second))(value);
}

int BasicCommand::run(char* argv[])
{
	int res = CliCommand::run(argv);
	if (res != 0)
	{
		help();
		return res;
	}
	if (showHelp_)
	{
		help();
		return -1;
	}
	return 0;
}

void BasicCommand::generalOptions()
{
	std::ostream& out = Console::out(Console::Verbosity::SILENT);
	out << "\nGeneral Options:\n"
		<< "  -s, --silent           No output\n"
		<< "  -q, --quiet            Minimal output\n"
		<< "  -v, --verbose          Detailed output\n"
		<< "  -h, --help             Show this help\n";
}
