// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <unordered_map>
#include <ziparc/cli/CliCommand.h>
#include <ziparc/cli/Console.h>

#define OPTION_METHOD(m) static_cast<OptionMethodPtr>(m)

using ziparc::Console;

class BasicCommand : public ziparc::CliCommand
{
public:
	BasicCommand();

	int run(char* argv[]) override;

protected:
	using OptionMethodPtr = int (BasicCommand::*)(std::string_view);
	struct Option
	{
		std::string_view name;
		OptionMethodPtr method;
	};

	static Option BASIC_OPTIONS[];

	void addOptions(const Option* options, size_t count);
	int setOption(std::string_view name, std::string_view value) override;

	int setHelp(std::string_view)
	{
		showHelp_ = true;
		return 0;
	}

	int setSilent(std::string_view)		// NOLINT: option setter cannot be static
	{
		setVerbosity(Console::Verbosity::SILENT);
		return 0;
	}

	int setQuiet(std::string_view)		// NOLINT: option setter cannot be static
	{
		setVerbosity(Console::Verbosity::QUIET);
		return 0;
	}

	int setVerbose(std::string_view)	// NOLINT: option setter cannot be static
	{
		setVerbosity(Console::Verbosity::VERBOSE);
		return 0;
	}

	static void setVerbosity(Console::Verbosity verbosity)
	{
		Console::setVerbosity(verbosity);
	}

	virtual void help() = 0;
	static void generalOptions();

	bool showHelp_ = false;
	std::unordered_map<std::string_view,OptionMethodPtr> options_;
};
