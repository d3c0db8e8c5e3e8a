// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ZipTool.h"
#include <exception>
#include <string_view>
#include <ziparc/cli/Console.h>
#include <ziparc/zip/ZipException.h>
#include "CreateCommand.h"
#include "ExtractCommand.h"
#include "ListCommand.h"

using namespace ziparc;

int ZipTool::create(char* argv[])
{
	CreateCommand cmd;
	return cmd.run(argv);
}

int ZipTool::extract(char* argv[])
{
	ExtractCommand cmd;
	return cmd.run(argv);
}

int ZipTool::list(char* argv[])
{
	ListCommand cmd;
	return cmd.run(argv);
}

void ZipTool::help()
{
	Console::out(Console::Verbosity::SILENT)
		<< "Usage: ziptool <command> <archive.zip> [...] [options]\n\n"
		<< "Commands:\n"
		<< "  create     Build an archive from files\n"
		<< "  list       List the entries of an archive\n"
		<< "  extract    Extract the entries of an archive\n\n"
		<< "Use ziptool <command> --help for the options of each command.\n";
}

int ZipTool::run(char* argv[])
{
	struct Command
	{
		std::string_view name;
		int (*method)(char*[]);
	};

	static const Command COMMANDS[] =
	{
		{ "create", &ZipTool::create },
		{ "extract", &ZipTool::extract },
		{ "list", &ZipTool::list }
	};

	if (!argv[0] || !argv[1])
	{
		help();
		return 2;
	}
	std::string_view name = argv[1];
	for (const Command& cmd : COMMANDS)
	{
		if (cmd.name != name) continue;
		try
		{
			return cmd.method(&argv[1]);
		}
		catch (const ZipException& ex)
		{
			Console::err() << "Error: " << ex.what()
				<< " (" << errorName(ex.error()) << ")\n";
			return 1;
		}
		catch (const std::exception& ex)
		{
			Console::err() << "Error: " << ex.what() << "\n";
			return 1;
		}
	}
	if (name == "-h" || name == "--help" || name == "help")
	{
		help();
		return 0;
	}
	Console::err() << "Unknown command: " << name << "\n";
	help();
	return 2;
}
