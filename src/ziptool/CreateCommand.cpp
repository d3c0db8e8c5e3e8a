// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "CreateCommand.h"
#include <filesystem>
#include <ziparc/text/Format.h>
#include <ziparc/zip/ZipWriter.h>

using namespace ziparc;

CreateCommand::Option CreateCommand::OPTIONS[] =
{
	{ "store",		OPTION_METHOD(&CreateCommand::setStore) },
	{ "deflate",	OPTION_METHOD(&CreateCommand::setDeflate) },
	{ "comment",	OPTION_METHOD(&CreateCommand::setComment) }
};

CreateCommand::CreateCommand()
{
	addOptions(OPTIONS, sizeof(OPTIONS) / sizeof(Option));
}

bool CreateCommand::setParam(int number, std::string_view value)
{
	if (number >= 2)
	{
		files_.emplace_back(value);
		return true;
	}
	return ArchiveCommand::setParam(number, value);
}

std::string CreateCommand::entryNameOf(const std::string& path)
{
	std::string name = std::filesystem::path(path).lexically_normal().generic_string();
	while (name.starts_with("../")) name.erase(0, 3);
	while (name.starts_with("/")) name.erase(0, 1);
	return name;
}

int CreateCommand::run(char* argv[])
{
	int res = ArchiveCommand::run(argv);
	if (res != 0) return res < 0 ? 0 : res;

	ZipWriter writer(method_);
	if (!comment_.empty()) writer.setComment(comment_);
	for (const std::string& file : files_)
	{
		std::string name = entryNameOf(file);
		ByteBlock content = readFile(file);
		Console::out(Console::Verbosity::VERBOSE) << "Adding " << name
			<< " (" << Format::fileSize(content.size()) << ")\n";
		writer.addRaw(std::move(name), std::move(content));
	}

	ByteBlock archive = writer.build();
	writeFile(archivePath_, archive.data(), archive.size());
	Console::out() << "Wrote " << writer.entryCount()
		<< (writer.entryCount() == 1 ? " entry" : " entries") << " to "
		<< archivePath_ << " (" << Format::fileSize(archive.size()) << ")\n";
	return 0;
}

void CreateCommand::help()
{
	std::ostream& out = Console::out(Console::Verbosity::SILENT);
	out << "Usage: ziptool create <archive.zip> <file>... [options]\n\n"
		<< "Options:\n"
		<< "  --store                Store entries uncompressed\n"
		<< "  --deflate              Deflate entries where it saves space (default)\n"
		<< "  --comment <text>       Archive comment\n";
	generalOptions();
}
