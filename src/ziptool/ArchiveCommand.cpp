// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ArchiveCommand.h"
#include <fstream>
#include <stdexcept>
#include <ziparc/util/log.h>
#include <ziparc/zip/ZipDecoder.h>

using namespace ziparc;

ArchiveCommand::Option ArchiveCommand::ARCHIVE_OPTIONS[] =
{
	{ "sequential",	OPTION_METHOD(&ArchiveCommand::setSequential) }
};

ArchiveCommand::ArchiveCommand()
{
	addOptions(ARCHIVE_OPTIONS, sizeof(ARCHIVE_OPTIONS) / sizeof(Option));
}

bool ArchiveCommand::setParam(int number, std::string_view value)
{
	if (number == 0) return true;		// command name
	if (number == 1)
	{
		archivePath_ = value;
		return true;
	}
	return false;
}

int ArchiveCommand::run(char* argv[])
{
	int res = BasicCommand::run(argv);
	if (res != 0) return res;
	if (archivePath_.empty())
	{
		Console::err() << "Expected name of archive\n";
		help();
		return 2;
	}
	return 0;
}

ZipFile ArchiveCommand::openArchive() const
{
	ByteBlock data = readFile(archivePath_);
	LOGS << "Read " << data.size() << " bytes from " << archivePath_;
	if (sequential_)
	{
		return SequentialZipDecoder().decode(data);
	}
	return AnchoredZipDecoder().decode(data);
}

ByteBlock ArchiveCommand::readFile(const std::string& path)
{
	std::ifstream in(path, std::ios::binary | std::ios::ate);
	if (!in)
	{
		throw std::runtime_error("Failed to open " + path);
	}
	std::streamsize size = in.tellg();
	in.seekg(0);
	ByteBlock block(static_cast<size_t>(size));
	if (!in.read(reinterpret_cast<char*>(block.data()), size))
	{
		throw std::runtime_error("Failed to read " + path);
	}
	return block;
}

void ArchiveCommand::writeFile(const std::string& path, const uint8_t* data, size_t size)
{
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out)
	{
		throw std::runtime_error("Failed to create " + path);
	}
	out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
	if (!out)
	{
		throw std::runtime_error("Failed to write " + path);
	}
}
