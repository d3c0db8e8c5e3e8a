// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ListCommand.h"
#include <iomanip>
#include <ziparc/zip/ZipFile.h>

using namespace ziparc;

int ListCommand::run(char* argv[])
{
	int res = ArchiveCommand::run(argv);
	if (res != 0) return res < 0 ? 0 : res;

	ZipFile zip = openArchive();
	std::vector<EntryInfo> entries = overview(zip);

	std::ostream& out = Console::out(Console::Verbosity::QUIET);
	uint64_t totalSize = 0;
	uint64_t totalCompressed = 0;
	for (const EntryInfo& e : entries)
	{
		if (Console::verbosity() >= Console::Verbosity::NORMAL)
		{
			int day = e.modDate & 0x1f;
			int month = (e.modDate >> 5) & 0x0f;
			int year = 1980 + (e.modDate >> 9);
			out << std::setw(10) << e.uncompressedSize << "  "
				<< std::setw(10) << e.compressedSize << "  "
				<< std::left << std::setw(8) << methodName(e.method) << std::right
				<< std::setfill('0') << std::hex << std::setw(8) << e.crc32
				<< std::dec << "  " << year << '-'
				<< std::setw(2) << month << '-' << std::setw(2) << day
				<< ' ' << std::setw(2) << (e.modTime >> 11)
				<< ':' << std::setw(2) << ((e.modTime >> 5) & 0x3f)
				<< std::setfill(' ') << "  ";
		}
		out << e.name << "\n";
		totalSize += e.uncompressedSize;
		totalCompressed += e.compressedSize;
	}
	Console::out() << entries.size() << (entries.size() == 1 ? " entry, " : " entries, ")
		<< totalSize << " bytes (" << totalCompressed << " compressed)\n";
	if (!zip.trailer.comment.empty())
	{
		Console::out() << "Comment: " << zip.trailer.comment << "\n";
	}
	return 0;
}

void ListCommand::help()
{
	std::ostream& out = Console::out(Console::Verbosity::SILENT);
	out << "Usage: ziptool list <archive.zip> [options]\n\n"
		<< "Options:\n"
		<< "  --sequential           Read records front to back instead of\n"
		<< "                         starting from the central directory\n";
	generalOptions();
}
