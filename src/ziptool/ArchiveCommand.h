// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include "BasicCommand.h"
#include <ziparc/alloc/Block.h>
#include <ziparc/zip/ZipFile.h>

class ArchiveCommand : public BasicCommand
{
public:
	ArchiveCommand();

	int run(char* argv[]) override;

protected:
	static Option ARCHIVE_OPTIONS[];

	bool setParam(int number, std::string_view value) override;
	int setSequential(std::string_view)
	{
		sequential_ = true;
		return 0;
	}

	/// @brief Reads and decodes the archive named on the command line.
	/// @throws ZipException if it cannot be decoded
	ziparc::ZipFile openArchive() const;

	static ziparc::ByteBlock readFile(const std::string& path);
	static void writeFile(const std::string& path, const uint8_t* data, size_t size);

	std::string archivePath_;
	bool sequential_ = false;
};
