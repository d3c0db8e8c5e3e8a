// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <vector>
#include "ArchiveCommand.h"
#include <ziparc/zip/ZipArchive.h>

class CreateCommand : public ArchiveCommand
{
public:
	CreateCommand();

	int run(char* argv[]) override;

private:
	static Option OPTIONS[];

	bool setParam(int number, std::string_view value) override;
	int setStore(std::string_view)
	{
		method_ = ziparc::CompressionMethod::STORE;
		return 0;
	}
	int setDeflate(std::string_view)
	{
		method_ = ziparc::CompressionMethod::DEFLATE;
		return 0;
	}
	int setComment(std::string_view value)
	{
		comment_ = value;
		return 1;
	}
	void help() override;

	static std::string entryNameOf(const std::string& path);

	std::vector<std::string> files_;
	std::string comment_;
	ziparc::CompressionMethod method_ = ziparc::CompressionMethod::DEFLATE;
};
