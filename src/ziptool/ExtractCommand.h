// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <filesystem>
#include <set>
#include "ArchiveCommand.h"
#include <ziparc/zip/ZipExtractor.h>

class ExtractCommand : public ArchiveCommand
{
public:
	ExtractCommand();

	int run(char* argv[]) override;

private:
	static Option OPTIONS[];

	bool setParam(int number, std::string_view value) override;
	int setMaxEntries(std::string_view value);
	int setMaxBytes(std::string_view value);
	int setAttempts(std::string_view value);
	int setTextExtensions(std::string_view value);
	void help() override;

	bool isText(const std::string& name) const;
	void save(const std::string& name, const ziparc::ExtractionContent& content) const;
	static uint64_t parseCount(std::string_view option, std::string_view value);

	std::filesystem::path outputDir_ = ".";
	ziparc::ExtractConfig config_;
	std::set<std::string, std::less<>> textExtensions_ =
		{ "txt", "md", "csv", "json", "xml", "html", "htm" };
};
