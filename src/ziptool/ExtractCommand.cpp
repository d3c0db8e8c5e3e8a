// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ExtractCommand.h"
#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <ziparc/text/Format.h>

using namespace ziparc;

ExtractCommand::Option ExtractCommand::OPTIONS[] =
{
	{ "max-entries",	OPTION_METHOD(&ExtractCommand::setMaxEntries) },
	{ "max-bytes",		OPTION_METHOD(&ExtractCommand::setMaxBytes) },
	{ "attempts",		OPTION_METHOD(&ExtractCommand::setAttempts) },
	{ "text",			OPTION_METHOD(&ExtractCommand::setTextExtensions) }
};

ExtractCommand::ExtractCommand()
{
	addOptions(OPTIONS, sizeof(OPTIONS) / sizeof(Option));
	config_.classifyAsText = [this](const std::string& name) { return isText(name); };
}

bool ExtractCommand::setParam(int number, std::string_view value)
{
	if (number == 2)
	{
		outputDir_ = std::filesystem::path(value);
		return true;
	}
	return ArchiveCommand::setParam(number, value);
}

uint64_t ExtractCommand::parseCount(std::string_view option, std::string_view value)
{
	uint64_t n = 0;
	auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
	if (value.empty() || ec != std::errc() || end != value.data() + value.size() || n == 0)
	{
		throw std::invalid_argument(Format::format(
			"--%.*s: expected a positive number instead of \"%.*s\"",
			static_cast<int>(option.size()), option.data(),
			static_cast<int>(value.size()), value.data()));
	}
	return n;
}

int ExtractCommand::setMaxEntries(std::string_view value)
{
	config_.maxEntriesPerStep = static_cast<int>(
		std::min<uint64_t>(parseCount("max-entries", value), 1 << 30));
	return 1;
}

int ExtractCommand::setMaxBytes(std::string_view value)
{
	config_.maxBytesPerStep = parseCount("max-bytes", value);
	return 1;
}

int ExtractCommand::setAttempts(std::string_view value)
{
	config_.maxAttempts = static_cast<int>(
		std::min<uint64_t>(parseCount("attempts", value), 1 << 30));
	return 1;
}

int ExtractCommand::setTextExtensions(std::string_view value)
{
	textExtensions_.clear();
	while (!value.empty())
	{
		size_t comma = value.find(',');
		std::string_view ext = value.substr(0, comma);
		if (!ext.empty()) textExtensions_.emplace(ext);
		if (comma == std::string_view::npos) break;
		value.remove_prefix(comma + 1);
	}
	return 1;
}

bool ExtractCommand::isText(const std::string& name) const
{
	size_t dot = name.rfind('.');
	if (dot == std::string::npos || name.find('/', dot) != std::string::npos) return false;
	return textExtensions_.contains(std::string_view(name).substr(dot + 1));
}

void ExtractCommand::save(const std::string& name, const ExtractionContent& content) const
{
	std::filesystem::path relative = std::filesystem::path(name).lexically_normal();
	if (relative.is_absolute() || relative.empty() ||
		*relative.begin() == "..")
	{
		Console::err() << "Skipping " << name << ": path leaves output directory\n";
		return;
	}
	std::filesystem::path path = outputDir_ / relative;
	if (name.ends_with('/'))
	{
		std::filesystem::create_directories(path);
		return;
	}
	if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

	if (const TextContent* text = std::get_if<TextContent>(&content))
	{
		writeFile(path.string(), reinterpret_cast<const uint8_t*>(text->text.data()),
			text->text.size());
		return;
	}
	if (const FailedContent* failed = std::get_if<FailedContent>(&content))
	{
		Console::err() << "Warning: " << name << ": " << errorName(failed->reason)
			<< ", saved as-is\n";
		writeFile(path.string(), failed->bytes.data(), failed->bytes.size());
		return;
	}
	const BinaryContent& binary = std::get<BinaryContent>(content);
	writeFile(path.string(), binary.bytes.data(), binary.bytes.size());
}

int ExtractCommand::run(char* argv[])
{
	int res = ArchiveCommand::run(argv);
	if (res != 0) return res < 0 ? 0 : res;

	ZipExtractor extractor(config_);
	ZipFile zip = openArchive();
	int steps = 0;
	for (;;)
	{
		ExtractStep next = extractor.step(std::move(zip));
		steps++;
		if (ExtractDone* done = std::get_if<ExtractDone>(&next))
		{
			const ExtractionResult& result = done->result;
			for (const auto& [name, content] : result.contents)
			{
				Console::out(Console::Verbosity::VERBOSE) << "  " << name << "\n";
				save(name, content);
			}
			for (const auto& [name, rejected] : result.rejected)
			{
				Console::err() << "Skipped " << name << ": "
					<< rejected.message << "\n";
			}
			Console::out() << "Extracted " << result.contents.size()
				<< (result.contents.size() == 1 ? " entry" : " entries")
				<< " in " << steps << (steps == 1 ? " step" : " steps");
			if (!result.rejected.empty())
			{
				Console::out() << ", skipped " << result.rejected.size();
			}
			Console::out() << "\n";
			return result.rejected.empty() ? 0 : 1;
		}
		zip = std::move(std::get<ExtractLoop>(next).zip);
		ZipProgress p = progress(zip);
		Console::out(Console::Verbosity::VERBOSE) << "Step " << steps << ": "
			<< p.uncompressedCount << " of " << p.total << " extracted, "
			<< p.possiblyCompressedCount << " pending\n";
	}
}

void ExtractCommand::help()
{
	std::ostream& out = Console::out(Console::Verbosity::SILENT);
	out << "Usage: ziptool extract <archive.zip> [<dir>] [options]\n\n"
		<< "Options:\n"
		<< "  --max-entries <n>      Entries to inflate per step (default 16)\n"
		<< "  --max-bytes <n>        Compressed bytes to inflate per step\n"
		<< "  --attempts <n>         Failed attempts before an entry is skipped\n"
		<< "                         (default 3)\n"
		<< "  --text <ext,...>       Extensions of entries to check as UTF-8 text\n"
		<< "  --sequential           Read records front to back\n";
	generalOptions();
}
