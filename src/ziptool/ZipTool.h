// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once

class ZipTool
{
public:
	int run(char* argv[]);

private:
	static int create(char* argv[]);
	static int extract(char* argv[]);
	static int list(char* argv[]);
	static void help();
};
