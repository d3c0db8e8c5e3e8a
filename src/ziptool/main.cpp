// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#include "ZipTool.h"

int main(int argc, char* argv[])
{
	ZipTool app;
	return app.run(argv);
}
