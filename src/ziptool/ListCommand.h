// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include "ArchiveCommand.h"

class ListCommand : public ArchiveCommand
{
public:
	int run(char* argv[]) override;

private:
	void help() override;
};
