// main.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

int main(int argc, char** argv)
{
	// reads the config file too, before applying the flags on top of it.
	auto folders = args::parseCmdLineOpts(argc, argv);

	if(config::isDryRun())
		util::info("dry run: nothing will be linked or moved");

	return driver::run(folders);
}
