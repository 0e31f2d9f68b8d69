// driver_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <cassert>
#include <fstream>

#include "defs.h"
#include "arrange.h"

static void touch(const std::fs::path& path)
{
	std::fs::create_directories(path.parent_path());
	std::ofstream(path) << "x";
}

int main()
{
	zpr::println("[Test] scanning, linking and archiving");

	util::set_log_level(util::LogLevel::Warning);

	auto root = std::fs::temp_directory_path() / "arrangeinator-driver-test";
	std::fs::remove_all(root);

	auto in = root / "in" / "[Group] Show [1080p]";
	auto out = root / "library";
	auto archive = root / "archive";

	touch(in / "[Group] Show [01].mkv");
	touch(in / "[Group] Show [02].mkv");
	touch(in / "[Group] Show [01].zh-TW.ass");
	touch(in / "notes.txt");
	touch(in / "Scans" / "[Group] Show [03].mkv");
	touch(in / "SPs" / "[Group] Show [NCOP].mkv");

	// the scanner skips ignored names and folders, and records sub-folders.
	{
		auto input = driver::scanFolder(in);
		assert(input);
		assert(input->entries.size() == 4);

		size_t inSPs = 0;
		for(const auto& e : input->entries)
		{
			assert(e.folderName == "[Group] Show [1080p]");
			assert(e.extension == "mkv" || e.extension == "ass");

			if(e.relativeSubpath == std::vector<std::string> { "SPs" })
				inSPs += 1;
		}

		assert(inSPs == 1);
	}

	assert(!driver::scanFolder(root / "missing"));
	assert(!driver::scanFolder(in / "notes.txt"));

	config::setOutputFolder(out.string());
	config::setArchiveFolder(archive.string());

	// a dry run touches nothing.
	{
		config::setIsDryRun(true);
		assert(driver::run({ in.string() }) == 0);
		assert(!std::fs::exists(out));
		assert(std::fs::exists(in));

		config::setIsDryRun(false);
	}

	assert(driver::run({ in.string() }) == 0);

	auto ep1 = out / "Show" / "Season 01" / "Show S01E01.mkv";
	assert(std::fs::exists(ep1));
	assert(std::fs::exists(out / "Show" / "Season 01" / "Show S01E02.mkv"));
	assert(std::fs::exists(out / "Show" / "Season 01" / "Show S01E01.zh-TW.ass"));
	assert(std::fs::exists(out / "Show" / "extras" / "NCOP.mkv"));
	assert(std::fs::hard_link_count(ep1) == 2);

	// the source folder moved into the archive, links and all.
	assert(!std::fs::exists(in));
	assert(std::fs::exists(archive / "[Group] Show [1080p]" / "[Group] Show [01].mkv"));

	// linking the same file again is not an error.
	{
		arrange::Operation op;
		op.sourcePath = (archive / "[Group] Show [1080p]" / "[Group] Show [01].mkv").string();
		op.targetPath = "Show/Season 01/Show S01E01.mkv";

		assert(driver::executeOperation(op, out));

		// but a different file in the way is.
		op.sourcePath = (archive / "[Group] Show [1080p]" / "[Group] Show [02].mkv").string();
		assert(!driver::executeOperation(op, out));
	}

	assert(driver::run({ (root / "missing").string() }) == 1);

	// moving by copy, for an archive on another filesystem.
	{
		auto from = root / "copy-from" / "Folder";
		auto to = root / "copy-to" / "Folder";

		touch(from / "a.mkv");
		touch(from / "SPs" / "b.mkv");
		std::fs::create_directories(to.parent_path());

		assert(driver::copyFolder(from, to));
		assert(!std::fs::exists(from));
		assert(std::fs::exists(to / "a.mkv"));
		assert(std::fs::exists(to / "SPs" / "b.mkv"));

		// an existing destination is left alone.
		touch(from / "a.mkv");
		assert(!driver::copyFolder(from, to));
		assert(std::fs::exists(from / "a.mkv"));
		assert(std::fs::exists(to / "SPs" / "b.mkv"));
	}

	// an output path that isn't a folder stops the run before anything happens.
	{
		auto notFolder = root / "library-file";
		touch(notFolder);

		config::setOutputFolder(notFolder.string());
		assert(driver::run({ (archive / "[Group] Show [1080p]").string() }) == 2);
		assert(std::fs::exists(archive / "[Group] Show [1080p]"));
	}

	std::fs::remove_all(root);

	zpr::println("[PASS] scanning, linking and archiving");
	return 0;
}
