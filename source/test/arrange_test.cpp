// arrange_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <cassert>

#include "defs.h"
#include "arrange.h"

using namespace arrange;

static RawEntry entry(const std::string& folder, const std::string& file, std::vector<std::string> subpath = { })
{
	RawEntry e;
	e.folderName = folder;
	e.fileName = file;
	e.relativeSubpath = std::move(subpath);

	if(auto i = file.rfind('.'); i != std::string::npos)
		e.extension = file.substr(i + 1);

	return e;
}

static std::string targetOf(const Arranger& arr, const RawEntry& e)
{
	std::vector<Warning> warnings;
	return buildTargetPath(arr.compose(e, arr.resolveFolder(e.folderName), warnings));
}

static void testTitles()
{
	zpr::println("[Test] title resolution");

	auto arr = Arranger();

	{
		auto info = arr.resolveFolder("[Group] Show [1080p]");
		assert(info.title == "Show");
		assert((info.groups == std::vector<std::string> { "Group" }));
		assert((info.formats == std::vector<std::string> { "1080p" }));
		assert(!info.season);
	}

	{
		auto info = arr.resolveFolder("[GroupA&GroupB] Some Show Season 2 [01-12][BDRip 1080p HEVC]");
		assert(info.title == "Some Show");
		assert(info.groups.size() == 2 && info.groups[1] == "GroupB");
		assert(info.season == 2);
		assert(info.episodeRange == "01-12");
	}

	// nothing outside the brackets.
	assert(arr.resolveFolder("[Group][Show][01-12][1080p]").title == "Show");

	// title words that look like language tags stay in the title.
	assert(arr.resolveFolder("[Group] Enen no Shouboutai [1080p]").title == "Enen no Shouboutai");
	assert(arr.resolveFolder("[Group] He-Man [1080p]").title == "He-Man");

	// the last-resort title leaves format tags out.
	assert(arr.resolveFolder("[Group] [1080p]").title == "Group");

	// resolving a resolved title changes nothing.
	for(auto name : { "[Group] Show [1080p]", "Dr. Stone", "[Group] Show 2nd Season [BDRip]", "Show", "【字幕组】番组名" })
	{
		auto once = arr.resolveFolder(name).title;
		assert(!once.empty());
		assert(arr.resolveFolder(once).title == once);
	}

	{
		auto opts = Options();
		opts.titleOverride = "Another Name";

		auto over = Arranger(Vocabulary::defaults(), opts);
		assert(over.resolveFolder("[Group] Show [1080p]").title == "Another Name");
	}

	zpr::println("[PASS] title resolution");
}

static void testTargets()
{
	zpr::println("[Test] target paths");

	auto arr = Arranger();

	assert(targetOf(arr, entry("Show", "[Group] Show [05] [1080p].mkv")) == "Show/Season 01/Show S01E05.mkv");
	assert(targetOf(arr, entry("Show", "[Group] Show [01].mkv")) == "Show/Season 01/Show S01E01.mkv");
	assert(targetOf(arr, entry("Show", "[Group] Show [23].mkv")) == "Show/Season 01/Show S01E23.mkv");
	assert(targetOf(arr, entry("Show", "[Group] Show 第08話 [1080p].mkv")) == "Show/Season 01/Show S01E08.mkv");
	assert(targetOf(arr, entry("Show", "[Group] Show 第12話.mkv")) == "Show/Season 01/Show S01E12.mkv");

	// the file name outranks the folder name.
	assert(targetOf(arr, entry("Show Season 3", "Show S02E23.mkv")) == "Show/Season 02/Show S02E23.mkv");
	assert(targetOf(arr, entry("Show Season 3", "[Group] Show [04].mkv")) == "Show/Season 03/Show S03E04.mkv");

	// and a sub-folder outranks the top folder.
	assert(targetOf(arr, entry("Show", "[Group] Show [04].mkv", { "Season 2" })) == "Show/Season 02/Show S02E04.mkv");

	assert(targetOf(arr, entry("Series", "[Group] Series [NCED1].mkv")) == "Series/extras/NCED1.mkv");
	assert(targetOf(arr, entry("Series", "[Group] Series [PV&CM].mkv")) == "Series/extras/PV&CM.mkv");
	assert(targetOf(arr, entry("Series", "[Group] Series [NCOP1&2].mkv")) == "Series/extras/NCOP1&2.mkv");
	assert(targetOf(arr, entry("Series", "[Group] Series - NCED1.mkv")) == "Series/extras/NCED1.mkv");
	assert(targetOf(arr, entry("Series", "[Group] Series - PV&CM.mkv")) == "Series/extras/PV&CM.mkv");
	assert(targetOf(arr, entry("Series", "[Group] Series - CM1&2&3.mkv")) == "Series/extras/CM1&2&3.mkv");

	assert(targetOf(arr, entry("[Group] Enen no Shouboutai [1080p]", "[Group] Enen no Shouboutai [01].mkv"))
		== "Enen no Shouboutai/Season 01/Enen no Shouboutai S01E01.mkv");

	assert(targetOf(arr, entry("[Group] He-Man [1080p]", "[Group] He-Man [01].mkv")) == "He-Man/Season 01/He-Man S01E01.mkv");
	assert(targetOf(arr, entry("Show", "Show S01E01.zh-TW.ass")) == "Show/Season 01/Show S01E01.zh-TW.ass");

	assert(targetOf(arr, entry("Show", "[Group] Show [01].zh-TW.ass")) == "Show/Season 01/Show S01E01.zh-TW.ass");
	assert(targetOf(arr, entry("Show", "[Group] Show [01][JPTC].chs.ass")) == "Show/Season 01/Show S01E01.JPTC.chs.ass");

	// three-digit episodes aren't truncated.
	assert(targetOf(arr, entry("Show", "Show - 105.mkv")) == "Show/Season 01/Show S01E105.mkv");

	{
		auto opts = Options();
		opts.seasonOverride = 4;

		auto over = Arranger(Vocabulary::defaults(), opts);
		assert(targetOf(over, entry("Show", "Show S02E23.mkv")) == "Show/Season 04/Show S04E23.mkv");
	}

	zpr::println("[PASS] target paths");
}

static void testExtras()
{
	zpr::println("[Test] extras and warnings");

	auto arr = Arranger();
	auto folder = arr.resolveFolder("Show");

	{
		std::vector<Warning> warnings;
		auto meta = arr.compose(entry("Show", "[Group] Show [NCOP1&2].mkv"), folder, warnings);

		assert(meta.isSpecial && !meta.episode);
		assert(meta.specialTag->kind == SpecialKind::NCOP);
		assert(meta.specialTag->index == 1);
		assert(meta.specialTag->compoundWith.size() == 1);
		assert(meta.specialTag->compoundWith[0].index == 2);
		assert(warnings.empty());
	}

	{
		std::vector<Warning> warnings;
		auto meta = arr.compose(entry("Show", "[Group] Show [NCOP&Preview].mkv"), folder, warnings);

		assert(meta.isSpecial);
		assert(warnings.size() == 1);
		assert(warnings[0].kind == WarningKind::MalformedCompoundTag);
	}

	// no number anywhere: still kept, as an extra.
	{
		std::vector<Warning> warnings;
		auto meta = arr.compose(entry("Show", "Show Credits.mkv"), folder, warnings);

		assert(buildTargetPath(meta) == "Show/extras/Credits.mkv");
		assert(warnings.size() == 1);
		assert(warnings[0].kind == WarningKind::UnrecognizedPattern);
	}

	// anything under a special sub-folder is an extra, quietly.
	{
		std::vector<Warning> warnings;
		auto meta = arr.compose(entry("Show", "[Group] Show [Making of].mkv", { "SPs" }), folder, warnings);

		assert(buildTargetPath(meta) == "Show/extras/Making of.mkv");
		assert(warnings.empty());
	}

	// a numbered file in a special sub-folder keeps its number as the label.
	{
		std::vector<Warning> warnings;
		auto meta = arr.compose(entry("Show", "[Group] Show [01].mkv", { "SPs" }), folder, warnings);

		assert(buildTargetPath(meta) == "Show/extras/01.mkv");
		assert(warnings.empty());
	}

	zpr::println("[PASS] extras and warnings");
}

static void testPlan()
{
	zpr::println("[Test] planning");

	auto arr = Arranger();

	FolderInput show;
	show.path = "/downloads/[Group] Show [1080p]";
	show.entries = {
		entry("[Group] Show [1080p]", "[Group] Show [01].mkv"),
		entry("[Group] Show [1080p]", "[Group] Show [01v2].mkv"),
		entry("[Group] Show [1080p]", "[Group] Show [02].mkv"),
	};

	FolderInput empty;
	empty.path = "/downloads/Nothing/";

	auto plan = arr.plan({ show, empty });

	assert(plan.folders.size() == 2);
	assert(plan.operations.size() == 3);
	assert(plan.folders[0].name == "[Group] Show [1080p]");
	assert(plan.folders[1].name == "Nothing");

	// both sides of a collision are skipped and reported.
	assert(plan.operations[0].kind == OperationKind::SkipDuplicate);
	assert(plan.operations[1].kind == OperationKind::SkipDuplicate);
	assert(plan.operations[2].kind == OperationKind::Hardlink);
	assert(plan.operations[2].targetPath == "Show/Season 01/Show S01E02.mkv");
	assert(plan.operations[2].sourcePath == "/downloads/[Group] Show [1080p]/[Group] Show [02].mkv");

	size_t dupes = 0;
	size_t empties = 0;
	for(const auto& w : plan.warnings)
	{
		if(w.kind == WarningKind::DuplicateTarget)
		{
			assert(w.folder == 0);
			dupes += 1;
		}
		else if(w.kind == WarningKind::EmptyFolder)
		{
			assert(w.folder == 1);
			empties += 1;
		}
	}

	assert(dupes == 2);
	assert(empties == 1);

	assert(plan.folders[0].failed);
	assert(plan.folders[1].failed);

	// same input, same plan.
	auto again = arr.plan({ show, empty });
	assert(again.operations.size() == plan.operations.size());
	for(size_t i = 0; i < plan.operations.size(); i++)
	{
		assert(again.operations[i].targetPath == plan.operations[i].targetPath);
		assert(again.operations[i].kind == plan.operations[i].kind);
	}

	// two releases of the same show collide across folders.
	{
		FolderInput a;
		a.path = "/downloads/[GroupA] Show [1080p]";
		a.entries = { entry("[GroupA] Show [1080p]", "[GroupA] Show [01].mkv") };

		FolderInput b;
		b.path = "/downloads/[GroupB] Show [720p]";
		b.entries = {
			entry("[GroupB] Show [720p]", "[GroupB] Show [01].mkv"),
			entry("[GroupB] Show [720p]", "[GroupB] Show [02].mkv"),
		};

		auto both = arr.plan({ a, b });
		assert(both.operations.size() == 3);

		assert(both.operations[0].kind == OperationKind::SkipDuplicate);
		assert(both.operations[1].kind == OperationKind::SkipDuplicate);
		assert(both.operations[2].kind == OperationKind::Hardlink);

		assert(both.folders[0].failed);
		assert(both.folders[1].failed);

		std::vector<size_t> warned;
		for(const auto& w : both.warnings)
		{
			assert(w.kind == WarningKind::DuplicateTarget);
			warned.push_back(w.folder);
		}

		std::sort(warned.begin(), warned.end());
		assert((warned == std::vector<size_t> { 0, 1 }));
	}

	zpr::println("[PASS] planning");
}

int main()
{
	testTitles();
	testTargets();
	testExtras();
	testPlan();

	return 0;
}
