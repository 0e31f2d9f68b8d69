// plan.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	Vocabulary Vocabulary::defaults()
	{
		Vocabulary vocab;
		vocab.languages = LanguageTable::defaults();
		vocab.specials = SpecialVocabulary::defaults();
		vocab.formats = FormatTable::defaults();

		vocab.specialFolders = {
			"SPs", "SP", "Specials", "Special", "Extras", "Extra", "Bonus", "映像特典", "特典", "OVA", "OAD"
		};

		vocab.subtitleExtensions = { "ass", "ssa", "srt", "vtt", "sub", "sup", "idx" };
		return vocab;
	}

	Arranger::Arranger(Vocabulary vocab, Options options) : vocab(std::move(vocab)), options(std::move(options)),
		languages(this->vocab.languages), specials(this->vocab.specials), episodes()
	{
	}

	static std::string folderNameOf(const std::string& path)
	{
		auto p = std::fs::path(path);

		// "Show/" has an empty filename.
		if(p.filename().empty())
			p = p.parent_path();

		return p.filename().string();
	}

	Plan Arranger::plan(const std::vector<FolderInput>& folders) const
	{
		Plan plan;

		for(size_t fi = 0; fi < folders.size(); fi++)
		{
			const auto& input = folders[fi];

			FolderPlan fp;
			fp.path = input.path;
			fp.name = folderNameOf(input.path);

			if(input.entries.empty())
			{
				fp.failed = true;
				plan.warnings.push_back(Warning {
					WarningKind::EmptyFolder, fi, input.path, "folder contains no files to arrange"
				});

				plan.folders.push_back(fp);
				continue;
			}

			// once per folder, so every file of a series agrees on its title.
			fp.info = resolveFolder(fp.name);

			for(const auto& entry : input.entries)
			{
				auto firstWarning = plan.warnings.size();

				Operation op;
				op.folder = fi;
				op.meta = compose(entry, fp.info, plan.warnings);
				op.targetPath = buildTargetPath(op.meta);

				auto source = std::fs::path(input.path);
				for(const auto& dir : entry.relativeSubpath)
					source /= dir;

				op.sourcePath = (source / entry.fileName).string();

				for(size_t w = firstWarning; w < plan.warnings.size(); w++)
					plan.warnings[w].folder = fi;

				fp.operations.push_back(plan.operations.size());
				plan.operations.push_back(op);
			}

			plan.folders.push_back(fp);
		}

		// one collision set for the whole run; folders can share a destination.
		auto dupes = detectCollisions(plan.operations);
		for(const auto& w : dupes)
			plan.folders[w.folder].failed = true;

		plan.warnings.insert(plan.warnings.end(), dupes.begin(), dupes.end());
		return plan;
	}
}
