// paths.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <map>

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	std::string specialName(const SpecialTag& tag)
	{
		if(!tag.label.empty())
			return tag.label;

		auto name = SpecialClassifier::kindName(tag.kind);
		if(tag.index)
			name += std::to_string(*tag.index);

		return name;
	}

	std::string buildTargetPath(const SeriesMetadata& meta)
	{
		auto title = util::sanitiseFilename(meta.title);

		std::string suffix;
		for(const auto& lang : meta.languageTags)
			suffix += "." + util::sanitiseFilename(lang.raw);

		if(!meta.extension.empty())
			suffix += "." + meta.extension;

		if(meta.isSpecial || !meta.episode)
		{
			auto name = meta.specialTag ? specialName(*meta.specialTag) : SpecialClassifier::kindName(SpecialKind::OTHER);
			return zpr::sprint("%s/extras/%s%s", title, util::sanitiseFilename(name), suffix);
		}

		// %02d pads, but never truncates episode 100 and up.
		return zpr::sprint("%s/Season %02d/%s S%02dE%02d%s", title, meta.season, title, meta.season, *meta.episode, suffix);
	}

	std::vector<Warning> detectCollisions(std::vector<Operation>& operations)
	{
		std::map<std::string, std::vector<size_t>> targets;
		for(size_t i = 0; i < operations.size(); i++)
		{
			if(operations[i].kind == OperationKind::Hardlink)
				targets[operations[i].targetPath].push_back(i);
		}

		std::vector<Warning> warnings;
		for(const auto& [ target, indices ] : targets)
		{
			if(indices.size() < 2)
				continue;

			for(auto i : indices)
			{
				std::vector<std::string> others;
				for(auto k : indices)
				{
					if(k != i)
						others.push_back(operations[k].sourcePath);
				}

				operations[i].kind = OperationKind::SkipDuplicate;
				warnings.push_back(Warning {
					WarningKind::DuplicateTarget, operations[i].folder, operations[i].sourcePath,
					zpr::sprint("target '%s' is also produced by %s", target, util::join(others, ", "))
				});
			}
		}

		return warnings;
	}

	std::string warningKindName(WarningKind kind)
	{
		switch(kind)
		{
			case WarningKind::UnrecognizedPattern:      return "UnrecognizedPattern";
			case WarningKind::DuplicateTarget:          return "DuplicateTarget";
			case WarningKind::MalformedCompoundTag:     return "MalformedCompoundTag";
			case WarningKind::EmptyFolder:              return "EmptyFolder";
		}

		return "";
	}
}
