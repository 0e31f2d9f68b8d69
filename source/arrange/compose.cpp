// compose.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	bool Arranger::isSubtitle(const std::string& extension) const
	{
		return util::containsIgnoreCase(vocab.subtitleExtensions, extension);
	}

	bool Arranger::isSpecialFolder(const std::string& name) const
	{
		return util::containsIgnoreCase(vocab.specialFolders, name);
	}

	Arranger::FileAnalysis Arranger::analyseFile(const RawEntry& entry) const
	{
		FileAnalysis ret;
		ret.tokens = tokenise(fileStem(entry), Field::File);

		if(!ret.tokens.empty() && isGroupTag(ret.tokens[0]))
			ret.consumed.push_back(ret.tokens[0].position);

		ret.languages = languages.extract(ret.tokens, isSubtitle(entry.extension), ret.consumed);
		ret.special = specials.extract(ret.tokens, ret.consumed);

		ret.inSpecialFolder = std::any_of(entry.relativeSubpath.begin(), entry.relativeSubpath.end(),
			[this](const std::string& dir) -> bool {
				return isSpecialFolder(dir);
			});

		return ret;
	}

	EpisodeRecord Arranger::resolveEpisode(const FileAnalysis& analysis, const RawEntry& entry, const FolderInfo& folder) const
	{
		EpisodeRecord rec;

		// later sources win: the folder, then sub-folders (innermost last), then the file name.
		if(folder.season)
		{
			rec.season = folder.season;
			rec.confidence = Confidence::Foldername;
		}

		for(const auto& dir : entry.relativeSubpath)
		{
			if(auto s = episodes.matchSeason(tokenise(dir, Field::Folder)); s && s->season)
			{
				rec.season = s->season;
				rec.confidence = Confidence::Foldername;
			}
		}

		// special content is never numbered as an episode.
		if(analysis.special || analysis.inSpecialFolder)
			return rec;

		std::vector<Token> residual;
		for(const auto& tok : analysis.tokens)
		{
			if(std::find(analysis.consumed.begin(), analysis.consumed.end(), tok.position) == analysis.consumed.end())
				residual.push_back(tok);
		}

		if(auto x = episodes.matchEpisode(residual); x && x->episode)
		{
			rec.episode = x->episode;
			if(x->season)
				rec.season = x->season;

			rec.confidence = Confidence::Filename;
		}

		return rec;
	}

	EpisodeRecord Arranger::extractEpisode(const RawEntry& entry, const FolderInfo& folder) const
	{
		return resolveEpisode(analyseFile(entry), entry, folder);
	}

	std::string Arranger::otherLabel(const FileAnalysis& analysis, const RawEntry& entry, const FolderInfo& folder) const
	{
		auto isConsumed = [&analysis](size_t pos) -> bool {
			return std::find(analysis.consumed.begin(), analysis.consumed.end(), pos) != analysis.consumed.end();
		};

		// releases usually name the extra in the first bracket after the group: "[Group] Show [Menu1][1080p]".
		for(const auto& tok : analysis.tokens)
		{
			if(isConsumed(tok.position) || !tok.bracketed)
				continue;

			if(util::isDigits(tok.text) || isEpisodeRange(tok.text) || vocab.formats.isFormat(tok.text))
				continue;

			return tok.text;
		}

		std::vector<std::string> words;
		for(const auto& tok : analysis.tokens)
		{
			if(isConsumed(tok.position) || tok.bracketed || vocab.formats.isFormat(tok.text))
				continue;

			words.push_back(tok.text);
		}

		auto rest = util::join(words, " ");
		if(!folder.title.empty() && rest.size() >= folder.title.size()
			&& util::equalsIgnoreCase(rest.substr(0, folder.title.size()), folder.title))
		{
			rest = util::trim(rest.substr(folder.title.size()));
		}

		if(!rest.empty())
			return rest;

		// "SPs/[Group] Show [01].mkv" is extra number 01.
		for(const auto& tok : analysis.tokens)
		{
			if(!isConsumed(tok.position) && tok.bracketed && util::isDigits(tok.text))
				return tok.text;
		}

		return fileStem(entry);
	}

	SeriesMetadata Arranger::compose(const RawEntry& entry, const FolderInfo& folder, std::vector<Warning>& warnings) const
	{
		auto analysis = analyseFile(entry);
		auto record = resolveEpisode(analysis, entry, folder);

		auto source = entry.relativeSubpath.empty() ? entry.fileName
			: zpr::sprint("%s/%s", util::join(entry.relativeSubpath, "/"), entry.fileName);

		SeriesMetadata meta;
		meta.title = folder.title;
		meta.extension = entry.extension;
		meta.season = record.season.value_or(1);

		if(options.seasonOverride >= 0)
			meta.season = options.seasonOverride;

		if(analysis.special)
		{
			meta.isSpecial = true;
			meta.specialTag = SpecialClassifier::combine(analysis.special->members);

			if(analysis.special->malformed)
			{
				warnings.push_back(Warning {
					WarningKind::MalformedCompoundTag, 0, source,
					zpr::sprint("compound tag '%s' has segments with no kind; classified as OTHER",
						analysis.tokens[analysis.special->position].text)
				});
			}
		}
		else if(analysis.inSpecialFolder || !record.episode)
		{
			SpecialTag tag;
			tag.kind = SpecialKind::OTHER;
			tag.label = otherLabel(analysis, entry, folder);

			meta.isSpecial = true;
			meta.specialTag = tag;

			if(!analysis.inSpecialFolder)
			{
				warnings.push_back(Warning {
					WarningKind::UnrecognizedPattern, 0, source,
					zpr::sprint("no episode number found; treating as extra '%s'", tag.label)
				});
			}
		}
		else
		{
			meta.episode = record.episode;
		}

		// the video stream of an extra doesn't carry a language; its subtitles do.
		if(!meta.isSpecial || isSubtitle(entry.extension))
			meta.languageTags = analysis.languages;

		return meta;
	}
}
