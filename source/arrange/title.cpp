// title.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <regex>
#include <iterator>

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	FormatTable FormatTable::defaults()
	{
		FormatTable table;
		table.words = {
			"BD", "BDRip", "BluRay", "Blu-ray", "DVD", "DVDRip", "HDTV", "WEB", "WEB-DL", "WEBRip", "Remux",
			"x264", "x265", "H264", "H265", "H.264", "H.265", "AVC", "HEVC", "Hi10P", "Ma10P", "HDR", "UHD", "4K",
			"AAC", "AC3", "FLAC", "DTS", "DTS-HD", "TrueHD", "Opus", "MP3", "Dual-Audio",
			"MKV", "MP4", "CHS", "CHT", "GB", "BIG5",
		};

		return table;
	}

	bool FormatTable::isFormat(const std::string& text) const
	{
		static const auto resolution = std::regex("[0-9]{3,4}[pPiI]|[0-9]{3,4}[xX][0-9]{3,4}");
		static const auto bitDepth = std::regex("(?:8|10|12)-?bits?", std::regex::icase);

		if(std::regex_match(text, resolution) || std::regex_match(text, bitDepth))
			return true;

		return util::containsIgnoreCase(words, text);
	}

	bool Arranger::isGroupTag(const Token& tok) const
	{
		if(tok.position != 0 || !tok.bracketed)
			return false;

		// "[01] Show" or "[1080p] Show" has no group.
		if(util::isDigits(tok.text) || isEpisodeRange(tok.text) || vocab.formats.isFormat(tok.text))
			return false;

		if(languages.classify(tok) || !specials.parseCompound(tok.text).empty())
			return false;

		return true;
	}

	static std::string stripBrackets(const std::string& name)
	{
		static const std::vector<std::string> brackets = {
			"[", "]", "(", ")", "【", "】", "（", "）"
		};

		std::string ret = name;
		for(const auto& b : brackets)
		{
			size_t i = 0;
			while((i = ret.find(b, i)) != std::string::npos)
				ret.replace(i, b.size(), " ");
		}

		// collapse the spaces we just made.
		auto words = util::splitString(ret, ' ');
		words.erase(std::remove_if(words.begin(), words.end(), [](const std::string& w) -> bool {
			return util::trim(w).empty();
		}), words.end());

		return util::join(words, " ");
	}

	FolderInfo Arranger::resolveFolder(const std::string& folderName) const
	{
		FolderInfo info;
		auto tokens = tokenise(folderName, Field::Folder);

		std::vector<size_t> consumed;
		auto isConsumed = [&consumed](size_t pos) -> bool {
			return std::find(consumed.begin(), consumed.end(), pos) != consumed.end();
		};

		if(!tokens.empty() && isGroupTag(tokens[0]))
		{
			// "[GroupA&GroupB]" is a joint release.
			for(const auto& g : util::splitString(tokens[0].text, '&'))
			{
				if(auto x = util::trim(g); !x.empty())
					info.groups.push_back(x);
			}

			consumed.push_back(tokens[0].position);
		}

		languages.extract(tokens, false, consumed);

		// a folder called "Show OVA" is still the show; the marker only matters per file.
		for(const auto& tok : tokens)
		{
			if(!isConsumed(tok.position) && !specials.parseCompound(tok.text).empty())
				consumed.push_back(tok.position);
		}

		{
			std::vector<Token> residual;
			std::copy_if(tokens.begin(), tokens.end(), std::back_inserter(residual), [&isConsumed](const Token& t) -> bool {
				return !isConsumed(t.position);
			});

			if(auto s = episodes.matchSeason(residual); s)
			{
				info.season = s->season;
				consumed.insert(consumed.end(), s->consumed.begin(), s->consumed.end());
			}
		}

		std::vector<std::string> words;
		for(const auto& tok : tokens)
		{
			if(isConsumed(tok.position))
				continue;

			if(isEpisodeRange(tok.text))
			{
				if(info.episodeRange.empty())
					info.episodeRange = tok.text;

				continue;
			}

			if(tok.bracketed || vocab.formats.isFormat(tok.text))
			{
				info.formats.push_back(tok.text);
				continue;
			}

			words.push_back(tok.text);
		}

		info.title = util::trim(util::join(words, " "));

		if(info.title.empty())
		{
			// "[Group][Title][01-12][1080p]": nothing outside brackets, so take the first bracket that reads like a name.
			for(const auto& tok : tokens)
			{
				if(isConsumed(tok.position) || !tok.bracketed)
					continue;

				if(isEpisodeRange(tok.text) || util::isDigits(tok.text) || vocab.formats.isFormat(tok.text))
					continue;

				info.title = tok.text;
				if(auto it = std::find(info.formats.begin(), info.formats.end(), tok.text); it != info.formats.end())
					info.formats.erase(it);

				break;
			}
		}

		if(info.title.empty())
		{
			auto stripped = stripBrackets(folderName);

			// "[Group] 1080p" style leftovers aren't part of any title.
			auto words = util::splitString(stripped, ' ');
			words.erase(std::remove_if(words.begin(), words.end(), [this](const std::string& w) -> bool {
				return vocab.formats.isFormat(w) || isEpisodeRange(w);
			}), words.end());

			auto kept = util::join(words, " ");

			auto name = kept;
			if(!info.groups.empty() && name.compare(0, tokens[0].text.size(), tokens[0].text) == 0)
				name = util::trim(name.substr(tokens[0].text.size()));

			if(!name.empty())           info.title = name;
			else if(!kept.empty())      info.title = kept;
			else if(!stripped.empty())  info.title = stripped;
			else                        info.title = folderName;
		}

		if(!options.titleOverride.empty())
			info.title = options.titleOverride;

		return info;
	}
}
