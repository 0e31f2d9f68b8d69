// languages.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <regex>

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	LanguageTable LanguageTable::defaults()
	{
		LanguageTable table;
		table.compactLanguages = { "JP", "JA", "ZH", "EN", "KO", "KR", "CN", "SC", "TC" };
		table.compactRegions = { "TC", "SC", "CN", "TW", "HK", "US", "JP", "GB", "KR", "EN" };

		table.isoLanguages = {
			"ar", "de", "en", "es", "fr", "he", "hi", "id", "it", "ja", "ko",
			"ms", "nl", "pl", "pt", "ru", "sv", "th", "tr", "uk", "vi", "zh"
		};

		table.isoScripts = { "Hans", "Hant", "Latn", "Cyrl", "Jpan", "Kore", "Arab" };
		table.isoLongRegions = { "CHN", "TWN", "HKG", "JPN", "KOR", "USA", "GBR" };

		table.suffixCodes = {
			"sc", "tc", "chs", "cht", "gb", "big5", "jp", "jpn", "ja", "en", "eng", "zh", "chi"
		};

		return table;
	}

	LanguageClassifier::LanguageClassifier(LanguageTable table) : table(std::move(table))
	{
	}

	static bool isAlpha(const std::string& s)
	{
		return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) -> bool {
			return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
		});
	}

	std::optional<LanguageTag> LanguageClassifier::classify(const Token& tok) const
	{
		const auto& text = tok.text;

		// JPTC, ENCN, ZHCN, ENUS
		if(text.size() == 4 && isAlpha(text))
		{
			auto upper = util::uppercase(text);

			// "Enen" or "Koko" are words, not ENEN or KOKO.
			if(upper.substr(0, 2) == upper.substr(2, 2))
				return std::nullopt;

			if(util::containsIgnoreCase(table.compactLanguages, upper.substr(0, 2))
				&& util::containsIgnoreCase(table.compactRegions, upper.substr(2, 2)))
			{
				return LanguageTag { text, upper };
			}

			return std::nullopt;
		}

		// zh-TW, en-US, zh-Hans, zh-Hant
		static const auto regex = std::regex("([A-Za-z]{2})-([A-Za-z]{2,4})");

		std::smatch sm;
		if(!std::regex_match(text, sm, regex))
			return std::nullopt;

		auto lang = util::lowercase(sm[1]);
		auto sub = std::string(sm[2]);

		if(!util::containsIgnoreCase(table.isoLanguages, lang))
			return std::nullopt;

		if(sub.size() == 4)
		{
			if(!util::containsIgnoreCase(table.isoScripts, sub))
				return std::nullopt;

			auto script = util::lowercase(sub);
			script[0] = toupper(script[0]);

			return LanguageTag { text, zpr::sprint("%s-%s", lang, script) };
		}
		else if(sub.size() == 3 && !util::containsIgnoreCase(table.isoLongRegions, sub))
		{
			// "He-Man"
			return std::nullopt;
		}

		return LanguageTag { text, zpr::sprint("%s-%s", lang, util::uppercase(sub)) };
	}

	std::vector<LanguageTag> LanguageClassifier::extract(const std::vector<Token>& tokens, bool subtitle,
		std::vector<size_t>& consumed) const
	{
		std::vector<std::pair<size_t, LanguageTag>> found;

		auto isConsumed = [&consumed](size_t pos) -> bool {
			return std::find(consumed.begin(), consumed.end(), pos) != consumed.end();
		};

		// bare words before the first bracket after the group are the title: "[Group] Enen no Shouboutai [01]".
		bool pastTitle = false;
		for(const auto& tok : tokens)
		{
			bool eligible = tok.bracketed || pastTitle;
			if(tok.bracketed && tok.position > 0)
				pastTitle = true;

			if(!eligible || isConsumed(tok.position))
				continue;

			if(auto tag = classify(tok); tag)
				found.emplace_back(tok.position, *tag);
		}

		// "show s01e01.zh-TW.ass", "show [01].chs.ass": a subtitle's name can end in a run of tags.
		if(subtitle)
		{
			for(auto it = tokens.rbegin(); it != tokens.rend(); ++it)
			{
				if(isConsumed(it->position))
					continue;

				bool already = std::any_of(found.begin(), found.end(), [&it](const auto& f) -> bool {
					return f.first == it->position;
				});

				if(already)
					continue;

				if(it->bracketed)
					break;

				if(auto tag = classify(*it); tag)
					found.emplace_back(it->position, *tag);

				else if(util::containsIgnoreCase(table.suffixCodes, it->text))
					found.emplace_back(it->position, LanguageTag { it->text, util::lowercase(it->text) });

				else
					break;
			}
		}

		std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) -> bool {
			return a.first < b.first;
		});

		std::vector<LanguageTag> ret;
		for(const auto& [ pos, tag ] : found)
		{
			consumed.push_back(pos);
			ret.push_back(tag);
		}

		return ret;
	}
}
