// episodes.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <regex>

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	// alternation rather than a character class; std::regex works on bytes, not code points.
	#define CJK_DIGITS "(?:〇|零|一|二|两|三|四|五|六|七|八|九|十|百|千)"

	std::optional<int> parseNumber(const std::string& digits)
	{
		if(!util::isDigits(digits) || digits.size() > 6)
			return std::nullopt;

		return std::stoi(digits);
	}

	std::optional<int> parseChineseNumeral(const std::string& s)
	{
		static const std::vector<std::pair<std::string, int>> digits = {
			{ "〇", 0 }, { "零", 0 }, { "一", 1 }, { "二", 2 }, { "两", 2 }, { "三", 3 }, { "四", 4 },
			{ "五", 5 }, { "六", 6 }, { "七", 7 }, { "八", 8 }, { "九", 9 },
		};

		static const std::vector<std::pair<std::string, int>> units = {
			{ "十", 10 }, { "百", 100 }, { "千", 1000 },
		};

		// no episode or season runs past four digits; also keeps the arithmetic in range.
		constexpr int limit = 9999;

		if(s.empty())
			return std::nullopt;

		int total = 0;
		int pending = -1;

		size_t i = 0;
		while(i < s.size())
		{
			bool matched = false;
			for(const auto& [ str, val ] : digits)
			{
				if(s.compare(i, str.size(), str) == 0)
				{
					// "二〇二" style: consecutive digits read positionally.
					pending = (pending == -1 ? 0 : pending * 10) + val;
					if(pending > limit)
						return std::nullopt;

					i += str.size();
					matched = true;
					break;
				}
			}

			if(matched)
				continue;

			for(const auto& [ str, val ] : units)
			{
				if(s.compare(i, str.size(), str) == 0)
				{
					// a bare 十 means 10, so "十三" is 13.
					total += (pending == -1 ? 1 : pending) * val;
					if(total > limit)
						return std::nullopt;

					pending = -1;
					i += str.size();
					matched = true;
					break;
				}
			}

			if(!matched)
				return std::nullopt;
		}

		if(pending != -1)
			total += pending;

		if(total > limit)
			return std::nullopt;

		return total;
	}

	static std::optional<int> parseAnyNumber(const std::string& s)
	{
		if(auto n = parseNumber(s); n)
			return n;

		return parseChineseNumeral(s);
	}

	bool isEpisodeRange(const std::string& text)
	{
		// 01-12, 01~12, [01-26 Fin]
		static const auto regex = std::regex("(?:^|[^0-9])[0-9]{1,3} *[-~] *[0-9]{1,3}(?:$|[^0-9])");
		return std::regex_search(text, regex);
	}



	std::optional<Extracted> BracketEpisodePattern::match(const std::vector<Token>& tokens) const
	{
		static const auto regex = std::regex("([0-9]{1,3})(?:[vV][0-9]+)?");

		for(const auto& tok : tokens)
		{
			std::smatch sm;
			if(!tok.bracketed || !std::regex_match(tok.text, sm, regex))
				continue;

			Extracted ret;
			ret.episode = parseNumber(sm[1]);
			ret.consumed.push_back(tok.position);
			return ret;
		}

		return std::nullopt;
	}

	std::optional<Extracted> StandardEpisodePattern::match(const std::vector<Token>& tokens) const
	{
		static const auto regex = std::regex("[Ss]([0-9]{1,3})[Ee]([0-9]{1,4})(?:[vV][0-9]+)?");

		for(const auto& tok : tokens)
		{
			std::smatch sm;
			if(!std::regex_match(tok.text, sm, regex))
				continue;

			Extracted ret;
			ret.season = parseNumber(sm[1]);
			ret.episode = parseNumber(sm[2]);
			ret.consumed.push_back(tok.position);
			return ret;
		}

		return std::nullopt;
	}

	std::optional<Extracted> JapaneseEpisodePattern::match(const std::vector<Token>& tokens) const
	{
		static const auto regex = std::regex("第([0-9]{1,4}|" CJK_DIGITS "+)(?:話|话|集)");

		for(const auto& tok : tokens)
		{
			std::smatch sm;
			if(!std::regex_search(tok.text, sm, regex))
				continue;

			auto num = parseAnyNumber(sm[1]);
			if(!num)
				continue;

			Extracted ret;
			ret.episode = num;
			ret.consumed.push_back(tok.position);
			return ret;
		}

		return std::nullopt;
	}

	std::optional<Extracted> PrefixedEpisodePattern::match(const std::vector<Token>& tokens) const
	{
		static const auto regex = std::regex("(?:[Ee][Pp]|E)\\.?([0-9]{1,3})(?:[vV][0-9]+)?");

		for(const auto& tok : tokens)
		{
			std::smatch sm;
			if(!std::regex_match(tok.text, sm, regex))
				continue;

			Extracted ret;
			ret.episode = parseNumber(sm[1]);
			ret.consumed.push_back(tok.position);
			return ret;
		}

		return std::nullopt;
	}

	std::optional<Extracted> LooseEpisodePattern::match(const std::vector<Token>& tokens) const
	{
		static const auto regex = std::regex("([0-9]{2,3})(?:[vV][0-9]+)?");

		// the last one, so "Mob Psycho 100 - 05" is episode 5.
		for(auto it = tokens.rbegin(); it != tokens.rend(); ++it)
		{
			std::smatch sm;
			if(it->bracketed || !std::regex_match(it->text, sm, regex))
				continue;

			Extracted ret;
			ret.episode = parseNumber(sm[1]);
			ret.consumed.push_back(it->position);
			return ret;
		}

		return std::nullopt;
	}



	std::optional<Extracted> SeasonWordPattern::match(const std::vector<Token>& tokens) const
	{
		static const auto single = std::regex("season *([0-9]{1,3})", std::regex::icase);

		for(size_t i = 0; i < tokens.size(); i++)
		{
			std::smatch sm;
			if(std::regex_match(tokens[i].text, sm, single))
			{
				Extracted ret;
				ret.season = parseNumber(sm[1]);
				ret.consumed.push_back(tokens[i].position);
				return ret;
			}

			if(i + 1 < tokens.size() && util::equalsIgnoreCase(tokens[i].text, "season") && util::isDigits(tokens[i + 1].text))
			{
				Extracted ret;
				ret.season = parseNumber(tokens[i + 1].text);
				ret.consumed.push_back(tokens[i].position);
				ret.consumed.push_back(tokens[i + 1].position);
				return ret;
			}
		}

		return std::nullopt;
	}

	std::optional<Extracted> OrdinalSeasonPattern::match(const std::vector<Token>& tokens) const
	{
		static const auto ordinal = std::regex("([0-9]{1,2})(?:st|nd|rd|th)", std::regex::icase);
		static const auto single = std::regex("([0-9]{1,2})(?:st|nd|rd|th) +season", std::regex::icase);

		for(size_t i = 0; i < tokens.size(); i++)
		{
			std::smatch sm;
			if(std::regex_match(tokens[i].text, sm, single))
			{
				Extracted ret;
				ret.season = parseNumber(sm[1]);
				ret.consumed.push_back(tokens[i].position);
				return ret;
			}

			if(i + 1 < tokens.size() && std::regex_match(tokens[i].text, sm, ordinal)
				&& util::equalsIgnoreCase(tokens[i + 1].text, "season"))
			{
				Extracted ret;
				ret.season = parseNumber(sm[1]);
				ret.consumed.push_back(tokens[i].position);
				ret.consumed.push_back(tokens[i + 1].position);
				return ret;
			}
		}

		return std::nullopt;
	}

	std::optional<Extracted> JapaneseSeasonPattern::match(const std::vector<Token>& tokens) const
	{
		static const auto regex = std::regex("第([0-9]{1,2}|" CJK_DIGITS "+)(?:期|季)");

		for(const auto& tok : tokens)
		{
			std::smatch sm;
			if(!std::regex_search(tok.text, sm, regex))
				continue;

			auto num = parseAnyNumber(sm[1]);
			if(!num)
				continue;

			Extracted ret;
			ret.season = num;
			ret.consumed.push_back(tok.position);
			return ret;
		}

		return std::nullopt;
	}

	std::optional<Extracted> ShortSeasonPattern::match(const std::vector<Token>& tokens) const
	{
		static const auto regex = std::regex("S([0-9]{1,2})");

		for(const auto& tok : tokens)
		{
			std::smatch sm;
			if(tok.bracketed || !std::regex_match(tok.text, sm, regex))
				continue;

			Extracted ret;
			ret.season = parseNumber(sm[1]);
			ret.consumed.push_back(tok.position);
			return ret;
		}

		return std::nullopt;
	}

	#undef CJK_DIGITS



	std::optional<Extracted> matchPattern(const Pattern& pattern, const std::vector<Token>& tokens)
	{
		return std::visit([&tokens](const auto& p) -> std::optional<Extracted> {
			return p.match(tokens);
		}, pattern);
	}

	EpisodeExtractor::EpisodeExtractor() : EpisodeExtractor({
			BracketEpisodePattern(),
			StandardEpisodePattern(),
			JapaneseEpisodePattern(),
			PrefixedEpisodePattern(),
			LooseEpisodePattern(),
		}, {
			SeasonWordPattern(),
			OrdinalSeasonPattern(),
			JapaneseSeasonPattern(),
			ShortSeasonPattern(),
		})
	{
	}

	EpisodeExtractor::EpisodeExtractor(std::vector<Pattern> episodePatterns, std::vector<Pattern> seasonPatterns)
		: episodePatterns(std::move(episodePatterns)), seasonPatterns(std::move(seasonPatterns))
	{
	}

	static std::optional<Extracted> firstMatch(const std::vector<Pattern>& patterns, const std::vector<Token>& tokens)
	{
		for(const auto& p : patterns)
		{
			if(auto x = matchPattern(p, tokens); x)
				return x;
		}

		return std::nullopt;
	}

	std::optional<Extracted> EpisodeExtractor::matchEpisode(const std::vector<Token>& tokens) const
	{
		return firstMatch(episodePatterns, tokens);
	}

	std::optional<Extracted> EpisodeExtractor::matchSeason(const std::vector<Token>& tokens) const
	{
		return firstMatch(seasonPatterns, tokens);
	}
}
