// tokeniser.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	struct BracketPair
	{
		const char* open;
		const char* close;
	};

	static constexpr BracketPair bracketPairs[] = {
		{ "[", "]" },
		{ "(", ")" },
		{ "\xE3\x80\x90", "\xE3\x80\x91" },     // 【 】
		{ "\xEF\xBC\x88", "\xEF\xBC\x89" },     // （ ）
	};

	static constexpr const char* FULLWIDTH_SPACE = "\xE3\x80\x80";

	static bool startsWithAt(const std::string& s, size_t i, const char* prefix)
	{
		return s.compare(i, strlen(prefix), prefix) == 0;
	}

	static bool isDigit(char c)
	{
		return c >= '0' && c <= '9';
	}

	// returns the byte length of the delimiter at `i`, or 0 if there isn't one.
	static size_t delimiterAt(const std::string& s, size_t i)
	{
		char c = s[i];
		if(c == ' ' || c == '\t' || c == '_')
			return 1;

		if(startsWithAt(s, i, FULLWIDTH_SPACE))
			return strlen(FULLWIDTH_SPACE);

		if(c == '.')
		{
			// "Dr. Stone" keeps its period, and so does "5.1".
			bool beforeSpace = (i + 1 < s.size() && (s[i + 1] == ' ' || s[i + 1] == '\t'));
			bool betweenDigits = (i > 0 && i + 1 < s.size() && isDigit(s[i - 1]) && isDigit(s[i + 1]));

			if(!beforeSpace && !betweenDigits)
				return 1;
		}

		return 0;
	}

	// dashes and tildes only separate things; "Snow-Raws" keeps its dash, " - " goes away.
	static std::string stripSeparators(const std::string& s)
	{
		auto i = s.find_first_not_of("-~+|");
		if(i == std::string::npos)
			return "";

		auto k = s.find_last_not_of("-~+|");
		return s.substr(i, k - i + 1);
	}

	std::vector<Token> tokenise(const std::string& name, Field field)
	{
		std::vector<Token> ret;
		std::string current;

		auto push = [&ret, field](const std::string& text, bool bracketed) {
			Token tok;
			tok.text = text;
			tok.field = field;
			tok.position = ret.size();
			tok.bracketed = bracketed;

			ret.push_back(tok);
		};

		auto flush = [&]() {
			if(auto word = stripSeparators(current); !word.empty())
				push(word, false);

			current.clear();
		};

		size_t i = 0;
		while(i < name.size())
		{
			bool consumed = false;
			for(const auto& bp : bracketPairs)
			{
				if(!startsWithAt(name, i, bp.open))
					continue;

				auto start = i + strlen(bp.open);
				auto end = name.find(bp.close, start);

				// an unclosed bracket is just another character.
				if(end == std::string::npos)
					break;

				flush();

				if(auto inner = util::trim(name.substr(start, end - start)); !inner.empty())
					push(inner, true);

				i = end + strlen(bp.close);
				consumed = true;
				break;
			}

			if(consumed)
				continue;

			if(auto d = delimiterAt(name, i); d > 0)
			{
				flush();
				i += d;
				continue;
			}

			current += name[i];
			i += 1;
		}

		flush();
		return ret;
	}

	std::string fileStem(const RawEntry& entry)
	{
		const auto& name = entry.fileName;
		if(entry.extension.empty())
			return name;

		auto suffix = "." + entry.extension;
		if(name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
			return name.substr(0, name.size() - suffix.size());

		return name;
	}
}
