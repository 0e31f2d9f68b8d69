// classifiers_test.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <cassert>

#include "defs.h"
#include "arrange.h"

using namespace arrange;

static Token word(const std::string& text, bool bracketed = false)
{
	Token t;
	t.text = text;
	t.bracketed = bracketed;
	return t;
}

static void testLanguages()
{
	zpr::println("[Test] language tags");

	auto lc = LanguageClassifier(LanguageTable::defaults());

	assert(lc.classify(word("JPTC"))->normalized == "JPTC");
	assert(lc.classify(word("zhcn"))->normalized == "ZHCN");
	assert(lc.classify(word("zh-TW"))->normalized == "zh-TW");
	assert(lc.classify(word("zh-tw"))->normalized == "zh-TW");
	assert(lc.classify(word("zh-hant"))->normalized == "zh-Hant");
	assert(lc.classify(word("zh-TW"))->raw == "zh-TW");

	assert(!lc.classify(word("Show")));
	assert(!lc.classify(word("HEVC")));
	assert(!lc.classify(word("xx-YY")));
	assert(!lc.classify(word("zh-Abcd")));

	// title words that only look like tags.
	assert(!lc.classify(word("Enen")));
	assert(!lc.classify(word("ENEN")));
	assert(!lc.classify(word("Koko")));
	assert(!lc.classify(word("He-Man")));
	assert(lc.classify(word("zh-TWN"))->normalized == "zh-TWN");

	// bare words count only once the title is over.
	{
		auto toks = tokenise("[Group] JPTC Club [01] JPTC", Field::File);

		std::vector<size_t> consumed;
		auto tags = lc.extract(toks, false, consumed);

		assert(tags.size() == 1);
		assert((consumed == std::vector<size_t> { 4 }));
	}

	// a subtitle's name may end in full tags as well as short codes.
	{
		auto toks = tokenise("Show S01E01.zh-TW", Field::File);

		std::vector<size_t> consumed;
		auto tags = lc.extract(toks, true, consumed);

		assert(tags.size() == 1);
		assert(tags[0].normalized == "zh-TW");
	}

	// suffix codes only count at the tail of a subtitle name.
	{
		auto toks = tokenise("[Group] Show [01][JPTC].chs", Field::File);

		std::vector<size_t> consumed;
		auto tags = lc.extract(toks, true, consumed);

		assert(tags.size() == 2);
		assert(tags[0].raw == "JPTC");
		assert(tags[1].raw == "chs");
		assert(consumed.size() == 2);
	}

	{
		auto toks = tokenise("[Group] Show [01].chs", Field::File);

		std::vector<size_t> consumed;
		assert(lc.extract(toks, false, consumed).empty());
		assert(consumed.empty());
	}

	zpr::println("[PASS] language tags");
}

static void testSpecials()
{
	zpr::println("[Test] special tags");

	auto sc = SpecialClassifier(SpecialVocabulary::defaults());

	{
		auto xs = sc.parseCompound("NCED1");
		assert(xs.size() == 1);
		assert(xs[0].kind == SpecialKind::NCED);
		assert(xs[0].index == 1);
		assert(SpecialClassifier::combine(xs).label == "NCED1");
	}

	// kinds carry forward.
	{
		auto xs = sc.parseCompound("NCOP1&2");
		assert(xs.size() == 2);
		assert(xs[0].kind == SpecialKind::NCOP && xs[0].index == 1);
		assert(xs[1].kind == SpecialKind::NCOP && xs[1].index == 2);

		auto tag = SpecialClassifier::combine(xs);
		assert(tag.kind == SpecialKind::NCOP);
		assert(tag.compoundWith.size() == 1);
		assert(tag.label == "NCOP1&2");
	}

	// indices carry backward.
	{
		auto xs = sc.parseCompound("PV&CM4");
		assert(xs.size() == 2);
		assert(xs[0].kind == SpecialKind::PV && xs[0].index == 4);
		assert(xs[1].kind == SpecialKind::CM && xs[1].index == 4);
		assert(SpecialClassifier::combine(xs).label == "PV&CM4");
	}

	{
		auto xs = sc.parseCompound("CM1&2&3");
		assert(xs.size() == 3);
		for(size_t i = 0; i < xs.size(); i++)
		{
			assert(xs[i].kind == SpecialKind::CM);
			assert(xs[i].index == static_cast<int>(i + 1));
		}

		assert(SpecialClassifier::combine(xs).label == "CM1&2&3");
	}

	// the episode ordinal in front is context, not part of the tag.
	{
		auto xs = sc.parseCompound("第十三话ED");
		assert(xs.size() == 1);
		assert(xs[0].kind == SpecialKind::ED);
		assert(!xs[0].index);
	}

	{
		auto xs = sc.parseCompound("PV&CM");
		assert(xs.size() == 2);
		assert(!xs[0].index && !xs[1].index);
		assert(SpecialClassifier::combine(xs).label == "PV&CM");
	}

	{
		auto xs = sc.parseCompound("映像特典");
		assert(xs.size() == 1 && xs[0].kind == SpecialKind::SP);
		assert(SpecialClassifier::combine(xs).label == "映像特典");
	}

	{
		bool malformed = false;
		auto xs = sc.parseCompound("NCOP&Preview", &malformed);
		assert(malformed);
		assert(xs.size() == 2);
		assert(xs[1].kind == SpecialKind::OTHER);
	}

	// two-letter markers are upper-case only, so title words survive.
	assert(sc.parseCompound("Op").empty());
	assert(sc.parseCompound("Show").empty());
	assert(sc.parseCompound("05").empty());
	assert(!sc.parseCompound("Menu2").empty());

	zpr::println("[PASS] special tags");
}

static void testNumbers()
{
	zpr::println("[Test] episode and season patterns");

	assert(parseChineseNumeral("十三") == 13);
	assert(parseChineseNumeral("二十") == 20);
	assert(parseChineseNumeral("一百零五") == 105);
	assert(!parseChineseNumeral("abc"));
	assert(parseChineseNumeral("九千九百九十九") == 9999);

	// too long to be an episode; must not wrap around.
	assert(!parseChineseNumeral("九九九九九九九九九九九九"));
	assert(!parseChineseNumeral("九九九九九千"));

	assert(isEpisodeRange("01-12"));
	assert(isEpisodeRange("01 ~ 26"));
	assert(!isEpisodeRange("1080p"));

	auto ex = EpisodeExtractor();
	auto episodeOf = [&ex](const std::string& name) -> std::optional<int> {
		if(auto x = ex.matchEpisode(tokenise(name, Field::File)); x)
			return x->episode;

		return std::nullopt;
	};

	auto seasonOf = [&ex](const std::string& name) -> std::optional<int> {
		if(auto x = ex.matchSeason(tokenise(name, Field::Folder)); x)
			return x->season;

		return std::nullopt;
	};

	assert(episodeOf("Show [01] [1080p]") == 1);
	assert(episodeOf("Show [23]") == 23);
	assert(episodeOf("Show [05v2]") == 5);
	assert(episodeOf("Show 第08話") == 8);
	assert(episodeOf("Show 第十三话") == 13);
	assert(episodeOf("Show EP05") == 5);
	assert(episodeOf("Mob Psycho 100 - 05") == 5);
	assert(!episodeOf("Show Credits"));
	assert(!episodeOf("Show 第九九九九九九九九九九九九話"));

	{
		auto x = ex.matchEpisode(tokenise("Show S02E23", Field::File));
		assert(x && x->season == 2 && x->episode == 23);
	}

	assert(seasonOf("Show Season 3") == 3);
	assert(seasonOf("Show Season2") == 2);
	assert(seasonOf("Show 2nd Season") == 2);
	assert(seasonOf("Show 第二期") == 2);
	assert(seasonOf("Show S2") == 2);
	assert(!seasonOf("Show"));
	assert(!seasonOf("Show 第九九九九九九九九九九期"));

	// a custom pattern list is honoured in order.
	{
		auto only = EpisodeExtractor({ LooseEpisodePattern() }, { });
		auto x = only.matchEpisode(tokenise("Show [01] 12", Field::File));
		assert(x && x->episode == 12);
		assert(!only.matchSeason(tokenise("Show Season 2", Field::Folder)));
	}

	zpr::println("[PASS] episode and season patterns");
}

int main()
{
	testLanguages();
	testSpecials();
	testNumbers();

	return 0;
}
