// specials.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include <regex>

#include "defs.h"
#include "arrange.h"

namespace arrange
{
	SpecialVocabulary SpecialVocabulary::defaults()
	{
		SpecialVocabulary vocab;
		vocab.markers = {
			{ "NCOP", SpecialKind::NCOP },
			{ "NCED", SpecialKind::NCED },
			{ "MENU", SpecialKind::MENU },
			{ "OVA",  SpecialKind::OVA },
			{ "OAD",  SpecialKind::OAD },
			{ "OP",   SpecialKind::OP },
			{ "ED",   SpecialKind::ED },
			{ "PV",   SpecialKind::PV },
			{ "CM",   SpecialKind::CM },
			{ "SP",   SpecialKind::SP },
		};

		// longest first, so 映像特典 wins over 特典.
		vocab.japaneseMarkers = {
			{ "映像特典", SpecialKind::SP },
			{ "特典",     SpecialKind::SP },
		};

		return vocab;
	}

	SpecialClassifier::SpecialClassifier(SpecialVocabulary vocab) : vocab(std::move(vocab))
	{
	}

	std::string SpecialClassifier::kindName(SpecialKind kind)
	{
		switch(kind)
		{
			case SpecialKind::OP:       return "OP";
			case SpecialKind::ED:       return "ED";
			case SpecialKind::NCOP:     return "NCOP";
			case SpecialKind::NCED:     return "NCED";
			case SpecialKind::PV:       return "PV";
			case SpecialKind::CM:       return "CM";
			case SpecialKind::MENU:     return "MENU";
			case SpecialKind::SP:       return "SP";
			case SpecialKind::OVA:      return "OVA";
			case SpecialKind::OAD:      return "OAD";
			case SpecialKind::OTHER:    return "OTHER";
		}

		return "OTHER";
	}

	namespace
	{
		struct Segment
		{
			std::string raw;

			std::optional<SpecialKind> kind;
			std::optional<int> index;

			// how the kind was spelled, if the segment spelled one.
			std::string kindText;
			bool recognised = false;
		};
	}

	// "第十三话ED" -- the ordinal is episode context, not a content type.
	static std::string stripOrdinalPrefix(const std::string& s)
	{
		static const auto regex = std::regex("^第(?:[0-9]+|(?:〇|零|一|二|两|三|四|五|六|七|八|九|十|百|千)+)(?:話|话|集)(.+)$");

		std::smatch sm;
		if(std::regex_match(s, sm, regex))
			return sm[1];

		return s;
	}

	static Segment parseSegment(const SpecialVocabulary& vocab, const std::string& text)
	{
		Segment seg;
		seg.raw = util::trim(text);

		auto s = util::trim(stripOrdinalPrefix(seg.raw));
		if(s.empty())
			return seg;

		for(const auto& [ marker, kind ] : vocab.japaneseMarkers)
		{
			if(s.compare(0, marker.size(), marker) != 0)
				continue;

			auto rest = util::trim(s.substr(marker.size()));
			if(!rest.empty() && !util::isDigits(rest))
				return seg;

			seg.kind = kind;
			seg.kindText = marker;
			seg.index = parseNumber(rest);
			seg.recognised = true;
			return seg;
		}

		static const auto regex = std::regex("([A-Za-z]*) *([0-9]*)");

		std::smatch sm;
		if(!std::regex_match(s, sm, regex))
			return seg;

		auto letters = std::string(sm[1]);
		auto digits = std::string(sm[2]);

		if(letters.empty())
		{
			seg.index = parseNumber(digits);
			seg.recognised = seg.index.has_value();
			return seg;
		}

		for(const auto& [ marker, kind ] : vocab.markers)
		{
			bool hit = (marker.size() <= 2) ? (letters == marker) : util::equalsIgnoreCase(letters, marker);
			if(!hit)
				continue;

			seg.kind = kind;
			seg.kindText = SpecialClassifier::kindName(kind);
			seg.index = parseNumber(digits);
			seg.recognised = true;
			return seg;
		}

		return seg;
	}

	std::vector<SpecialTag> SpecialClassifier::parseCompound(const std::string& text, bool* malformed) const
	{
		if(malformed) *malformed = false;

		auto segments = util::splitString(text, '&');
		if(segments.empty())
			return { };

		// "a&b&" leaves a trailing empty segment that splitString drops; keep it so it counts as malformed.
		if(text.back() == '&')
			segments.push_back("");

		std::vector<Segment> segs;
		for(const auto& s : segments)
			segs.push_back(parseSegment(vocab, s));

		bool anyKind = std::any_of(segs.begin(), segs.end(), [](const Segment& s) -> bool {
			return s.kind.has_value();
		});

		if(!anyKind)
			return { };

		std::vector<SpecialTag> ret;
		for(size_t i = 0; i < segs.size(); i++)
		{
			const auto& seg = segs[i];

			SpecialTag tag;
			if(!seg.recognised)
			{
				if(malformed) *malformed = true;

				tag.kind = SpecialKind::OTHER;
				tag.label = seg.raw.empty() ? SpecialClassifier::kindName(SpecialKind::OTHER) : seg.raw;
				ret.push_back(tag);
				continue;
			}

			// kinds flow forward ("NCOP1&2"), or backward when only a later segment names one.
			if(seg.kind)
			{
				tag.kind = *seg.kind;
			}
			else
			{
				std::optional<SpecialKind> k;
				for(size_t j = i; j-- > 0 && !k; )
					k = segs[j].kind;

				for(size_t j = i + 1; j < segs.size() && !k; j++)
					k = segs[j].kind;

				tag.kind = k.value_or(SpecialKind::OTHER);
			}

			// indices flow right-to-left: "PV&CM4" gives both members index 4.
			if(seg.index)
			{
				tag.index = seg.index;
			}
			else
			{
				for(size_t j = i + 1; j < segs.size() && !tag.index; j++)
					tag.index = segs[j].index;
			}

			tag.label = seg.kindText;
			if(seg.index)
				tag.label += std::to_string(*seg.index);

			ret.push_back(tag);
		}

		return ret;
	}

	SpecialTag SpecialClassifier::combine(const std::vector<SpecialTag>& members)
	{
		if(members.empty())
			return SpecialTag();

		auto ret = members[0];
		ret.compoundWith.assign(members.begin() + 1, members.end());

		if(members.size() > 1)
		{
			std::vector<std::string> labels;
			for(const auto& m : members)
				labels.push_back(m.label);

			ret.label = util::join(labels, "&");
		}
		else if(ret.label.empty())
		{
			ret.label = kindName(ret.kind);
		}

		return ret;
	}

	std::optional<SpecialMatch> SpecialClassifier::extract(const std::vector<Token>& tokens, std::vector<size_t>& consumed) const
	{
		for(const auto& tok : tokens)
		{
			if(std::find(consumed.begin(), consumed.end(), tok.position) != consumed.end())
				continue;

			bool malformed = false;
			auto members = parseCompound(tok.text, &malformed);

			if(members.empty())
				continue;

			consumed.push_back(tok.position);

			SpecialMatch match;
			match.position = tok.position;
			match.members = std::move(members);
			match.malformed = malformed;

			return match;
		}

		return std::nullopt;
	}
}
