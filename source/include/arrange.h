// arrange.h
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>

namespace arrange
{
	enum class Field
	{
		Folder,
		File
	};

	struct Token
	{
		std::string text;
		Field field = Field::File;
		size_t position = 0;

		// came from inside [], (), 【】 or （）.
		bool bracketed = false;
	};

	// one per source file, as handed over by the scanner.
	struct RawEntry
	{
		std::string folderName;
		std::string fileName;
		std::vector<std::string> relativeSubpath;

		// without the leading dot.
		std::string extension;
	};

	struct LanguageTag
	{
		std::string raw;
		std::string normalized;
	};

	enum class SpecialKind
	{
		OP,
		ED,
		NCOP,
		NCED,
		PV,
		CM,
		MENU,
		SP,
		OVA,
		OAD,
		OTHER
	};

	struct SpecialTag
	{
		SpecialKind kind = SpecialKind::OTHER;
		std::optional<int> index;
		std::vector<SpecialTag> compoundWith;

		// the name used for the output file: "NCED1", "PV&CM4", "映像特典", or the raw text for OTHER.
		std::string label;
	};

	enum class Confidence
	{
		Filename,
		Foldername,
		Default
	};

	struct EpisodeRecord
	{
		std::optional<int> season;
		std::optional<int> episode;
		Confidence confidence = Confidence::Default;
	};

	struct SeriesMetadata
	{
		std::string title;
		int season = 1;
		std::optional<int> episode;

		bool isSpecial = false;
		std::optional<SpecialTag> specialTag;

		std::vector<LanguageTag> languageTags;
		std::string extension;
	};

	// everything title resolution learns about the top-level folder name.
	struct FolderInfo
	{
		std::string title;
		std::vector<std::string> groups;
		std::vector<std::string> formats;
		std::string episodeRange;
		std::optional<int> season;
	};

	enum class WarningKind
	{
		UnrecognizedPattern,
		DuplicateTarget,
		MalformedCompoundTag,
		EmptyFolder
	};

	struct Warning
	{
		WarningKind kind;
		size_t folder = 0;
		std::string source;
		std::string message;
	};

	enum class OperationKind
	{
		Hardlink,
		SkipDuplicate
	};

	struct Operation
	{
		std::string sourcePath;
		std::string targetPath;
		OperationKind kind = OperationKind::Hardlink;

		size_t folder = 0;
		SeriesMetadata meta;
	};

	struct FolderInput
	{
		std::string path;
		std::vector<RawEntry> entries;
	};

	struct FolderPlan
	{
		std::string path;
		std::string name;
		FolderInfo info;

		// indices into Plan::operations.
		std::vector<size_t> operations;
		bool failed = false;
	};

	struct Plan
	{
		std::vector<FolderPlan> folders;
		std::vector<Operation> operations;
		std::vector<Warning> warnings;
	};



	// tokeniser.cpp
	std::vector<Token> tokenise(const std::string& name, Field field);
	std::string fileStem(const RawEntry& entry);



	// languages.cpp
	struct LanguageTable
	{
		// JPTC, ZHCN, ENUS: first half from `compactLanguages`, second half from `compactRegions`.
		std::vector<std::string> compactLanguages;
		std::vector<std::string> compactRegions;

		// zh-TW, zh-Hant, zh-TWN: language from `isoLanguages`, then any 2 letter region, a 3 letter one
		// from `isoLongRegions`, or a script from `isoScripts`.
		std::vector<std::string> isoLanguages;
		std::vector<std::string> isoLongRegions;
		std::vector<std::string> isoScripts;

		// sc, chs, jpn: only at the tail of a subtitle file name.
		std::vector<std::string> suffixCodes;

		static LanguageTable defaults();
	};

	class LanguageClassifier
	{
	public:
		explicit LanguageClassifier(LanguageTable table);

		std::optional<LanguageTag> classify(const Token& tok) const;

		// tags in appearance order. positions of matching tokens are appended to `consumed`.
		// bare words only count once the title is over, or at the tail of a subtitle's name.
		std::vector<LanguageTag> extract(const std::vector<Token>& tokens, bool subtitle, std::vector<size_t>& consumed) const;

	private:
		LanguageTable table;
	};



	// specials.cpp
	struct SpecialVocabulary
	{
		// two-letter markers match upper-case only; longer ones ignore case.
		std::vector<std::pair<std::string, SpecialKind>> markers;

		// matched as a prefix of the segment, longest first.
		std::vector<std::pair<std::string, SpecialKind>> japaneseMarkers;

		static SpecialVocabulary defaults();
	};

	struct SpecialMatch
	{
		size_t position = 0;
		std::vector<SpecialTag> members;

		// at least one segment had neither a kind nor an index.
		bool malformed = false;
	};

	class SpecialClassifier
	{
	public:
		explicit SpecialClassifier(SpecialVocabulary vocab);

		// empty when the text is not special content at all.
		std::vector<SpecialTag> parseCompound(const std::string& text, bool* malformed = nullptr) const;

		std::optional<SpecialMatch> extract(const std::vector<Token>& tokens, std::vector<size_t>& consumed) const;

		static SpecialTag combine(const std::vector<SpecialTag>& members);
		static std::string kindName(SpecialKind kind);

	private:
		SpecialVocabulary vocab;
	};



	// episodes.cpp
	std::optional<int> parseNumber(const std::string& digits);
	std::optional<int> parseChineseNumeral(const std::string& s);
	bool isEpisodeRange(const std::string& text);

	struct Extracted
	{
		std::optional<int> season;
		std::optional<int> episode;

		// Token::position of every token the match used.
		std::vector<size_t> consumed;
	};

	// [05]
	struct BracketEpisodePattern   { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// S02E05, S2E5
	struct StandardEpisodePattern  { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// 第08話, 第十三话
	struct JapaneseEpisodePattern  { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// EP05, E05
	struct PrefixedEpisodePattern  { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// the last bare 2-3 digit word: "Show - 05"
	struct LooseEpisodePattern     { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// Season 2, [Season 2], Season2
	struct SeasonWordPattern       { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// 2nd Season
	struct OrdinalSeasonPattern    { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// 第2期, 第二期, 第2季
	struct JapaneseSeasonPattern   { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	// S2, S02
	struct ShortSeasonPattern      { std::optional<Extracted> match(const std::vector<Token>& tokens) const; };

	using Pattern = std::variant<
		BracketEpisodePattern,
		StandardEpisodePattern,
		JapaneseEpisodePattern,
		PrefixedEpisodePattern,
		LooseEpisodePattern,
		SeasonWordPattern,
		OrdinalSeasonPattern,
		JapaneseSeasonPattern,
		ShortSeasonPattern
	>;

	std::optional<Extracted> matchPattern(const Pattern& pattern, const std::vector<Token>& tokens);

	class EpisodeExtractor
	{
	public:
		EpisodeExtractor();
		EpisodeExtractor(std::vector<Pattern> episodePatterns, std::vector<Pattern> seasonPatterns);

		// file names only; first match wins.
		std::optional<Extracted> matchEpisode(const std::vector<Token>& tokens) const;

		// folder names only; first match wins.
		std::optional<Extracted> matchSeason(const std::vector<Token>& tokens) const;

	private:
		std::vector<Pattern> episodePatterns;
		std::vector<Pattern> seasonPatterns;
	};



	// title.cpp
	struct FormatTable
	{
		std::vector<std::string> words;

		bool isFormat(const std::string& text) const;
		static FormatTable defaults();
	};



	struct Vocabulary
	{
		LanguageTable languages;
		SpecialVocabulary specials;
		FormatTable formats;

		std::vector<std::string> specialFolders;
		std::vector<std::string> subtitleExtensions;

		static Vocabulary defaults();
	};

	struct Options
	{
		// empty = resolve from the folder name.
		std::string titleOverride;

		// -1 = resolve from the names.
		int seasonOverride = -1;
	};

	class Arranger
	{
	public:
		explicit Arranger(Vocabulary vocab = Vocabulary::defaults(), Options options = Options());

		// title.cpp
		FolderInfo resolveFolder(const std::string& folderName) const;

		// compose.cpp
		EpisodeRecord extractEpisode(const RawEntry& entry, const FolderInfo& folder) const;
		SeriesMetadata compose(const RawEntry& entry, const FolderInfo& folder, std::vector<Warning>& warnings) const;

		// plan.cpp
		Plan plan(const std::vector<FolderInput>& folders) const;

		bool isSubtitle(const std::string& extension) const;
		bool isSpecialFolder(const std::string& name) const;

	private:
		struct FileAnalysis
		{
			std::vector<Token> tokens;
			std::vector<size_t> consumed;
			std::vector<LanguageTag> languages;
			std::optional<SpecialMatch> special;
			bool inSpecialFolder = false;
		};

		FileAnalysis analyseFile(const RawEntry& entry) const;
		EpisodeRecord resolveEpisode(const FileAnalysis& analysis, const RawEntry& entry, const FolderInfo& folder) const;
		std::string otherLabel(const FileAnalysis& analysis, const RawEntry& entry, const FolderInfo& folder) const;
		bool isGroupTag(const Token& tok) const;

		Vocabulary vocab;
		Options options;

		LanguageClassifier languages;
		SpecialClassifier specials;
		EpisodeExtractor episodes;
	};



	// paths.cpp
	std::string specialName(const SpecialTag& tag);
	std::string buildTargetPath(const SeriesMetadata& meta);
	std::vector<Warning> detectCollisions(std::vector<Operation>& operations);

	std::string warningKindName(WarningKind kind);
}
