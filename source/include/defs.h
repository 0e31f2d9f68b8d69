// defs.h
// Copyright (c) 2014 - 2017, zhiayang
// Licensed under the Apache License Version 2.0.

#pragma once
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>

#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <filesystem>
#include <string_view>

#include "zpr.h"

#define COLOUR_RESET			"\033[0m"
#define COLOUR_BLACK			"\033[30m"			// Black
#define COLOUR_RED				"\033[31m"			// Red
#define COLOUR_GREEN			"\033[32m"			// Green
#define COLOUR_YELLOW			"\033[33m"			// Yellow
#define COLOUR_BLUE				"\033[34m"			// Blue
#define COLOUR_MAGENTA			"\033[35m"			// Magenta
#define COLOUR_CYAN				"\033[36m"			// Cyan
#define COLOUR_WHITE			"\033[37m"			// White
#define COLOUR_BLACK_BOLD		"\033[1m"			// Bold Black
#define COLOUR_RED_BOLD			"\033[1m\033[31m"	// Bold Red
#define COLOUR_GREEN_BOLD		"\033[1m\033[32m"	// Bold Green
#define COLOUR_YELLOW_BOLD		"\033[1m\033[33m"	// Bold Yellow
#define COLOUR_BLUE_BOLD		"\033[1m\033[34m"	// Bold Blue
#define COLOUR_MAGENTA_BOLD		"\033[1m\033[35m"	// Bold Magenta
#define COLOUR_CYAN_BOLD		"\033[1m\033[36m"	// Bold Cyan
#define COLOUR_WHITE_BOLD		"\033[1m\033[37m"	// Bold White
#define COLOUR_GREY_BOLD		"\033[30;1m"		// Bold Grey


namespace std
{
	namespace fs = filesystem;
}

namespace util
{
	// same names (and order) as the --log-level option.
	enum class LogLevel
	{
		Debug,
		Info,
		Warning,
		Error,
		Critical
	};

	void indent_log(int n = 1);
	void unindent_log(int n = 1);

	int get_log_indent();

	void set_log_level(LogLevel lvl);
	LogLevel get_log_level();

	std::optional<LogLevel> parseLogLevel(const std::string& name);

	template <typename... Args>
	static void critical(const std::string& fmt, Args&&... args)
	{
		for(int i = 0; i < get_log_indent(); i++)
			fprintf(stderr, "  ");

		fprintf(stderr, " %s!%s %s\n", COLOUR_RED_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void error(const std::string& fmt, Args&&... args)
	{
		if(get_log_level() > LogLevel::Error)
			return;

		for(int i = 0; i < get_log_indent(); i++)
			fprintf(stderr, "  ");

		fprintf(stderr, " %s*%s %s\n", COLOUR_RED_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void warn(const std::string& fmt, Args&&... args)
	{
		if(get_log_level() > LogLevel::Warning)
			return;

		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_YELLOW_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void log(const std::string& fmt, Args&&... args)
	{
		if(get_log_level() > LogLevel::Info)
			return;

		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_GREEN_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void info(const std::string& fmt, Args&&... args)
	{
		if(get_log_level() > LogLevel::Info)
			return;

		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s*%s %s\n", COLOUR_BLUE_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}

	template <typename... Args>
	static void debug(const std::string& fmt, Args&&... args)
	{
		if(get_log_level() > LogLevel::Debug)
			return;

		for(int i = 0; i < get_log_indent(); i++)
			printf("  ");

		printf(" %s-%s %s\n", COLOUR_CYAN_BOLD, COLOUR_RESET, zpr::sprint(fmt, args...).c_str());
	}


	size_t getFileSize(const std::string& path);
	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path);

	static inline std::vector<std::string> splitString(std::string view, char delim = '\n')
	{
		std::vector<std::string> ret;

		while(true)
		{
			size_t ln = view.find(delim);

			if(ln != std::string_view::npos)
			{
				ret.emplace_back(view.data(), ln);
				view = view.substr(ln + 1);
			}
			else
			{
				break;
			}
		}

		// account for the case when there's no trailing newline, and we still have some stuff stuck in the view.
		if(!view.empty())
			ret.emplace_back(view.data(), view.length());

		return ret;
	}

	static inline std::string trim(const std::string& s)
	{
		auto ltrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_first_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s.remove_prefix(i);
			else                       s = std::string_view();

			return s;
		};

		auto rtrim = [](std::string_view& s) -> std::string_view& {
			auto i = s.find_last_not_of(" \t\n\r\f\v");
			if(i != std::string::npos) s = s.substr(0, i + 1);

			return s;
		};

		std::string_view sv = s;
		return std::string(rtrim(ltrim(sv)));
	}

	static inline std::string lowercase(std::string xs)
	{
		for(size_t i = 0; i < xs.size(); i++)
			xs[i] = tolower(static_cast<unsigned char>(xs[i]));

		return xs;
	}

	static inline std::string uppercase(std::string xs)
	{
		for(size_t i = 0; i < xs.size(); i++)
			xs[i] = toupper(static_cast<unsigned char>(xs[i]));

		return xs;
	}

	static inline bool isDigits(const std::string& s)
	{
		return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) -> bool {
			return c >= '0' && c <= '9';
		});
	}

	static inline bool equalsIgnoreCase(const std::string& a, const std::string& b)
	{
		return a.size() == b.size() && lowercase(a) == lowercase(b);
	}

	template <typename Container>
	static inline bool containsIgnoreCase(const Container& xs, const std::string& x)
	{
		return std::any_of(xs.begin(), xs.end(), [&x](const std::string& y) -> bool {
			return equalsIgnoreCase(x, y);
		});
	}

	static inline std::string join(const std::vector<std::string>& xs, const std::string& sep)
	{
		std::string ret;
		for(size_t i = 0; i < xs.size(); i++)
		{
			ret += xs[i];
			if(i + 1 != xs.size())
				ret += sep;
		}

		return ret;
	}

	static inline std::string plural(const std::string& thing, size_t count)
	{
		if(count == 1) return thing;
		return thing + "s";
	}

	std::string getEnvironmentVar(const std::string& name);

	std::string sanitiseFilename(std::string name);
}

namespace args
{
	std::vector<std::string> parseCmdLineOpts(int argc, char** argv);
}

namespace config
{
	void readConfig();

	std::string getConfigPath();
	std::string getOutputFolder();
	std::string getArchiveFolder();
	std::string getManualSeriesTitle();

	std::vector<std::string> getIgnoredExtensions();
	std::vector<std::string> getIgnoredFiles();
	std::vector<std::string> getIgnoredFolders();
	std::vector<std::string> getSpecialFolders();

	bool isDryRun();
	bool isPrintingJson();
	bool shouldArchive();
	bool shouldStopOnError();
	int getSeasonNumber();

	void setConfigPath(const std::string& x);
	void setOutputFolder(const std::string& x);
	void setArchiveFolder(const std::string& x);
	void setManualSeriesTitle(const std::string& x);

	void setIgnoredExtensions(const std::vector<std::string>& xs);
	void setIgnoredFiles(const std::vector<std::string>& xs);
	void setIgnoredFolders(const std::vector<std::string>& xs);
	void setSpecialFolders(const std::vector<std::string>& xs);

	void setIsDryRun(bool x);
	void setIsPrintingJson(bool x);
	void setShouldArchive(bool x);
	void setShouldStopOnError(bool x);
	void setSeasonNumber(int x);
}

namespace arrange
{
	struct Plan;
	struct Operation;
	struct FolderInput;
}

namespace driver
{
	std::optional<arrange::FolderInput> scanFolder(const std::fs::path& folder);

	bool executeOperation(const arrange::Operation& op, const std::fs::path& outputRoot);
	bool archiveFolder(const std::fs::path& folder);

	// move by copying, then removing the source; for when rename() can't cross filesystems.
	bool copyFolder(const std::fs::path& src, const std::fs::path& dest);

	void printJson(const arrange::Plan& plan);

	// returns the process exit status.
	int run(const std::vector<std::string>& folders);
}
