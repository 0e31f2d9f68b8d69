// config.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include "picojson.h"

namespace pj = picojson;

namespace config
{
	static std::fs::path getDefaultConfigPath()
	{
		auto home = std::fs::path(util::getEnvironmentVar("HOME"));
		if(!home.empty())
		{
			auto x = home / ".config" / "arrangeinator" / "config.json";
			if(std::fs::exists(x))
				return x;
		}

		if(std::fs::exists("arrangeinator-config.json"))
			return std::fs::path("arrangeinator-config.json");

		if(std::fs::exists(".arrangeinator-config.json"))
			return std::fs::path(".arrangeinator-config.json");

		return "";
	}

	template <typename... Args>
	void error(const std::string& fmt, Args&&... args)
	{
		util::error(fmt, args...);
	}

	void readConfig()
	{
		// if there's a manual one, use that.
		std::fs::path path;
		if(auto cp = getConfigPath(); !cp.empty())
		{
			path = cp;
			if(!std::fs::exists(path))
			{
				util::error("specified configuration file '%s' does not exist", cp);
				return;
			}
		}
		else
		{
			path = getDefaultConfigPath();
		}

		// it's ok not to have one.
		if(path.empty())
			return;

		uint8_t* buf = 0; size_t sz = 0;
		std::tie(buf, sz) = util::readEntireFile(path.string());
		if(!buf || sz == 0)
		{
			error("failed to read config file '%s'", path.string());
			delete[] buf;
			return;
		}

		util::debug("reading config file '%s'", path.string());

		pj::value config;

		auto begin = buf;
		auto end = buf + sz;
		std::string err;
		pj::parse(config, begin, end, &err);

		delete[] buf;

		if(!err.empty())
		{
			error("%s", err);
			return;
		}

		// the top-level object should be "options".
		if(!config.is<pj::object>() || !config.contains("options") || !config.get("options").is<pj::object>())
		{
			error("no top-level 'options' object");
			return;
		}

		auto opts = config.get("options").get<pj::object>();

		auto get_string = [&opts](const std::string& key, const std::string& def) -> std::string {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<std::string>())
					return it->second.get<std::string>();

				else
					error("expected string value for '%s'", key);
			}

			return def;
		};

		auto get_bool = [&opts](const std::string& key, bool def) -> bool {
			if(auto it = opts.find(key); it != opts.end())
			{
				if(it->second.is<bool>())
					return it->second.get<bool>();

				else
					error("expected boolean value for '%s'", key);
			}

			return def;
		};

		// returns nothing when the key is missing, so the caller can keep its defaults.
		auto get_strings = [&opts](const std::string& key) -> std::optional<std::vector<std::string>> {
			auto it = opts.find(key);
			if(it == opts.end())
				return std::nullopt;

			if(!it->second.is<pj::array>())
			{
				error("expected array value for '%s'", key);
				return std::nullopt;
			}

			std::vector<std::string> ret;
			for(const auto& v : it->second.get<pj::array>())
			{
				if(v.is<std::string>() && !v.get<std::string>().empty())
					ret.push_back(v.get<std::string>());

				else
					error("expected string value in '%s'", key);
			}

			return ret;
		};

		if(auto x = get_string("output-folder", ""); !x.empty())
			setOutputFolder(x);

		if(auto x = get_string("archive-folder", ""); !x.empty())
			setArchiveFolder(x);

		if(auto x = get_string("log-level", ""); !x.empty())
		{
			if(auto lvl = util::parseLogLevel(x); lvl)
				util::set_log_level(*lvl);

			else
				error("invalid log level '%s' (expected DEBUG, INFO, WARNING, ERROR or CRITICAL)", x);
		}

		setShouldStopOnError(get_bool("stop-on-first-error", shouldStopOnError()));

		if(auto xs = get_strings("ignore-extensions"); xs)
			setIgnoredExtensions(*xs);

		if(auto xs = get_strings("ignore-files"); xs)
			setIgnoredFiles(*xs);

		if(auto xs = get_strings("ignore-folders"); xs)
			setIgnoredFolders(*xs);

		if(auto xs = get_strings("special-folders"); xs)
			setSpecialFolders(*xs);
	}



	static std::string configPath;
	static std::string outputFolder;
	static std::string archiveFolder;
	static std::string manualSeriesTitle;

	static std::vector<std::string> ignoredExtensions = {
		".zip", ".rar", ".7z", ".tar", ".gz", ".xz", ".png", ".txt"
	};

	static std::vector<std::string> ignoredFiles = { ".DS_Store", "Thumbs.db" };
	static std::vector<std::string> ignoredFolders = { "Scans", "Fonts", "CDs" };

	static std::vector<std::string> specialFolders = {
		"SPs", "SP", "Specials", "Special", "Extras", "Extra", "Bonus", "映像特典", "特典", "OVA", "OAD"
	};

	static bool dryrun = false;
	static bool printJson = false;
	static bool archive = true;
	static bool stopOnError = false;

	// 0 is a valid season.
	static int manualSeasonNumber = -1;


	std::string getConfigPath()                         { return configPath; }
	std::string getOutputFolder()                       { return outputFolder; }
	std::string getArchiveFolder()                      { return archiveFolder; }
	std::string getManualSeriesTitle()                  { return manualSeriesTitle; }
	std::vector<std::string> getIgnoredExtensions()     { return ignoredExtensions; }
	std::vector<std::string> getIgnoredFiles()          { return ignoredFiles; }
	std::vector<std::string> getIgnoredFolders()        { return ignoredFolders; }
	std::vector<std::string> getSpecialFolders()        { return specialFolders; }
	bool isDryRun()                                     { return dryrun; }
	bool isPrintingJson()                               { return printJson; }
	bool shouldArchive()                                { return archive && !archiveFolder.empty(); }
	bool shouldStopOnError()                            { return stopOnError; }
	int getSeasonNumber()                               { return manualSeasonNumber; }

	void setConfigPath(const std::string& x)                        { configPath = x; }
	void setOutputFolder(const std::string& x)                      { outputFolder = x; }
	void setArchiveFolder(const std::string& x)                     { archiveFolder = x; }
	void setManualSeriesTitle(const std::string& x)                 { manualSeriesTitle = x; }
	void setIgnoredExtensions(const std::vector<std::string>& xs)   { ignoredExtensions = xs; }
	void setIgnoredFiles(const std::vector<std::string>& xs)        { ignoredFiles = xs; }
	void setIgnoredFolders(const std::vector<std::string>& xs)      { ignoredFolders = xs; }
	void setSpecialFolders(const std::vector<std::string>& xs)      { specialFolders = xs; }
	void setIsDryRun(bool x)                                        { dryrun = x; }
	void setIsPrintingJson(bool x)                                  { printJson = x; }
	void setShouldArchive(bool x)                                   { archive = x; }
	void setShouldStopOnError(bool x)                               { stopOnError = x; }
	void setSeasonNumber(int x)                                     { manualSeasonNumber = x; }
}
