// utils.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#include <errno.h>
#include <sys/stat.h>

#include <fstream>

namespace util
{
	std::string getEnvironmentVar(const std::string& name)
	{
		if(char* val = getenv(name.c_str()); val)
			return std::string(val);

		else
			return "";
	}


	size_t getFileSize(const std::string& path)
	{
		struct stat st;
		if(stat(path.c_str(), &st) != 0)
		{
			int err = errno;
			util::error("failed to get filesize for '%s' (error code %d / %s)", path, err, std::string(strerror(err)));

			return -1;
		}

		return st.st_size;
	}

	std::pair<uint8_t*, size_t> readEntireFile(const std::string& path)
	{
		auto bad = std::pair<uint8_t*, size_t>(nullptr, 0);

		auto sz = getFileSize(path);
		if(sz == static_cast<size_t>(-1)) return bad;

		// i'm lazy, so just use fstreams.
		auto fs = std::fstream(path);
		if(!fs.good()) return bad;


		uint8_t* buf = new uint8_t[sz + 1];
		fs.read(reinterpret_cast<char*>(buf), sz);
		fs.close();

		buf[sz] = 0;
		return std::pair(buf, sz);
	}

	std::string sanitiseFilename(std::string name)
	{
		const std::vector<char> blacklist = {
			'/', '\\', ':', '<', '>', '|', '"', '?', '*'
		};

		for(size_t i = 0; i < name.size(); i++)
		{
			if(std::find(blacklist.begin(), blacklist.end(), name[i]) != blacklist.end())
				name[i] = '_';
		}

		return name;
	}

	std::optional<LogLevel> parseLogLevel(const std::string& name)
	{
		auto n = uppercase(trim(name));

		if(n == "DEBUG")    return LogLevel::Debug;
		if(n == "INFO")     return LogLevel::Info;
		if(n == "WARNING")  return LogLevel::Warning;
		if(n == "ERROR")    return LogLevel::Error;
		if(n == "CRITICAL") return LogLevel::Critical;

		return std::nullopt;
	}



	static int log_indent = 0;
	static LogLevel log_level = LogLevel::Info;

	void indent_log(int n)              { log_indent += n; }
	void unindent_log(int n)            { log_indent = std::max(0, log_indent - n); }
	int get_log_indent()                { return log_indent; }

	void set_log_level(LogLevel lvl)    { log_level = lvl; }
	LogLevel get_log_level()            { return log_level; }
}
