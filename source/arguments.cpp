// arguments.cpp
// Copyright (c) 2014 - 2017, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"

#define ARG_HELP                    "--help"
#define ARG_TITLE                   "--title"
#define ARG_CONFIG_PATH             "--config"
#define ARG_MANUAL_SEASON           "--season"
#define ARG_DRY_RUN                 "--dry-run"
#define ARG_LOG_LEVEL               "--log-level"
#define ARG_NO_ARCHIVE              "--no-archive"
#define ARG_PRINT_JSON              "--print-json"
#define ARG_OUTPUT_FOLDER           "--output-folder"
#define ARG_STOP_ON_ERROR           "--stop-on-error"
#define ARG_ARCHIVE_FOLDER          "--archive-folder"


static std::vector<std::pair<std::string, std::string>> helpList;
static void setupMap()
{
	helpList.push_back({ ARG_HELP,
		"show this help"
	});

	helpList.push_back({ ARG_DRY_RUN,
		"do everything normally, but do not create links or move folders"
	});

	helpList.push_back({ ARG_LOG_LEVEL + std::string(" <level>"),
		"only show messages at or above the given level (DEBUG, INFO, WARNING, ERROR, CRITICAL)"
	});

	helpList.push_back({ ARG_CONFIG_PATH + std::string(" <path>"),
		"set the path to the configuration file to use"
	});

	helpList.push_back({ ARG_OUTPUT_FOLDER + std::string(" <path_to_folder>"),
		"the library root to link arranged files into; will be created if it doesn't exist"
	});

	helpList.push_back({ ARG_ARCHIVE_FOLDER + std::string(" <path_to_folder>"),
		"move each successfully arranged input folder into this folder"
	});

	helpList.push_back({ ARG_NO_ARCHIVE,
		"do not archive input folders, even if an archive folder is configured"
	});

	helpList.push_back({ ARG_TITLE + std::string(" <title>"),
		"use the given series title for every input folder, instead of the one parsed from the folder name"
	});

	helpList.push_back({ ARG_MANUAL_SEASON + std::string(" <number>"),
		"use the given season number for every file, instead of the one parsed from the names"
	});

	helpList.push_back({ ARG_PRINT_JSON,
		"print the computed plan as json to stdout"
	});

	helpList.push_back({ ARG_STOP_ON_ERROR,
		"exit immediately without processing further folders, if any error is encountered"
	});
}

static void printHelp()
{
	if(helpList.empty())
		setupMap();

	printf("usage: arrangeinator [options] <folders>\n\n");

	printf("options:\n");

	size_t maxl = 0;
	for(const auto& p : helpList)
	{
		if(p.first.length() > maxl)
			maxl = p.first.length();
	}

	maxl += 4;

	// ok
	for(const auto& [ opt, desc ] : helpList)
		printf("  %s%s%s\n", opt.c_str(), std::string(maxl - opt.length(), ' ').c_str(), desc.c_str());

	printf("\n");
}






namespace args
{
	[[noreturn]] static void expected(const char* what, const char* opt)
	{
		util::critical("%serror:%s expected %s after '%s' option", COLOUR_RED_BOLD, COLOUR_RESET, what, opt);
		exit(2);
	}

	std::vector<std::string> parseCmdLineOpts(int argc, char** argv)
	{
		// quick thing: usually programs will not do anything if --help or --version is anywhere in the flags.
		for(int i = 1; i < argc; i++)
		{
			if(!strcmp(argv[i], ARG_HELP))
			{
				printHelp();
				exit(0);
			}
		}

		// the config file is read before the other flags, so they can override it.
		for(int i = 1; i < argc; i++)
		{
			if(!strcmp(argv[i], ARG_CONFIG_PATH))
			{
				if(i == argc - 1)
					expected("path", argv[i]);

				config::setConfigPath(argv[i + 1]);
				if(!std::fs::exists(argv[i + 1]))
				{
					util::critical("%serror:%s configuration file '%s' does not exist", COLOUR_RED_BOLD, COLOUR_RESET,
						argv[i + 1]);
					exit(2);
				}
			}
		}

		config::readConfig();

		std::vector<std::string> folders;
		if(argc > 1)
		{
			// parse the command line opts
			for(int i = 1; i < argc; i++)
			{
				if(!strcmp(argv[i], ARG_CONFIG_PATH))
				{
					// already handled.
					i++;
					continue;
				}
				else if(!strcmp(argv[i], ARG_DRY_RUN))
				{
					config::setIsDryRun(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_NO_ARCHIVE))
				{
					config::setShouldArchive(false);
					continue;
				}
				else if(!strcmp(argv[i], ARG_PRINT_JSON))
				{
					config::setIsPrintingJson(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_STOP_ON_ERROR))
				{
					config::setShouldStopOnError(true);
					continue;
				}
				else if(!strcmp(argv[i], ARG_LOG_LEVEL))
				{
					if(i == argc - 1)
						expected("level", argv[i]);

					i++;
					if(auto lvl = util::parseLogLevel(argv[i]); lvl)
					{
						util::set_log_level(*lvl);
						continue;
					}

					util::critical("%serror:%s invalid log level '%s' (expected DEBUG, INFO, WARNING, ERROR or CRITICAL)",
						COLOUR_RED_BOLD, COLOUR_RESET, argv[i]);
					exit(2);
				}
				else if(!strcmp(argv[i], ARG_OUTPUT_FOLDER))
				{
					if(i == argc - 1)
						expected("path", argv[i]);

					i++;
					config::setOutputFolder(argv[i]);
					continue;
				}
				else if(!strcmp(argv[i], ARG_ARCHIVE_FOLDER))
				{
					if(i == argc - 1)
						expected("path", argv[i]);

					i++;
					config::setArchiveFolder(argv[i]);
					continue;
				}
				else if(!strcmp(argv[i], ARG_TITLE))
				{
					if(i == argc - 1)
						expected("string", argv[i]);

					i++;
					auto title = util::trim(argv[i]);
					if(title.empty())
						expected("non-empty string", argv[i - 1]);

					config::setManualSeriesTitle(title);
					continue;
				}
				else if(!strcmp(argv[i], ARG_MANUAL_SEASON))
				{
					if(i == argc - 1)
						expected("(non-negative) integer", argv[i]);

					i++;
					std::string str = argv[i];

					if(!util::isDigits(str) || str.size() > 4)
						expected("(non-negative) integer", argv[i - 1]);

					config::setSeasonNumber(std::stoi(str));
					continue;
				}
				else if(argv[i][0] == '-' && argv[i][1] != 0)
				{
					util::critical("%serror:%s unrecognised option '%s'", COLOUR_RED_BOLD, COLOUR_RESET,
						argv[i]);
					exit(2);
				}
				else
				{
					folders.push_back(argv[i]);
				}
			}
		}

		if(folders.empty())
		{
			util::critical("%serror:%s no input folders",
				COLOUR_RED_BOLD, COLOUR_RESET);
			exit(2);
		}

		if(config::getOutputFolder().empty())
		{
			util::critical("%serror:%s output folder must be specified ('%s', or 'output-folder' in the config file)",
				COLOUR_RED_BOLD, COLOUR_RESET, ARG_OUTPUT_FOLDER);
			exit(2);
		}

		return folders;
	}
}
