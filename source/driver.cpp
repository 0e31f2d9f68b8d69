// driver.cpp
// Copyright (c) 2019, zhiayang
// Licensed under the Apache License Version 2.0.

#include "defs.h"
#include "arrange.h"

#include "picojson.h"

namespace pj = picojson;

namespace driver
{
	static bool isIgnoredFile(const std::fs::path& path)
	{
		auto name = path.filename().string();
		if(util::containsIgnoreCase(config::getIgnoredFiles(), name))
			return true;

		auto ext = path.extension().string();
		return !ext.empty() && util::containsIgnoreCase(config::getIgnoredExtensions(), ext);
	}

	std::optional<arrange::FolderInput> scanFolder(const std::fs::path& folder)
	{
		if(!std::fs::exists(folder))
		{
			util::error("skipping nonexistent folder '%s'", folder.string());
			return std::nullopt;
		}
		else if(!std::fs::is_directory(folder))
		{
			util::error("skipping '%s': not a directory", folder.string());
			return std::nullopt;
		}

		auto root = folder;
		if(root.filename().empty())
			root = root.parent_path();

		arrange::FolderInput ret;
		ret.path = folder.string();

		std::vector<std::fs::path> files;

		try
		{
			auto it = std::fs::recursive_directory_iterator(root);
			for(auto end = std::fs::recursive_directory_iterator(); it != end; ++it)
			{
				const auto& path = it->path();
				if(it->is_directory())
				{
					if(util::containsIgnoreCase(config::getIgnoredFolders(), path.filename().string()))
					{
						util::debug("ignoring folder '%s'", path.filename().string());
						it.disable_recursion_pending();
					}

					continue;
				}

				if(!it->is_regular_file())
					continue;

				if(isIgnoredFile(path))
				{
					util::debug("ignoring file '%s'", path.filename().string());
					continue;
				}

				files.push_back(path);
			}
		}
		catch(const std::fs::filesystem_error& e)
		{
			util::error("failed to scan '%s': %s", folder.string(), std::string(e.what()));
			return std::nullopt;
		}

		std::sort(files.begin(), files.end());

		for(const auto& path : files)
		{
			arrange::RawEntry entry;
			entry.folderName = root.filename().string();
			entry.fileName = path.filename().string();

			auto ext = path.extension().string();
			if(!ext.empty())
				entry.extension = ext.substr(1);

			for(const auto& dir : path.parent_path().lexically_relative(root))
			{
				if(auto d = dir.string(); !d.empty() && d != ".")
					entry.relativeSubpath.push_back(d);
			}

			ret.entries.push_back(entry);
		}

		return ret;
	}


	bool executeOperation(const arrange::Operation& op, const std::fs::path& outputRoot)
	{
		if(op.kind != arrange::OperationKind::Hardlink)
			return false;

		auto target = outputRoot / std::fs::u8path(op.targetPath);

		if(config::isDryRun())
		{
			util::log("dryrun: link '%s' -> '%s'", op.sourcePath, target.string());
			return true;
		}

		try
		{
			std::fs::create_directories(target.parent_path());

			if(std::fs::exists(target))
			{
				// an earlier run already linked it.
				if(std::fs::equivalent(target, op.sourcePath))
				{
					util::debug("'%s' already linked", target.string());
					return true;
				}

				util::error("IOFailure: target '%s' already exists", target.string());
				return false;
			}

			std::fs::create_hard_link(op.sourcePath, target);
			util::log("%s", op.targetPath);
		}
		catch(const std::fs::filesystem_error& e)
		{
			util::error("IOFailure: failed to link '%s': %s", op.sourcePath, std::string(e.what()));
			return false;
		}

		return true;
	}

	bool archiveFolder(const std::fs::path& folder)
	{
		auto src = folder;
		if(src.filename().empty())
			src = src.parent_path();

		auto dest = std::fs::path(config::getArchiveFolder()) / src.filename();

		if(config::isDryRun())
		{
			util::log("dryrun: archive '%s' -> '%s'", src.string(), dest.string());
			return true;
		}

		if(std::fs::exists(dest))
		{
			util::warn("not archiving '%s': '%s' already exists", src.string(), dest.string());
			return false;
		}

		try
		{
			std::fs::create_directories(dest.parent_path());

			std::error_code ec;
			std::fs::rename(src, dest, ec);

			if(ec == std::errc::cross_device_link)
			{
				util::debug("'%s' is on another filesystem; copying", dest.parent_path().string());
				if(!copyFolder(src, dest))
					return false;
			}
			else if(ec)
			{
				util::error("IOFailure: failed to archive '%s': %s", src.string(), ec.message());
				return false;
			}

			util::info("archived to '%s'", dest.string());
		}
		catch(const std::fs::filesystem_error& e)
		{
			util::error("IOFailure: failed to archive '%s': %s", src.string(), std::string(e.what()));
			return false;
		}

		return true;
	}

	bool copyFolder(const std::fs::path& src, const std::fs::path& dest)
	{
		if(std::fs::exists(dest))
		{
			util::error("IOFailure: not copying '%s': '%s' already exists", src.string(), dest.string());
			return false;
		}

		std::error_code ec;
		std::fs::copy(src, dest, std::fs::copy_options::recursive, ec);

		if(ec)
		{
			util::error("IOFailure: failed to copy '%s' to '%s': %s", src.string(), dest.string(), ec.message());

			// don't leave half a copy behind.
			std::error_code rm;
			std::fs::remove_all(dest, rm);

			if(rm)
				util::warn("left a partial copy at '%s': %s", dest.string(), rm.message());

			return false;
		}

		std::fs::remove_all(src, ec);
		if(ec)
		{
			util::error("IOFailure: copied '%s', but failed to remove it: %s", src.string(), ec.message());
			return false;
		}

		return true;
	}




	static pj::value toJson(const arrange::SeriesMetadata& meta)
	{
		pj::object obj;
		obj["title"] = pj::value(meta.title);
		obj["season"] = pj::value(static_cast<double>(meta.season));
		obj["episode"] = meta.episode ? pj::value(static_cast<double>(*meta.episode)) : pj::value();
		obj["special"] = pj::value(meta.isSpecial);

		if(meta.specialTag)
		{
			pj::object tag;
			tag["kind"] = pj::value(arrange::SpecialClassifier::kindName(meta.specialTag->kind));
			tag["index"] = meta.specialTag->index ? pj::value(static_cast<double>(*meta.specialTag->index)) : pj::value();
			tag["label"] = pj::value(arrange::specialName(*meta.specialTag));

			obj["special-tag"] = pj::value(tag);
		}

		pj::array langs;
		for(const auto& l : meta.languageTags)
			langs.push_back(pj::value(l.normalized));

		obj["languages"] = pj::value(langs);
		obj["extension"] = pj::value(meta.extension);

		return pj::value(obj);
	}

	static pj::value toJson(const std::vector<std::string>& xs)
	{
		pj::array arr;
		for(const auto& x : xs)
			arr.push_back(pj::value(x));

		return pj::value(arr);
	}

	void printJson(const arrange::Plan& plan)
	{
		pj::array folders;
		for(size_t i = 0; i < plan.folders.size(); i++)
		{
			const auto& fp = plan.folders[i];

			pj::object folder;
			folder["path"] = pj::value(fp.path);
			folder["title"] = pj::value(fp.info.title);
			folder["groups"] = toJson(fp.info.groups);
			folder["formats"] = toJson(fp.info.formats);
			folder["episode-range"] = pj::value(fp.info.episodeRange);
			folder["season"] = fp.info.season ? pj::value(static_cast<double>(*fp.info.season)) : pj::value();
			folder["failed"] = pj::value(fp.failed);

			pj::array ops;
			for(auto k : fp.operations)
			{
				const auto& op = plan.operations[k];

				pj::object o;
				o["source"] = pj::value(op.sourcePath);
				o["target"] = pj::value(op.targetPath);
				o["action"] = pj::value(op.kind == arrange::OperationKind::Hardlink ? "hardlink" : "skip-duplicate");
				o["metadata"] = toJson(op.meta);

				ops.push_back(pj::value(o));
			}

			folder["operations"] = pj::value(ops);

			pj::array warns;
			for(const auto& w : plan.warnings)
			{
				if(w.folder != i)
					continue;

				pj::object o;
				o["kind"] = pj::value(arrange::warningKindName(w.kind));
				o["source"] = pj::value(w.source);
				o["message"] = pj::value(w.message);

				warns.push_back(pj::value(o));
			}

			folder["warnings"] = pj::value(warns);
			folders.push_back(pj::value(folder));
		}

		zpr::println("%s", pj::value(folders).serialize(true));
	}





	static bool createOutputFolder(const std::fs::path& path)
	{
		if(!std::fs::exists(path))
		{
			if(config::isDryRun())
			{
				util::log("dryrun: create output folder '%s'", path.string());
				return true;
			}

			std::error_code ec;
			std::fs::create_directories(path, ec);

			if(ec) { util::critical("failed to create output folder '%s': %s", path.string(), ec.message()); return false; }
			else   { util::info("creating output folder '%s'", path.string()); }
		}
		else if(!std::fs::is_directory(path))
		{
			util::critical("%serror:%s specified output path '%s' is not a directory",
				COLOUR_RED_BOLD, COLOUR_RESET, path.string());
			return false;
		}

		return true;
	}

	int run(const std::vector<std::string>& folders)
	{
		auto output = std::fs::path(config::getOutputFolder());
		if(!createOutputFolder(output))
			return 2;

		auto vocab = arrange::Vocabulary::defaults();
		vocab.specialFolders = config::getSpecialFolders();

		auto opts = arrange::Options();
		opts.titleOverride = config::getManualSeriesTitle();
		opts.seasonOverride = config::getSeasonNumber();

		if(!opts.titleOverride.empty())
			util::info("using manual title '%s'", opts.titleOverride);

		if(opts.seasonOverride >= 0)
			util::info("using manual season %d", opts.seasonOverride);

		util::info("received %zu %s", folders.size(), util::plural("folder", folders.size()));

		size_t failedFolders = 0;

		std::vector<arrange::FolderInput> inputs;
		for(const auto& f : folders)
		{
			if(auto input = scanFolder(std::fs::path(f)); input)
			{
				inputs.push_back(*input);
				continue;
			}

			failedFolders += 1;
			if(config::shouldStopOnError())
				return 1;
		}

		auto arranger = arrange::Arranger(vocab, opts);
		auto plan = arranger.plan(inputs);

		if(config::isPrintingJson())
			printJson(plan);

		for(size_t i = 0; i < plan.folders.size(); i++)
		{
			const auto& fp = plan.folders[i];

			util::log("%s", fp.name);
			util::indent_log();

			util::info("title: %s", fp.info.title);

			for(const auto& w : plan.warnings)
			{
				if(w.folder == i)
					util::warn("%s: %s: %s", arrange::warningKindName(w.kind), w.source, w.message);
			}

			bool ok = !fp.failed;
			size_t linked = 0;

			for(auto k : fp.operations)
			{
				const auto& op = plan.operations[k];
				if(op.kind == arrange::OperationKind::SkipDuplicate)
				{
					util::debug("skipping '%s' (duplicate target)", op.sourcePath);
					continue;
				}

				if(executeOperation(op, output))
				{
					linked += 1;
				}
				else
				{
					ok = false;
					if(config::shouldStopOnError())
						break;
				}
			}

			util::info("linked %zu %s", linked, util::plural("file", linked));

			if(ok && config::shouldArchive())
			{
				// a folder that can't be archived is still arranged.
				if(!archiveFolder(fp.path))
					util::warn("leaving '%s' in place", fp.path);
			}

			util::unindent_log();
			zpr::println("");

			if(!ok)
			{
				failedFolders += 1;
				if(config::shouldStopOnError())
				{
					util::error("stopping after first error");
					return 1;
				}
			}
		}

		util::info("processed %zu %s, %zu failed", folders.size(), util::plural("folder", folders.size()), failedFolders);
		return failedFolders > 0 ? 1 : 0;
	}
}
