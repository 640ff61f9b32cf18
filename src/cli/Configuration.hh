/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/19/2024.
//

#pragma once

#include "common/Exception.hh"
#include "common/FS.hh"
#include "library/Applier.hh"
#include "library/DuplicateGroup.hh"
#include "library/Meta.hh"
#include "library/Planner.hh"
#include "library/Scanner.hh"
#include "library/Undo.hh"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

#include "config.hh"

#include <algorithm>
#include <iosfwd>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace atd {

/// \brief  Parsing command line options and configuration file
///
/// Options on the command line win over the configuration file. Each
/// component gets its own copy of the settings it needs.
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};

public:
	Configuration() = default;
	Configuration(int argc, const char *const *argv, const char *env);

	bool help() const {return m_args.count("help") > 0;}
	bool verbose() const {return m_args.count("verbose") > 0;}
	void usage(std::ostream& out) const;

	// Sub-command and its positional arguments, e.g. "apply" and {"plan.json"}.
	const std::string& command() const {return m_command;}
	const std::vector<std::string>& arguments() const {return m_arguments;}

	template <typename T>
	std::optional<T> option(const std::string& name) const
	{
		return m_args.count(name) > 0 ? std::optional<T>{m_args[name].as<T>()} : std::nullopt;
	}
	bool flag(const std::string& name) const {return m_args.count(name) > 0;}

	const fs::path& database() const {return m_database;}
	const fs::path& fpcalc() const {return m_fpcalc;}

	ScanOptions scan_options() const;
	GroupOptions group_options() const;
	PlanOptions plan_options() const;
	ApplyOptions apply_options() const;
	UndoOptions undo_options() const;

	// Paths are the sub-command arguments from "first_path" on, or the library roots.
	MetaOptions meta_options(std::size_t first_path = 0) const;
	DedupeMode dedupe_mode() const {return m_dedupe_mode;}

	void load_config(const fs::path& path, bool required);

private:
	void apply_command_line();

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	std::string                 m_command;
	std::vector<std::string>    m_arguments;

	std::vector<fs::path>       m_roots;
	fs::path                    m_database{expand_user(std::string{constants::database_filename})};
	fs::path                    m_journal_dir{expand_user(std::string{constants::journal_dir})};
	fs::path                    m_fpcalc{"fpcalc"};
	std::size_t                 m_jobs{std::max(1U, std::thread::hardware_concurrency())};

	bool                        m_prefer_lossless{true};
	DedupeMode                  m_dedupe_mode{DedupeMode::move};
	std::optional<fs::path>     m_dupe_dir;
	std::optional<std::string>  m_layout;
	double                      m_confidence_threshold{0.85};
	Thresholds                  m_thresholds;
	QuarantineOptions           m_quarantine{true, std::nullopt};

	std::string                 m_filename_format{constants::filename_format};
	bool                        m_tags_override_filename{true};
};

} // end of namespace
