/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/19/2024.
//

#include "Configuration.hh"

#include "common/Error.hh"

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>

namespace po = boost::program_options;

namespace atd {
namespace {

// Relative paths in the configuration file are relative to the file itself.
fs::path resolve(const std::string& value, const fs::path& base)
{
	return fs::absolute(expand_user(value), base).lexically_normal();
}

} // end of local namespace

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help,h",          "produce help message")
		("verbose,v",       "log debug messages")
		("cfg",             po::value<std::string>()->value_name("path"),
			"Configuration file. Use environment variable AUDIOTIDY_CONFIG to set default path.")
		("root",            po::value<std::vector<std::string>>()->composing()->value_name("path"), "library root, can be repeated")
		("jobs,j",          po::value<std::size_t>()->value_name("n"),          "number of scanning threads")
		("dedupe-mode",     po::value<std::string>()->value_name("mode"),       "off, delete, move or skip")
		("dupe-dir",        po::value<std::string>()->value_name("path"),       "where duplicates are moved to")
		("layout",          po::value<std::string>()->value_name("template"),   "rename files to this layout, e.g. \"{artist}/{album}/{track:02} {title}\"")
		("art-only",        "plan only album art fetches")
		("output,o",        po::value<std::string>()->value_name("file"),       "write the plan to this file")
		("dry-run,n",       "do not touch any file")
		("force,f",         "also apply operations that need review")
		("sort",            po::value<std::string>()->default_value("digest")->value_name("order"), "order of groups: digest or size")
		("export",          po::value<std::string>()->value_name("format"),     "export groups as csv or json")
		("template",        po::value<std::string>()->value_name("template"),   "rename template for the \"rename\" override")
		("kind",            po::value<std::string>()->value_name("type"),       "only list plan operations of this type")
		("format",          po::value<std::string>()->value_name("format"),     "file name format for the meta commands, e.g. \"%artist% - %title%\"")
		("json",            "print reports as JSON")
		("command",         po::value<std::string>(),                           "sub-command")
		("args",            po::value<std::vector<std::string>>(),              "arguments of the sub-command")
	;

	po::positional_options_description positional;
	positional.add("command", 1).add("args", -1);

	if (argc > 0)
	{
		po::store(po::command_line_parser(argc, argv).options(m_desc).positional(positional).run(), m_args);
		po::notify(m_args);
	}

	if (auto cmd = option<std::string>("command"))
		m_command = *cmd;
	if (auto args = option<std::vector<std::string>>("args"))
		m_arguments = *args;

	// no need for other options when --help is specified
	if (!help())
	{
		if (auto cfg = option<std::string>("cfg"))
			load_config(expand_user(*cfg), true);
		else
			load_config(expand_user(env ? std::string{env} : std::string{constants::config_filename}), false);

		apply_command_line();
	}
}

void Configuration::usage(std::ostream &out) const
{
	out << "Usage: audiotidy <command> [options] [arguments]\n\n"
		"Commands:\n"
		"  scan                           scan the library roots\n"
		"  plan                           compute a plan\n"
		"  apply <plan.json>              apply a plan\n"
		"  undo <journal-id|last>         undo an applied plan\n"
		"  groups                         list duplicate groups\n"
		"  override <group> <action> <pattern>\n"
		"                                 set an override for group members\n"
		"  review <group> <command...>    run one review command on a group\n"
		"  actions <plan.json>            list operations of a plan\n"
		"  analyze                        library statistics\n"
		"  cache-stats                    inventory statistics\n"
		"  meta-check [path...]           compare file names with their tags\n"
		"  meta-fix [path...]             rename files after their tags\n"
		"  meta-report <out> [path...]    write the meta-check report to a file\n"
		"  doctor                         check external tools\n\n"
		<< m_desc;
}

void Configuration::load_config(const fs::path& path, bool required)
{
	try
	{
		// the default configuration file is optional
		if (!required && !fs::exists(path))
			return;

		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION((FileError()
				<< ErrorCode{std::error_code{errno, std::system_category()}}
			));
		}

		auto json = nlohmann::json::parse(config_file);
		using jptr = nlohmann::json::json_pointer;

		auto base = path.parent_path();
		if (auto roots = json.value(jptr{"/library/roots"}, std::vector<std::string>{}); !roots.empty())
		{
			m_roots.clear();
			for (auto&& root : roots)
				m_roots.push_back(resolve(root, base));
		}

		if (auto db = json.value(jptr{"/library/database"}, std::string{}); !db.empty())
			m_database = resolve(db, base);
		if (auto dir = json.value(jptr{"/library/journal_dir"}, std::string{}); !dir.empty())
			m_journal_dir = resolve(dir, base);
		if (auto dir = json.value(jptr{"/library/dupe_dir"}, std::string{}); !dir.empty())
			m_dupe_dir = resolve(dir, base);
		if (auto dir = json.value(jptr{"/library/quarantine/dir"}, std::string{}); !dir.empty())
			m_quarantine.dir = resolve(dir, base);
		if (auto layout = json.value(jptr{"/library/layout"}, std::string{}); !layout.empty())
			m_layout = layout;
		if (auto format = json.value(jptr{"/library/filename_format"}, std::string{}); !format.empty())
			m_filename_format = format;
		m_tags_override_filename = json.value(jptr{"/library/tags_override_filename"}, m_tags_override_filename);

		m_jobs                  = std::max(std::size_t{1}, json.value(jptr{"/library/jobs"}, m_jobs));
		m_prefer_lossless       = json.value(jptr{"/library/prefer_lossless"}, m_prefer_lossless);
		m_confidence_threshold  = json.value(jptr{"/library/confidence_threshold"}, m_confidence_threshold);
		m_thresholds.auto_accept_above    = json.value(jptr{"/library/thresholds/auto_accept_above"},    m_thresholds.auto_accept_above);
		m_thresholds.require_review_below = json.value(jptr{"/library/thresholds/require_review_below"}, m_thresholds.require_review_below);
		m_quarantine.enabled    = json.value(jptr{"/library/quarantine/enabled"}, m_quarantine.enabled);

		auto mode = json.value(jptr{"/library/dedupe_mode"}, std::string{to_string(m_dedupe_mode)});
		if (auto parsed = parse_dedupe_mode(mode))
			m_dedupe_mode = *parsed;
		else
			BOOST_THROW_EXCEPTION(Error() << Message{"invalid dedupe_mode \"" + mode + "\""});

		if (auto fpcalc = json.value(jptr{"/tools/fpcalc"}, std::string{}); !fpcalc.empty())
			m_fpcalc = fpcalc.find('/') == std::string::npos ? fs::path{fpcalc} : resolve(fpcalc, base);
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(Error() << Message{e.what()} << Path{path});
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
}

void Configuration::apply_command_line()
{
	if (auto roots = option<std::vector<std::string>>("root"))
		m_roots = absolute_paths(std::vector<fs::path>(roots->begin(), roots->end()));
	if (auto jobs = option<std::size_t>("jobs"))
		m_jobs = std::max(std::size_t{1}, *jobs);
	if (auto dir = option<std::string>("dupe-dir"))
		m_dupe_dir = absolute_path(*dir);
	if (auto layout = option<std::string>("layout"))
		m_layout = *layout;
	if (auto format = option<std::string>("format"))
		m_filename_format = *format;
	if (auto mode = option<std::string>("dedupe-mode"))
	{
		auto parsed = parse_dedupe_mode(*mode);
		if (!parsed)
			BOOST_THROW_EXCEPTION(Error() << Message{"invalid --dedupe-mode \"" + *mode + "\""});
		m_dedupe_mode = *parsed;
	}
}

ScanOptions Configuration::scan_options() const
{
	return {m_roots, m_jobs};
}

GroupOptions Configuration::group_options() const
{
	auto sort = option<std::string>("sort");
	return {m_prefer_lossless, sort && *sort == "size" ? GroupOrder::size : GroupOrder::digest};
}

PlanOptions Configuration::plan_options() const
{
	PlanOptions opts;
	opts.roots                  = m_roots;
	opts.dedupe_mode            = m_dedupe_mode;
	opts.dupe_dir               = m_dupe_dir;
	opts.layout                 = m_layout;
	opts.art_only               = flag("art-only");
	opts.prefer_lossless        = m_prefer_lossless;
	opts.confidence_threshold   = m_confidence_threshold;
	opts.thresholds             = m_thresholds;
	return opts;
}

ApplyOptions Configuration::apply_options() const
{
	return {m_journal_dir, flag("dry-run"), flag("force"), m_quarantine};
}

UndoOptions Configuration::undo_options() const
{
	return {m_journal_dir, flag("dry-run")};
}

MetaOptions Configuration::meta_options(std::size_t first_path) const
{
	MetaOptions opts;
	if (m_arguments.size() > first_path)
		opts.roots = absolute_paths(std::vector<fs::path>(m_arguments.begin() + static_cast<std::ptrdiff_t>(first_path), m_arguments.end()));
	else
		opts.roots = m_roots;

	opts.format                 = m_filename_format;
	opts.tags_override_filename = m_tags_override_filename;
	opts.confidence_threshold   = m_confidence_threshold;
	opts.force                  = flag("force");
	return opts;
}

} // end of namespace
