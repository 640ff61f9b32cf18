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
#include "common/Log.hh"
#include "library/Library.hh"
#include "media/Fpcalc.hh"
#include "media/TagLibProbe.hh"

#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/format.hpp>
#include <boost/throw_exception.hpp>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>

namespace atd {
namespace {

const std::string& argument(const Configuration& cfg, std::size_t index, const char *name)
{
	if (cfg.arguments().size() <= index)
		BOOST_THROW_EXCEPTION(Configuration::Error()
			<< Message{cfg.command() + ": missing argument <" + name + ">"}
		);
	return cfg.arguments()[index];
}

std::size_t group_id(const Configuration& cfg)
{
	auto& arg = argument(cfg, 0, "group-id");

	std::size_t id{};
	auto [end, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), id);
	if (ec != std::errc{} || end != arg.data() + arg.size())
		BOOST_THROW_EXCEPTION(Configuration::Error() << Message{"invalid group id \"" + arg + "\""});
	return id;
}

void print_groups(const std::vector<DuplicateGroup>& groups, std::ostream& out)
{
	for (auto&& group : groups)
	{
		out << boost::format("#%1% %2% (%3% files, %4%)\n")
			% group.id % group.digest.hex().substr(0, 12) % group.members.size() % format_bytes(group.total_bytes);

		for (std::size_t i = 0; i < group.members.size(); ++i)
		{
			auto& member = group.members[i];
			out << boost::format("  %1% %2%. %3% [%4% kbps, %5%]\n")
				% (i == group.canonical ? '*' : ' ') % (i+1) % member.path.string() % member.bitrate % format_bytes(member.size);
		}
	}

	auto stats = group_stats(groups);
	out << boost::format("%1% groups, %2% files, %3% reclaimable\n")
		% stats.groups % stats.duplicate_files % format_bytes(stats.reclaimable_bytes);
}

void print_operation(const Operation& op, std::ostream& out)
{
	out << boost::format("%1$-9s %2$-6s %3$.2f %4%")
		% op.type() % to_string(op.status) % op.confidence.value_or(0.0) % op.path.string();
	if (auto dest = op.new_path())
		out << " -> " << dest->string();
	out << "  (" << op.reason << ")\n";
}

int scan(Library& lib, const Configuration& cfg)
{
	auto stats = lib.scan(cfg.scan_options());
	for (auto&& failure : stats.failures)
		std::cout << "error: " << failure.path.string() << ": " << failure.cause << "\n";

	std::cout << boost::format("%1% files scanned, %2% hashed, %3% fingerprinted, %4% errors\n")
		% stats.files_scanned % stats.hashes_computed % stats.fingerprints_computed % stats.errors;
	return stats.errors == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int plan(Library& lib, const Configuration& cfg)
{
	auto plan = lib.plan(cfg.plan_options());
	if (auto output = cfg.option<std::string>("output"))
	{
		plan.save(*output);

		auto& sum = plan.summary;
		std::cout << boost::format("plan %1% written to %2%: %3% deletes, %4% moves, %5% renames, %6% reviews, %7% art fetches, %8% reclaimable\n")
			% plan.id % *output % sum.deletes % sum.moves % sum.renames % sum.reviews % sum.art_fetches
			% format_bytes(sum.estimated_reclaim_bytes);
	}
	else
		std::cout << nlohmann::json(plan).dump(2) << "\n";

	return EXIT_SUCCESS;
}

int print_result(const Applier::Result& result)
{
	auto& [journal, location] = result;

	std::map<std::string_view, std::size_t> counts;
	for (auto&& entry : journal.entries)
	{
		counts[to_string(entry.status)]++;
		if (entry.error)
			std::cout << "failed: " << entry.path.string() << ": " << *entry.error << "\n";
	}
	for (auto&& [status, count] : counts)
		std::cout << status << ": " << count << "\n";

	std::cout << "journal " << journal.id << " written to " << location.string() << "\n";
	return counts.count("failed") == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int apply(Library& lib, const Configuration& cfg)
{
	auto plan = Plan::load(argument(cfg, 0, "plan.json"));
	return print_result(lib.apply(plan, cfg.apply_options()));
}


int undo(Library& lib, const Configuration& cfg)
{
	auto id = cfg.arguments().empty() ? std::string{"last"} : cfg.arguments().front();
	auto report = lib.undo(id, cfg.undo_options());

	for (auto&& step : report.steps)
	{
		if (step.outcome == UndoOutcome::skipped)
			continue;

		std::cout << boost::format("%1$-15s %2%") % to_string(step.outcome) % step.path.string();
		if (step.error)
			std::cout << ": " << *step.error;
		std::cout << "\n";
	}
	return report.count(UndoOutcome::failed) == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int groups(Library& lib, const Configuration& cfg)
{
	auto groups = lib.groups(cfg.group_options());
	auto format = cfg.option<std::string>("export");
	if (!format)
		print_groups(groups, std::cout);
	else if (*format == "csv")
		export_csv(std::cout, groups, lib.inventory(), cfg.dedupe_mode());
	else if (*format == "json")
		std::cout << export_json(groups, lib.inventory(), cfg.dedupe_mode()).dump(2) << "\n";
	else
		BOOST_THROW_EXCEPTION(Configuration::Error() << Message{"unknown export format \"" + *format + "\""});

	return EXIT_SUCCESS;
}

int override_group(Library& lib, const Configuration& cfg)
{
	auto id     = group_id(cfg);
	auto& name  = argument(cfg, 1, "action");
	auto action = parse_action(name);
	if (!action)
		BOOST_THROW_EXCEPTION(InvalidOverride()
			<< ErrorCode{make_error_code(Error::invalid_override)}
			<< Message{"unknown action \"" + name + "\""}
		);

	auto intents = lib.set_override(id, *action, argument(cfg, 2, "pattern"), cfg.option<std::string>("template"), cfg.group_options());
	for (auto&& intent : intents)
		std::cout << to_string(intent.action) << " " << intent.path.string() << "\n";
	return EXIT_SUCCESS;
}

int review(Library& lib, const Configuration& cfg)
{
	auto id = group_id(cfg);
	std::vector<std::string> words{cfg.arguments().begin() + 1, cfg.arguments().end()};

	auto intent = lib.review(id, boost::algorithm::join(words, " "), cfg.group_options());
	switch (intent.command)
	{
	case ReviewIntent::Command::set:
		for (auto&& item : intent.overrides)
			std::cout << to_string(item.action) << " " << item.path.string() << "\n";
		return EXIT_SUCCESS;

	case ReviewIntent::Command::invalid:
		std::cout << intent.message << "\n";
		return EXIT_FAILURE;

	case ReviewIntent::Command::help:
		std::cout <<
			"<action> <target> [template]\n"
			"  actions: k(eep) d(elete) m(ove) r(ename) s(kip) review\n"
			"  target:  member number, glob pattern, or * for all\n"
			"next, quit, help\n";
		return EXIT_SUCCESS;

	default:
		return EXIT_SUCCESS;
	}
}

int actions(const Configuration& cfg)
{
	auto plan = Plan::load(argument(cfg, 0, "plan.json"));
	for (auto&& op : plan_actions(plan, cfg.option<std::string>("kind").value_or("")))
		print_operation(op, std::cout);
	return EXIT_SUCCESS;
}

int analyze(Library& lib, const Configuration& cfg)
{
	auto report = lib.analyze(cfg.group_options());
	if (cfg.flag("json"))
	{
		nlohmann::json json{
			{"summary", report},
			{"groups",  group_stats(lib.groups(cfg.group_options()))}
		};
		std::cout << json.dump(2) << "\n";
		return EXIT_SUCCESS;
	}

	std::cout << boost::format(
		"files:             %1%\n"
		"duplicate groups:  %2%\n"
		"duplicate files:   %3%\n"
		"missing art:       %4%\n"
		"reclaimable:       %5%\n"
	) % report.files_total % report.duplicate_groups % report.duplicate_files % report.missing_art
		% format_bytes(report.reclaimable_bytes);
	return EXIT_SUCCESS;
}

int meta_check(Library& lib, const Configuration& cfg)
{
	auto issues = lib.meta_check(cfg.meta_options());
	if (cfg.flag("json"))
		std::cout << nlohmann::json(issues).dump(2) << "\n";
	else if (issues.empty())
		std::cout << "No metadata issues found.\n";
	else
		for (auto&& issue : issues)
			std::cout << issue;

	return EXIT_SUCCESS;
}

int meta_report(Library& lib, const Configuration& cfg)
{
	fs::path out{argument(cfg, 0, "output path")};
	auto issues = lib.meta_check(cfg.meta_options(1));

	std::error_code ec;
	if (out.has_parent_path())
		fs::create_directories(out.parent_path(), ec);

	std::ofstream file{out.string()};
	if (ec || !file)
		BOOST_THROW_EXCEPTION((SystemError()
			<< ErrorCode{ec ? ec : std::error_code{errno, std::system_category()}}
			<< Path{out}
		));

	if (cfg.flag("json"))
		file << nlohmann::json(issues).dump(2) << "\n";
	else
		for (auto&& issue : issues)
			file << issue << "\n";

	std::cout << "Wrote report to " << out.string() << "\n";
	return EXIT_SUCCESS;
}

int meta_fix(Library& lib, const Configuration& cfg)
{
	auto [plan, skipped] = lib.meta_fix(cfg.meta_options());
	std::cout << "Files to rename: " << plan.operations.size() << "\n"
	          << "Skipped: " << skipped << "\n";

	if (plan.operations.empty())
		return EXIT_SUCCESS;

	return print_result(lib.apply(plan, cfg.apply_options()));
}

int cache_stats(Library& lib)
{
	auto stats = lib.cache_stats();
	std::cout << "files:        " << stats.files << "\n"
	          << "fingerprints: " << stats.fingerprints << "\n";
	return EXIT_SUCCESS;
}

int doctor(const Configuration& cfg)
{
	Fpcalc fpcalc{cfg.fpcalc()};
	auto exe = fpcalc.executable();
	std::cout << "fpcalc:   " << (exe.empty() ? "not found" : exe.string()) << "\n";

	bool ok = !exe.empty();
	try
	{
		Inventory inventory{cfg.database()};
		auto stats = inventory.stats();
		std::cout << "database: " << cfg.database().string() << " (" << stats.files << " files)\n";
	}
	catch (Inventory::Error& e)
	{
		std::cout << "database: " << cfg.database().string() << ": " << brief(e) << "\n";
		ok = false;
	}
	return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

int run(const Configuration& cfg)
{
	auto& cmd = cfg.command();
	if (cmd == "doctor")
		return doctor(cfg);
	if (cmd == "actions")
		return actions(cfg);

	if (auto dir = cfg.database().parent_path(); !dir.empty())
	{
		std::error_code ec;
		fs::create_directories(dir, ec);
		if (ec)
			BOOST_THROW_EXCEPTION(SystemError() << ErrorCode{ec} << Path{dir});
	}

	TagLibProbe probe;
	Fpcalc      fpcalc{cfg.fpcalc()};
	Library     lib{cfg.database(), probe, fpcalc};

	if (cmd == "scan")          return scan(lib, cfg);
	if (cmd == "plan")          return plan(lib, cfg);
	if (cmd == "apply")         return apply(lib, cfg);
	if (cmd == "undo")          return undo(lib, cfg);
	if (cmd == "groups")        return groups(lib, cfg);
	if (cmd == "override")      return override_group(lib, cfg);
	if (cmd == "review")        return review(lib, cfg);
	if (cmd == "analyze")       return analyze(lib, cfg);
	if (cmd == "cache-stats")   return cache_stats(lib);
	if (cmd == "meta-check")    return meta_check(lib, cfg);
	if (cmd == "meta-fix")      return meta_fix(lib, cfg);
	if (cmd == "meta-report")   return meta_report(lib, cfg);

	cfg.usage(std::cerr);
	return EXIT_FAILURE;
}

} // end of local namespace
} // end of namespace

int main(int argc, char *argv[])
{
	using namespace atd;
	try
	{
		OpenSSL_add_all_digests();
		Configuration cfg{argc, argv, ::getenv("AUDIOTIDY_CONFIG")};
		if (cfg.help() || cfg.command().empty())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return cfg.help() ? EXIT_SUCCESS : EXIT_FAILURE;
		}

		open_log("audiotidy", cfg.verbose() ? LOG_DEBUG : LOG_NOTICE);
		Log(LOG_DEBUG, "audiotidy (version %1%) running \"%2%\"", constants::version, cfg.command());

		return run(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		std::cerr << "audiotidy: " << brief(e) << std::endl;
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		std::cerr << "audiotidy: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}
}
