/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/18/2024.
//

#include "Report.hh"
#include "Inventory.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <ostream>

namespace atd {
namespace {

std::string csv_field(const std::string& field)
{
	if (field.find_first_of(",\"\n") == std::string::npos)
		return field;

	std::string quoted{"\""};
	for (auto ch : field)
	{
		if (ch == '"')
			quoted.push_back('"');
		quoted.push_back(ch);
	}
	quoted.push_back('"');
	return quoted;
}

} // end of local namespace

AnalyzeReport analyze(const Inventory& inventory, const GroupOptions& opts)
{
	auto files  = inventory.files();
	auto groups = list_groups(inventory, opts);
	auto stats  = group_stats(groups);

	AnalyzeReport report;
	report.files_total          = files.size();
	report.duplicate_groups     = stats.groups;
	report.duplicate_files      = stats.duplicate_files;
	report.reclaimable_bytes    = stats.reclaimable_bytes;
	report.missing_art          = static_cast<std::size_t>(std::count_if(files.begin(), files.end(), [](auto&& rec)
	{
		return !rec.has_art;
	}));
	return report;
}

std::string format_bytes(std::uint64_t bytes)
{
	static const std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};

	if (bytes < 1024)
		return std::to_string(bytes) + " B";

	auto value = static_cast<double>(bytes);
	std::size_t unit = 0;
	while (value >= 1024.0 && unit + 1 < units.size())
	{
		value /= 1024.0;
		++unit;
	}
	return (boost::format("%1$.1f %2%") % value % units[unit]).str();
}

void export_csv(std::ostream& out, const std::vector<DuplicateGroup>& groups, const Inventory& inventory, DedupeMode mode)
{
	out << "group_id,digest,path,size,bitrate,canonical,action\n";
	for (auto&& group : groups)
	{
		auto actions = resolve_actions(group, inventory.overrides(group.digest), mode);
		for (std::size_t i = 0; i < actions.size(); ++i)
		{
			auto& member = actions[i].member;
			out << group.id << ','
				<< group.digest.hex() << ','
				<< csv_field(member.path.string()) << ','
				<< member.size << ','
				<< member.bitrate << ','
				<< (i == group.canonical ? "true" : "false") << ','
				<< to_string(actions[i].action) << '\n';
		}
	}
}

nlohmann::json export_json(const std::vector<DuplicateGroup>& groups, const Inventory& inventory, DedupeMode mode)
{
	auto result = nlohmann::json::array();
	for (auto&& group : groups)
	{
		auto members = nlohmann::json::array();
		auto actions = resolve_actions(group, inventory.overrides(group.digest), mode);
		for (std::size_t i = 0; i < actions.size(); ++i)
		{
			auto& member = actions[i].member;
			members.push_back({
				{"path",        member.path.string()},
				{"size",        member.size},
				{"bitrate",     member.bitrate},
				{"canonical",   i == group.canonical},
				{"action",      std::string{to_string(actions[i].action)}},
				{"override",    actions[i].from_override}
			});
		}

		result.push_back({
			{"group_id",    group.id},
			{"digest",      group.digest.hex()},
			{"total_bytes", group.total_bytes},
			{"members",     std::move(members)}
		});
	}
	return result;
}

std::vector<Operation> plan_actions(const Plan& plan, std::string_view kind)
{
	std::vector<Operation> result;
	std::copy_if(plan.operations.begin(), plan.operations.end(), std::back_inserter(result), [kind](auto&& op)
	{
		return kind.empty() || op.type() == kind;
	});
	return result;
}

void to_json(nlohmann::json& dest, const AnalyzeReport& src)
{
	dest = {
		{"files_total",         src.files_total},
		{"duplicate_groups",    src.duplicate_groups},
		{"duplicate_files",     src.duplicate_files},
		{"missing_art",         src.missing_art},
		{"reclaimable_bytes",   src.reclaimable_bytes}
	};
}

void to_json(nlohmann::json& dest, const GroupStats& src)
{
	dest = {
		{"groups",              src.groups},
		{"duplicate_files",     src.duplicate_files},
		{"avg_group_size",      src.avg_group_size},
		{"max_group_size",      src.max_group_size},
		{"reclaimable_bytes",   src.reclaimable_bytes}
	};
}

} // end of namespace
