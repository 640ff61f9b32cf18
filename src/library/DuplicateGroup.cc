/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/10/2024.
//

#include "DuplicateGroup.hh"
#include "Inventory.hh"

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>
#include <numeric>
#include <tuple>

namespace atd {

std::string_view to_string(DedupeMode mode)
{
	switch (mode)
	{
		case DedupeMode::off:       return "off";
		case DedupeMode::remove:    return "delete";
		case DedupeMode::move:      return "move";
		case DedupeMode::skip:      return "skip";
	}
	return "off";
}

std::optional<DedupeMode> parse_dedupe_mode(std::string_view name)
{
	auto lower = boost::algorithm::to_lower_copy(std::string{name});
	if (lower == "off")     return DedupeMode::off;
	if (lower == "delete")  return DedupeMode::remove;
	if (lower == "move")    return DedupeMode::move;
	if (lower == "skip")    return DedupeMode::skip;
	return std::nullopt;
}

std::size_t select_canonical(const std::vector<FileRecord>& members, bool prefer_lossless)
{
	auto rank = [prefer_lossless](const FileRecord& rec)
	{
		return std::make_tuple(prefer_lossless && rec.is_lossless() ? 0 : 1, -rec.bitrate);
	};

	// std::min_element returns the first of equal elements
	auto best = std::min_element(members.begin(), members.end(), [&rank](auto&& a, auto&& b)
	{
		return rank(a) < rank(b);
	});
	return static_cast<std::size_t>(best - members.begin());
}

std::vector<DuplicateGroup> make_groups(std::vector<std::vector<FileRecord>> partitions, const GroupOptions& opts)
{
	// only records with a digest can be duplicates
	partitions.erase(std::remove_if(partitions.begin(), partitions.end(), [](auto&& part)
	{
		return part.size() < 2 || !part.front().digest;
	}), partitions.end());

	std::sort(partitions.begin(), partitions.end(), [](auto&& a, auto&& b)
	{
		return *a.front().digest < *b.front().digest;
	});

	std::vector<DuplicateGroup> groups;
	for (auto&& members : partitions)
	{
		DuplicateGroup group;
		group.id            = groups.size() + 1;
		group.digest        = *members.front().digest;
		group.canonical     = select_canonical(members, opts.prefer_lossless);
		group.total_bytes   = std::accumulate(members.begin(), members.end(), std::uint64_t{}, [](auto sum, auto&& rec)
		{
			return sum + rec.size;
		});
		group.members       = std::move(members);
		groups.push_back(std::move(group));
	}

	// ids stay as assigned in digest order
	if (opts.order == GroupOrder::size)
		std::stable_sort(groups.begin(), groups.end(), [](auto&& a, auto&& b)
		{
			return std::make_tuple(a.members.size(), a.total_bytes) > std::make_tuple(b.members.size(), b.total_bytes);
		});

	return groups;
}

std::vector<DuplicateGroup> list_groups(const Inventory& inventory, const GroupOptions& opts)
{
	return make_groups(inventory.duplicates(), opts);
}

std::vector<ResolvedAction> resolve_actions(
	const DuplicateGroup& group,
	const std::map<fs::path, GroupOverride>& overrides,
	DedupeMode mode
)
{
	auto fallback = Action::skip;
	if (mode == DedupeMode::remove)
		fallback = Action::remove;
	else if (mode == DedupeMode::move)
		fallback = Action::move;

	std::vector<ResolvedAction> result;
	for (std::size_t i = 0; i < group.members.size(); ++i)
	{
		auto& member = group.members[i];

		ResolvedAction resolved{member, i == group.canonical ? Action::keep : fallback};
		if (auto it = overrides.find(member.path); it != overrides.end())
		{
			resolved.action          = it->second.action;
			resolved.rename_template = it->second.rename_template;
			resolved.from_override   = true;
		}
		result.push_back(std::move(resolved));
	}
	return result;
}

const DuplicateGroup* find_group(const std::vector<DuplicateGroup>& groups, std::size_t id)
{
	auto it = std::find_if(groups.begin(), groups.end(), [id](auto&& group){return group.id == id;});
	return it != groups.end() ? &*it : nullptr;
}

GroupStats group_stats(const std::vector<DuplicateGroup>& groups)
{
	GroupStats stats;
	stats.groups = groups.size();
	for (auto&& group : groups)
	{
		stats.duplicate_files += group.members.size();
		stats.max_group_size   = std::max(stats.max_group_size, group.members.size());

		// everything except the canonical copy
		stats.reclaimable_bytes += group.total_bytes - group.canonical_member().size;
	}
	if (!groups.empty())
		stats.avg_group_size = static_cast<double>(stats.duplicate_files) / static_cast<double>(groups.size());

	return stats;
}

} // end of namespace
