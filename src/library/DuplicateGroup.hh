/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/10/2024.
//

#pragma once

#include "ContentDigest.hh"
#include "FileRecord.hh"
#include "Override.hh"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atd {

class Inventory;

enum class DedupeMode {off, remove, move, skip};
enum class GroupOrder {digest, size};

std::string_view to_string(DedupeMode mode);
std::optional<DedupeMode> parse_dedupe_mode(std::string_view name);

struct GroupOptions
{
	bool        prefer_lossless{true};
	GroupOrder  order{GroupOrder::digest};
};

/// \brief  Byte-identical files sharing one content digest.
///
/// Groups are recomputed from the inventory every time and never stored.
/// The id is only for display: it numbers the groups in digest order.
struct DuplicateGroup
{
	std::size_t             id{};
	ContentDigest           digest;
	std::vector<FileRecord> members;
	std::size_t             canonical{};    // index into members
	std::uint64_t           total_bytes{};

	const FileRecord& canonical_member() const {return members.at(canonical);}
};

/// \brief  The final decision for one member of a group.
struct ResolvedAction
{
	FileRecord                  member;
	Action                      action{Action::keep};
	std::optional<std::string>  rename_template;
	bool                        from_override{};
};

struct GroupStats
{
	std::size_t     groups{};
	std::size_t     duplicate_files{};
	double          avg_group_size{};
	std::size_t     max_group_size{};
	std::uint64_t   reclaimable_bytes{};
};

// Index of the preferred member. Lossless files first when "prefer_lossless", then
// the highest bitrate. Ties go to the earliest member.
std::size_t select_canonical(const std::vector<FileRecord>& members, bool prefer_lossless);

// Wraps partitions of byte-identical records, as returned by Inventory::duplicates().
std::vector<DuplicateGroup> make_groups(std::vector<std::vector<FileRecord>> partitions, const GroupOptions& opts);

std::vector<DuplicateGroup> list_groups(const Inventory& inventory, const GroupOptions& opts);

std::vector<ResolvedAction> resolve_actions(
	const DuplicateGroup& group,
	const std::map<fs::path, GroupOverride>& overrides,
	DedupeMode mode
);

const DuplicateGroup* find_group(const std::vector<DuplicateGroup>& groups, std::size_t id);
GroupStats group_stats(const std::vector<DuplicateGroup>& groups);

} // end of namespace
