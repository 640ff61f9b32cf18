/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/18/2024.
//

#pragma once

#include "DuplicateGroup.hh"
#include "Plan.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace atd {

class Inventory;

struct AnalyzeReport
{
	std::size_t     files_total{};
	std::size_t     duplicate_groups{};
	std::size_t     duplicate_files{};
	std::size_t     missing_art{};
	std::uint64_t   reclaimable_bytes{};
};

AnalyzeReport analyze(const Inventory& inventory, const GroupOptions& opts);

// "0 B", "512 B", "1.5 KB", "3.0 GB" etc. in powers of 1024.
std::string format_bytes(std::uint64_t bytes);

// One row for each member: group_id,digest,path,size,bitrate,canonical,action
void export_csv(std::ostream& out, const std::vector<DuplicateGroup>& groups, const Inventory& inventory, DedupeMode mode);
nlohmann::json export_json(const std::vector<DuplicateGroup>& groups, const Inventory& inventory, DedupeMode mode);

// Operations of "plan" whose type is "kind", or all operations if "kind" is empty.
std::vector<Operation> plan_actions(const Plan& plan, std::string_view kind);

void to_json(nlohmann::json& dest, const AnalyzeReport& src);
void to_json(nlohmann::json& dest, const GroupStats& src);

} // end of namespace
