/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/14/2024.
//

#pragma once

#include "Operation.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace atd {

/// \brief  What the Applier did with one operation.
struct JournalEntry
{
	std::string                 op_id;
	std::string                 op_type;
	fs::path                    path;
	std::optional<fs::path>     new_path;
	OperationStatus             status{OperationStatus::noop};
	std::string                 reason;
	std::vector<std::string>    sources;
	std::optional<double>       confidence;
	nlohmann::json              metadata = nlohmann::json::object();
	std::optional<std::string>  error;      // only for failed entries

	static JournalEntry from(const Operation& op, OperationStatus status, std::optional<fs::path> new_path = std::nullopt);

	bool operator==(const JournalEntry&) const = default;
};

/// \brief  Record of one apply pass, one entry for each operation of the plan in the same order.
struct Journal
{
	std::string                 id;
	std::string                 created_at;
	std::string                 plan_id;
	std::vector<JournalEntry>   entries;

	static Journal create(std::string plan_id);

	static Journal load(const fs::path& file);

	// Writes <dir>/<id>.json, creating "dir" if needed. Returns the file written.
	fs::path save(const fs::path& dir) const;

	bool operator==(const Journal&) const = default;
};

void from_json(const nlohmann::json& src, JournalEntry& dest);
void to_json(nlohmann::json& dest, const JournalEntry& src);
void from_json(const nlohmann::json& src, Journal& dest);
void to_json(nlohmann::json& dest, const Journal& src);

} // end of namespace
