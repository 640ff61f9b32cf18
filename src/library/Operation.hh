/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/13/2024.
//

#pragma once

#include "common/Exception.hh"
#include "common/FS.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace atd {

/// \brief  A plan or journal document that cannot be understood.
struct InvalidDocument : virtual Exception {};

enum class OperationStatus
{
	// assigned by the Planner
	pending,
	review,

	// assigned by the Applier
	dry_run,
	moved,
	quarantined,
	deleted,
	review_required,
	skipped_low_confidence,
	noop,
	failed
};

std::string_view to_string(OperationStatus status);
std::optional<OperationStatus> parse_status(std::string_view name);

namespace op {
struct Delete
{
	bool operator==(const Delete&) const = default;
};
struct Move
{
	fs::path destination;
	bool operator==(const Move&) const = default;
};
struct Rename
{
	fs::path destination;
	bool operator==(const Rename&) const = default;
};
struct ArtFetch
{
	bool operator==(const ArtFetch&) const = default;
};
struct Review
{
	bool operator==(const Review&) const = default;
};
} // end of namespace op

using OperationKind = std::variant<op::Delete, op::Move, op::Rename, op::ArtFetch, op::Review>;

// "delete", "move", "rename", "art_fetch" or "review"
std::string_view type_name(const OperationKind& kind);

/// \brief  One proposed change to the library.
///
/// Only moves and renames carry a destination. "metadata" holds provenance
/// such as the digest of the duplicate group an operation comes from.
struct Operation
{
	std::string                 id;
	OperationKind               kind;
	fs::path                    path;
	std::string                 reason;
	std::vector<std::string>    sources;
	nlohmann::json              metadata = nlohmann::json::object();
	std::optional<double>       confidence;
	OperationStatus             status{OperationStatus::pending};

	static Operation create(
		OperationKind kind,
		fs::path path,
		std::string reason,
		std::optional<double> confidence,
		std::vector<std::string> sources,
		OperationStatus status,
		nlohmann::json metadata = nlohmann::json::object()
	);

	std::string_view type() const {return type_name(kind);}
	std::optional<fs::path> new_path() const;

	bool operator==(const Operation&) const = default;
};

void from_json(const nlohmann::json& src, Operation& dest);
void to_json(nlohmann::json& dest, const Operation& src);

} // end of namespace
