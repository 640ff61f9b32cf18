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

#include "Operation.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace atd {

/// \brief  Confidence levels that decide whether an operation needs a human.
struct Thresholds
{
	double auto_accept_above{0.90};
	double require_review_below{0.75};

	// "review" below require_review_below and in the gray zone, "pending" at
	// or above auto_accept_above.
	OperationStatus classify(double confidence) const;

	bool operator==(const Thresholds&) const = default;
};

struct Summary
{
	std::size_t     duplicate_groups{};
	std::size_t     deletes{};
	std::size_t     moves{};
	std::size_t     renames{};
	std::size_t     reviews{};
	std::size_t     art_fetches{};
	std::size_t     tag_updates{};
	std::uint64_t   estimated_reclaim_bytes{};

	Summary& operator+=(const Summary& other);
	bool operator==(const Summary&) const = default;
};

/// \brief  An ordered list of operations computed from one snapshot of the inventory.
///
/// The thresholds used for planning are kept with the plan, so applying it
/// later gates operations the same way regardless of the configuration at
/// that time.
struct Plan
{
	std::string             id;
	std::string             created_at;
	std::vector<fs::path>   roots;
	std::vector<Operation>  operations;
	Summary                 summary;
	Thresholds              thresholds;

	static Plan create(std::vector<fs::path> roots, std::vector<Operation> ops, Summary summary, Thresholds thresholds);

	static Plan load(const fs::path& file);
	void save(const fs::path& file) const;

	bool operator==(const Plan&) const = default;
};

void from_json(const nlohmann::json& src, Thresholds& dest);
void to_json(nlohmann::json& dest, const Thresholds& src);
void from_json(const nlohmann::json& src, Summary& dest);
void to_json(nlohmann::json& dest, const Summary& src);
void from_json(const nlohmann::json& src, Plan& dest);
void to_json(nlohmann::json& dest, const Plan& src);

} // end of namespace
