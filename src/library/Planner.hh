/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/15/2024.
//

#pragma once

#include "DuplicateGroup.hh"
#include "Plan.hh"

#include "media/MediaProbe.hh"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace atd {

class Inventory;

struct PlanOptions
{
	std::vector<fs::path>       roots;
	DedupeMode                  dedupe_mode{DedupeMode::move};
	std::optional<fs::path>     dupe_dir;
	std::optional<std::string>  layout;
	bool                        art_only{false};
	bool                        prefer_lossless{true};

	// Floor for layout renames, independent of the thresholds.
	double                      confidence_threshold{0.85};
	Thresholds                  thresholds;
};

/// \brief  Turns the inventory into a Plan.
///
/// Three stages: duplicates, layout renames and missing album art. Each
/// stage adds operations in a fixed order, so the same inventory and
/// overrides always give the same plan.
class Planner
{
public:
	Planner(const Inventory& inventory, const MediaProbe& probe);

	// Throws LayoutTemplate::Error if the layout cannot be parsed.
	Plan plan(const PlanOptions& opts) const;

	// 0.6 with title, artist, album and track; 0.3 with some of them; 0.1 with
	// none. Year and album artist add 0.2 each. At most 0.95.
	static double tag_confidence(const TagInfo& tags);

private:
	using Stage = std::pair<std::vector<Operation>, Summary>;

	Stage dedupe(const PlanOptions& opts) const;
	Stage layout(const PlanOptions& opts) const;
	Stage art(const PlanOptions& opts) const;

	std::optional<Operation> dedupe_operation(
		const ResolvedAction& action,
		const DuplicateGroup& group,
		const PlanOptions& opts
	) const;

private:
	const Inventory&    m_inventory;
	const MediaProbe&   m_probe;
};

} // end of namespace
