/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/15/2024.
//

#include "Planner.hh"
#include "Inventory.hh"
#include "LayoutTemplate.hh"

#include "media/MediaProbe.hh"

#include "common/Log.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <array>
#include <iterator>

namespace atd {
namespace {

const double duplicate_confidence = 0.99;
const double rename_override_confidence = 0.8;
const double art_confidence = 0.6;
const double manual_review_confidence = 0.5;
const double downgrade_confidence = 0.4;

std::optional<fs::path> root_for(const fs::path& path, const std::vector<fs::path>& roots)
{
	for (auto&& root : roots)
		if (relative_to(path, root))
			return root;
	return std::nullopt;
}

std::string confidence_reason(const char *what, double confidence)
{
	return (boost::format("%1% (confidence %2$.2f)") % what % confidence).str();
}

} // end of local namespace

Planner::Planner(const Inventory& inventory, const MediaProbe& probe) :
	m_inventory{inventory}, m_probe{probe}
{
}

double Planner::tag_confidence(const TagInfo& tags)
{
	auto present = [](auto&& tag){return tag.has_value();};
	std::array<bool, 4> required{
		present(tags.title), present(tags.artist), present(tags.album), present(tags.track)
	};

	auto score = 0.1;
	if (std::all_of(required.begin(), required.end(), [](bool b){return b;}))
		score = 0.6;
	else if (std::any_of(required.begin(), required.end(), [](bool b){return b;}))
		score = 0.3;

	if (tags.year)
		score += 0.2;
	if (tags.album_artist)
		score += 0.2;

	return std::min(score, 0.95);
}

Plan Planner::plan(const PlanOptions& opts) const
{
	// parse the layout before doing anything
	if (opts.layout && !opts.art_only)
		LayoutTemplate{*opts.layout};

	auto roots = absolute_paths(opts.roots);

	std::vector<Operation> ops;
	Summary summary;

	if (!opts.art_only && opts.dedupe_mode != DedupeMode::off)
	{
		auto [dedupe_ops, dedupe_summary] = dedupe(opts);
		std::move(dedupe_ops.begin(), dedupe_ops.end(), std::back_inserter(ops));
		summary += dedupe_summary;
	}

	if (!opts.art_only && opts.layout)
	{
		auto [layout_ops, layout_summary] = layout(opts);
		std::move(layout_ops.begin(), layout_ops.end(), std::back_inserter(ops));
		summary += layout_summary;
	}

	auto [art_ops, art_summary] = art(opts);
	if (opts.art_only)
		ops = std::move(art_ops);
	else
		std::move(art_ops.begin(), art_ops.end(), std::back_inserter(ops));
	summary += art_summary;

	Log(LOG_INFO, "planned %1% operations: %2% delete, %3% move, %4% rename, %5% review, %6% art",
		ops.size(), summary.deletes, summary.moves, summary.renames, summary.reviews, summary.art_fetches);

	return Plan::create(std::move(roots), std::move(ops), summary, opts.thresholds);
}

Planner::Stage Planner::dedupe(const PlanOptions& opts) const
{
	Stage result;
	auto& [ops, summary] = result;

	auto groups = list_groups(m_inventory, {opts.prefer_lossless, GroupOrder::digest});
	summary.duplicate_groups = groups.size();

	for (auto&& group : groups)
	{
		for (auto&& action : resolve_actions(group, m_inventory.overrides(group.digest), opts.dedupe_mode))
		{
			auto op = dedupe_operation(action, group, opts);
			if (!op)
				continue;

			if (std::holds_alternative<op::Delete>(op->kind))
			{
				summary.deletes++;
				summary.estimated_reclaim_bytes += action.member.size;
			}
			else if (std::holds_alternative<op::Move>(op->kind))
				summary.moves++;
			else if (std::holds_alternative<op::Rename>(op->kind))
				summary.renames++;
			else if (std::holds_alternative<op::Review>(op->kind))
				summary.reviews++;

			ops.push_back(std::move(*op));
		}
	}
	return result;
}

std::optional<Operation> Planner::dedupe_operation(
	const ResolvedAction& action,
	const DuplicateGroup& group,
	const PlanOptions& opts
) const
{
	if (action.action == Action::keep || action.action == Action::skip)
		return std::nullopt;

	auto& path = action.member.path;
	nlohmann::json meta{
		{"group_id",    group.id},
		{"group_hash",  group.digest.hex()},
		{"action",      std::string{to_string(action.action)}},
		{"size_bytes",  action.member.size}
	};

	std::vector<std::string> sources{"hash"};
	if (action.from_override)
		sources.emplace_back("override");

	auto review = [&path, &meta](std::string reason, double confidence)
	{
		return Operation::create(
			op::Review{}, path, std::move(reason), confidence, {"override"}, OperationStatus::review, meta
		);
	};

	switch (action.action)
	{
	case Action::mark_review:
		return review("Manual review requested", manual_review_confidence);

	case Action::remove:
		return Operation::create(
			op::Delete{}, path, "Exact duplicate by content digest", duplicate_confidence,
			sources, opts.thresholds.classify(duplicate_confidence), meta
		);

	case Action::move:
		if (!opts.dupe_dir)
			return review("Move requested but dupe dir not set", downgrade_confidence);

		return Operation::create(
			op::Move{*opts.dupe_dir / path.filename()}, path, "Exact duplicate by content digest",
			duplicate_confidence, sources, opts.thresholds.classify(duplicate_confidence), meta
		);

	case Action::rename:
		if (!action.rename_template)
			return review("Rename requested but template missing", downgrade_confidence);

		try
		{
			auto dest = path.parent_path() / LayoutTemplate{*action.rename_template}.render(m_probe.read_tags(path));
			dest += path.extension();

			meta["template"] = *action.rename_template;
			return Operation::create(
				op::Rename{dest}, path,
				confidence_reason("Rename by override template", rename_override_confidence),
				rename_override_confidence, {"override", "tags"},
				opts.thresholds.classify(rename_override_confidence), meta
			);
		}
		catch (LayoutTemplate::Error& e)
		{
			return review("Rename template is invalid: " + brief(e), downgrade_confidence);
		}
		catch (MediaProbe::Error& e)
		{
			return review("Cannot read tags for rename: " + brief(e), downgrade_confidence);
		}

	default:
		return std::nullopt;
	}
}

Planner::Stage Planner::layout(const PlanOptions& opts) const
{
	Stage result;
	auto& [ops, summary] = result;

	LayoutTemplate layout{*opts.layout};
	auto roots = absolute_paths(opts.roots);
	for (auto&& rec : m_inventory.files())
	{
		auto root = root_for(rec.path, roots);
		if (!root)
			continue;

		TagInfo tags;
		try
		{
			tags = m_probe.read_tags(rec.path);
		}
		catch (MediaProbe::Error& e)
		{
			Log(LOG_WARNING, "skipping layout of %1%: %2%", rec.path.string(), brief(e));
			continue;
		}

		auto new_path = *root / layout.render(tags);
		new_path += rec.path.extension();
		if (new_path == rec.path)
			continue;

		auto confidence = tag_confidence(tags);
		auto status = opts.thresholds.classify(confidence);
		if (confidence < opts.confidence_threshold)
			status = OperationStatus::review;

		ops.push_back(Operation::create(
			op::Rename{new_path}, rec.path, confidence_reason("Rename to layout", confidence),
			confidence, {"tags"}, status
		));
		summary.renames++;
		if (status == OperationStatus::review)
			summary.reviews++;
	}
	return result;
}

Planner::Stage Planner::art(const PlanOptions& opts) const
{
	Stage result;
	auto& [ops, summary] = result;

	for (auto&& rec : m_inventory.files())
	{
		if (rec.has_art)
			continue;

		auto status = opts.thresholds.classify(art_confidence);
		ops.push_back(Operation::create(
			op::ArtFetch{}, rec.path, "Missing embedded art", art_confidence, {"embedded_art"}, status
		));
		summary.art_fetches++;
		if (status == OperationStatus::review)
			summary.reviews++;
	}
	return result;
}

} // end of namespace
