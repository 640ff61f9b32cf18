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

#include "Applier.hh"
#include "Inventory.hh"
#include "Meta.hh"
#include "Planner.hh"
#include "Report.hh"
#include "Review.hh"
#include "Scanner.hh"
#include "Undo.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atd {

class MediaProbe;
class Fingerprinter;

/// \brief  Entry points used by the command line and by scripts.
///
/// Owns the inventory. The probe and fingerprinter are borrowed and must
/// outlive the Library.
class Library
{
public:
	Library(const fs::path& db, const MediaProbe& probe, const Fingerprinter& fingerprinter);

	ScanStats scan(const ScanOptions& opts);
	[[nodiscard]] Plan plan(const PlanOptions& opts) const;
	Applier::Result apply(const Plan& plan, const ApplyOptions& opts);
	UndoReport undo(std::string_view journal_id, const UndoOptions& opts) const;

	[[nodiscard]] std::vector<DuplicateGroup> groups(const GroupOptions& opts) const;

	// Stores an override for each member of group "group_id" matching "pattern".
	std::vector<OverrideIntent> set_override(
		std::size_t group_id,
		Action action,
		std::string_view pattern,
		std::optional<std::string> rename_template,
		const GroupOptions& opts
	);

	// Parses one review command against group "group_id" and stores the
	// overrides it asks for.
	ReviewIntent review(std::size_t group_id, std::string_view command, const GroupOptions& opts);

	void store(const std::vector<OverrideIntent>& intents);

	[[nodiscard]] AnalyzeReport analyze(const GroupOptions& opts) const;

	// File names that disagree with the tags, and the renames that fix them.
	[[nodiscard]] std::vector<MetaIssue> meta_check(const MetaOptions& opts) const;
	[[nodiscard]] MetaFix meta_fix(const MetaOptions& opts) const;
	[[nodiscard]] CacheStats cache_stats() const;

	[[nodiscard]] const Inventory& inventory() const {return m_inventory;}

private:
	DuplicateGroup group(std::size_t group_id, const GroupOptions& opts) const;

private:
	Inventory               m_inventory;
	const MediaProbe&       m_probe;
	const Fingerprinter&    m_fingerprinter;
};

} // end of namespace
