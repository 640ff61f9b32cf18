/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/16/2024.
//

#pragma once

#include "Journal.hh"
#include "Plan.hh"

#include <optional>

namespace atd {

class Inventory;

struct QuarantineOptions
{
	bool                    enabled{false};
	std::optional<fs::path> dir;
};

struct ApplyOptions
{
	fs::path            journal_dir;
	bool                dry_run{false};
	bool                force_low_confidence{false};
	QuarantineOptions   quarantine;
};

/// \brief  Carries out a Plan on the file system and journals what happened.
///
/// Operations run one by one in plan order. An operation that fails (e.g.
/// its destination already exists) is journaled as "failed" and the rest
/// of the plan still runs. Existing files are never overwritten.
class Applier
{
public:
	struct Collision : virtual Exception {};

	struct Result
	{
		Journal     journal;
		fs::path    location;   // where the journal was written
	};

public:
	explicit Applier(Inventory& inventory);

	Result apply(const Plan& plan, const ApplyOptions& opts);

	// Where a deleted file goes when quarantine is on: its path relative to
	// the containing root, under the quarantine directory.
	static fs::path quarantine_target(const fs::path& path, const fs::path& dir, const std::vector<fs::path>& roots);

private:
	JournalEntry execute(const Operation& op, const Plan& plan, const ApplyOptions& opts);

private:
	Inventory& m_inventory;
};

} // end of namespace
