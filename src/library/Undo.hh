/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/17/2024.
//

#pragma once

#include "Journal.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atd {

struct UndoOptions
{
	fs::path    journal_dir;
	bool        dry_run{false};
};

enum class UndoOutcome
{
	restored,
	would_restore,      // dry run
	not_reversible,     // plain deletes
	skipped_exists,     // original path is occupied again
	failed,
	skipped             // nothing to reverse
};

std::string_view to_string(UndoOutcome outcome);

struct UndoStep
{
	std::string                 op_id;
	fs::path                    path;
	std::optional<fs::path>     from;
	UndoOutcome                 outcome{UndoOutcome::skipped};
	std::optional<std::string>  error;
};

struct UndoReport
{
	std::string             journal_id;
	fs::path                journal_file;
	std::vector<UndoStep>   steps;      // in reverse journal order

	std::size_t count(UndoOutcome outcome) const;
};

/// \brief  Reverses the moves and quarantines recorded in a journal.
///
/// Entries are replayed last to first. A file is only moved back when its
/// original path is free, so running the same journal twice is harmless.
/// The journal file itself is left in place.
class Undo
{
public:
	struct JournalNotFound : virtual Exception {};

public:
	explicit Undo(UndoOptions opts);

	// "last" picks the most recently modified journal in the directory. Journals
	// modified at the same time are ordered by their "created_at".
	[[nodiscard]] fs::path resolve(std::string_view journal_id) const;

	UndoReport run(std::string_view journal_id) const;

	static UndoStep reverse(const JournalEntry& entry, bool dry_run);

private:
	UndoOptions m_opts;
};

} // end of namespace
