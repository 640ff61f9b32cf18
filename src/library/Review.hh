/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/12/2024.
//

#pragma once

#include "DuplicateGroup.hh"

#include "common/Exception.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace atd {

/// \brief  An override to be stored, produced by a review command.
struct OverrideIntent
{
	ContentDigest               group;
	fs::path                    path;
	Action                      action{Action::keep};
	std::optional<std::string>  rename_template;
};

/// \brief  Result of parsing one line typed during an interactive review.
///
/// Parsing does no I/O. The review loop stores the overrides and moves on
/// according to "command".
struct ReviewIntent
{
	enum class Command {set, next, quit, help, invalid};

	Command                     command{Command::invalid};
	std::vector<OverrideIntent> overrides;
	std::string                 message;    // why the line is invalid
};

// Members selected by "target": a 1-based index, a glob pattern matched against
// the file name or the full path, or "*"/"all" for every member.
std::vector<fs::path> match_members(const DuplicateGroup& group, std::string_view target);

// "<action> <target> [template...]", "next", "quit" or "help".
ReviewIntent parse_review_command(std::string_view line, const DuplicateGroup& group);

// Overrides for every member matched by "target". Throws InvalidOverride if
// nothing matches, a rename has no template or the template cannot be parsed.
std::vector<OverrideIntent> override_intents(
	const DuplicateGroup& group,
	std::string_view target,
	Action action,
	std::optional<std::string> rename_template
);

struct InvalidOverride : virtual Exception {};

} // end of namespace
