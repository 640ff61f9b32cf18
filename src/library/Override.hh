/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/8/2024.
//

#pragma once

#include "common/Timestamp.hh"

#include <optional>
#include <string>
#include <string_view>

namespace atd {

/// \brief  What to do with one member of a duplicate group.
enum class Action
{
	keep,
	remove,
	move,
	rename,
	skip,
	mark_review
};

// "KEEP", "DELETE", "MOVE", "RENAME", "SKIP" or "MARK-REVIEW"
std::string_view to_string(Action action);

// Case-insensitive. Accepts the names above, "review" and the single letters k/d/m/r/s.
std::optional<Action> parse_action(std::string_view name);

/// \brief  User decision for one file in one duplicate group. Always wins over the default.
struct GroupOverride
{
	Action                      action{Action::keep};
	std::optional<std::string>  rename_template;
	Timestamp                   updated_at{};

	bool operator==(const GroupOverride&) const = default;
};

} // end of namespace
