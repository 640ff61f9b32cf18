/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/8/2024.
//

#include "Override.hh"

#include <boost/algorithm/string/case_conv.hpp>

namespace atd {

std::string_view to_string(Action action)
{
	switch (action)
	{
		case Action::keep:          return "KEEP";
		case Action::remove:        return "DELETE";
		case Action::move:          return "MOVE";
		case Action::rename:        return "RENAME";
		case Action::skip:          return "SKIP";
		case Action::mark_review:   return "MARK-REVIEW";
	}
	return "SKIP";
}

std::optional<Action> parse_action(std::string_view name)
{
	auto lower = boost::algorithm::to_lower_copy(std::string{name});

	if (lower == "k" || lower == "keep")    return Action::keep;
	if (lower == "d" || lower == "delete")  return Action::remove;
	if (lower == "m" || lower == "move")    return Action::move;
	if (lower == "r" || lower == "rename")  return Action::rename;
	if (lower == "s" || lower == "skip")    return Action::skip;
	if (lower == "review" || lower == "mark-review")
		return Action::mark_review;

	return std::nullopt;
}

} // end of namespace
