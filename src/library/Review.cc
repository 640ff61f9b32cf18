/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/12/2024.
//

#include "Review.hh"
#include "LayoutTemplate.hh"

#include "common/Error.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/get_error_info.hpp>
#include <boost/throw_exception.hpp>

#include <fnmatch.h>

#include <charconv>

namespace atd {
namespace {

std::string_view next_token(std::string_view& remain)
{
	auto start = remain.find_first_not_of(" \t");
	if (start == remain.npos)
	{
		remain = {};
		return {};
	}

	remain.remove_prefix(start);
	auto end = remain.find_first_of(" \t");
	auto token = remain.substr(0, end);
	remain = end == remain.npos ? std::string_view{} : remain.substr(end);
	return token;
}

std::optional<std::size_t> index_of(std::string_view target)
{
	std::size_t value{};
	auto [ptr, ec] = std::from_chars(target.data(), target.data() + target.size(), value);
	if (ec != std::errc{} || ptr != target.data() + target.size())
		return std::nullopt;
	return value;
}

} // end of local namespace

std::vector<fs::path> match_members(const DuplicateGroup& group, std::string_view target)
{
	std::vector<fs::path> result;
	if (target == "*" || target == "all")
	{
		for (auto&& member : group.members)
			result.push_back(member.path);
		return result;
	}

	if (auto index = index_of(target))
	{
		if (*index >= 1 && *index <= group.members.size())
			result.push_back(group.members[*index - 1].path);
		return result;
	}

	std::string pattern{target};
	for (auto&& member : group.members)
	{
		if (::fnmatch(pattern.c_str(), member.path.filename().c_str(), 0) == 0 ||
			::fnmatch(pattern.c_str(), member.path.c_str(), 0) == 0)
			result.push_back(member.path);
	}
	return result;
}

std::vector<OverrideIntent> override_intents(
	const DuplicateGroup& group,
	std::string_view target,
	Action action,
	std::optional<std::string> rename_template
)
{
	if (action == Action::rename && (!rename_template || rename_template->empty()))
		BOOST_THROW_EXCEPTION(InvalidOverride()
			<< ErrorCode{make_error_code(Error::invalid_override)}
			<< Message{"rename needs a template"}
		);

	if (rename_template && !rename_template->empty())
	{
		try
		{
			LayoutTemplate{*rename_template};
		}
		catch (LayoutTemplate::Error& e)
		{
			auto msg = boost::get_error_info<Message>(e);
			BOOST_THROW_EXCEPTION(InvalidOverride()
				<< ErrorCode{make_error_code(Error::invalid_override)}
				<< Message{msg ? *msg : std::string{"invalid template"}}
			);
		}
	}

	auto paths = match_members(group, target);
	if (paths.empty())
		BOOST_THROW_EXCEPTION(InvalidOverride()
			<< ErrorCode{make_error_code(Error::invalid_override)}
			<< Message{"no member of group " + std::to_string(group.id) + " matches \"" + std::string{target} + "\""}
		);

	std::vector<OverrideIntent> result;
	for (auto&& path : paths)
		result.push_back(OverrideIntent{group.digest, path, action, rename_template});
	return result;
}

ReviewIntent parse_review_command(std::string_view line, const DuplicateGroup& group)
{
	using Command = ReviewIntent::Command;

	auto remain = line;
	auto verb = boost::algorithm::to_lower_copy(std::string{next_token(remain)});

	if (verb == "n" || verb == "next" || verb.empty())
		return {Command::next};
	if (verb == "q" || verb == "quit")
		return {Command::quit};
	if (verb == "h" || verb == "help" || verb == "?")
		return {Command::help};

	auto action = parse_action(verb);
	if (!action)
		return {Command::invalid, {}, "unknown command \"" + verb + "\""};

	auto target = next_token(remain);
	if (target.empty())
		return {Command::invalid, {}, "missing target: use an index, a pattern or \"all\""};

	std::optional<std::string> tmpl;
	if (auto rest = boost::algorithm::trim_copy(std::string{remain}); !rest.empty())
		tmpl = rest;

	try
	{
		return {Command::set, override_intents(group, target, *action, tmpl)};
	}
	catch (InvalidOverride& e)
	{
		auto msg = boost::get_error_info<Message>(e);
		return {Command::invalid, {}, msg ? *msg : std::string{"invalid override"}};
	}
}

} // end of namespace
