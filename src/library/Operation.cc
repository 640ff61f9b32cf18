/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/13/2024.
//

#include "Operation.hh"

#include "common/Error.hh"
#include "common/crypto/Random.hh"

#include <boost/throw_exception.hpp>

#include <array>
#include <utility>

namespace atd {
namespace {

constexpr std::array<std::pair<OperationStatus, std::string_view>, 10> status_names{{
	{OperationStatus::pending,                  "pending"},
	{OperationStatus::review,                   "review"},
	{OperationStatus::dry_run,                  "dry-run"},
	{OperationStatus::moved,                    "moved"},
	{OperationStatus::quarantined,              "quarantined"},
	{OperationStatus::deleted,                  "deleted"},
	{OperationStatus::review_required,          "review-required"},
	{OperationStatus::skipped_low_confidence,   "skipped-low-confidence"},
	{OperationStatus::noop,                     "noop"},
	{OperationStatus::failed,                   "failed"},
}};

[[noreturn]] void invalid(const std::string& why)
{
	BOOST_THROW_EXCEPTION(InvalidDocument()
		<< ErrorCode{make_error_code(Error::invalid_plan)}
		<< Message{why}
	);
}

} // end of local namespace

std::string_view to_string(OperationStatus status)
{
	for (auto&& [value, name] : status_names)
		if (value == status)
			return name;
	return "failed";
}

std::optional<OperationStatus> parse_status(std::string_view name)
{
	for (auto&& [value, str] : status_names)
		if (str == name)
			return value;
	return std::nullopt;
}

std::string_view type_name(const OperationKind& kind)
{
	constexpr std::array<std::string_view, std::variant_size_v<OperationKind>> names{
		"delete", "move", "rename", "art_fetch", "review"
	};
	return names.at(kind.index());
}

Operation Operation::create(
	OperationKind kind,
	fs::path path,
	std::string reason,
	std::optional<double> confidence,
	std::vector<std::string> sources,
	OperationStatus status,
	nlohmann::json metadata
)
{
	return Operation{
		random_uuid(),
		std::move(kind),
		std::move(path),
		std::move(reason),
		std::move(sources),
		std::move(metadata),
		confidence,
		status
	};
}

std::optional<fs::path> Operation::new_path() const
{
	if (auto move = std::get_if<op::Move>(&kind))
		return move->destination;
	if (auto rename = std::get_if<op::Rename>(&kind))
		return rename->destination;
	return std::nullopt;
}

void from_json(const nlohmann::json& src, Operation& dest)
{
	auto type = src.at("op_type").get<std::string>();
	auto new_path = src.value("new_path", nlohmann::json{});
	if ((type == "move" || type == "rename") && !new_path.is_string())
		invalid(type + " operation " + src.value("op_id", std::string{}) + " has no new_path");

	if (type == "delete")           dest.kind = op::Delete{};
	else if (type == "move")        dest.kind = op::Move{new_path.get<std::string>()};
	else if (type == "rename")      dest.kind = op::Rename{new_path.get<std::string>()};
	else if (type == "art_fetch")   dest.kind = op::ArtFetch{};
	else if (type == "review")      dest.kind = op::Review{};
	else                            invalid("unknown operation type \"" + type + "\"");

	auto status = parse_status(src.at("status").get<std::string>());
	if (!status)
		invalid("unknown operation status \"" + src.at("status").get<std::string>() + "\"");

	dest.id         = src.at("op_id").get<std::string>();
	dest.path       = src.at("path").get<std::string>();
	dest.reason     = src.value("reason", std::string{});
	dest.sources    = src.value("sources", std::vector<std::string>{});
	dest.metadata   = src.value("metadata", nlohmann::json::object());
	dest.status     = *status;

	if (auto conf = src.find("confidence"); conf != src.end() && conf->is_number())
		dest.confidence = conf->get<double>();
	else
		dest.confidence = std::nullopt;
}

void to_json(nlohmann::json& dest, const Operation& src)
{
	auto new_path = src.new_path();

	auto result = nlohmann::json::object();
	result.emplace("op_id",      src.id);
	result.emplace("op_type",    std::string{src.type()});
	result.emplace("path",       src.path.string());
	result.emplace("new_path",   new_path ? nlohmann::json(new_path->string()) : nlohmann::json{});
	result.emplace("reason",     src.reason);
	result.emplace("sources",    src.sources);
	result.emplace("status",     std::string{to_string(src.status)});
	result.emplace("metadata",   src.metadata);
	result.emplace("confidence", src.confidence ? nlohmann::json(*src.confidence) : nlohmann::json{});

	dest = std::move(result);
}

} // end of namespace
