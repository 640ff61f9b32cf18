/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/14/2024.
//

#include "Journal.hh"

#include "common/Error.hh"
#include "common/Timestamp.hh"
#include "common/crypto/Random.hh"

#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>

namespace atd {

JournalEntry JournalEntry::from(const Operation& op, OperationStatus status, std::optional<fs::path> new_path)
{
	return JournalEntry{
		op.id,
		std::string{op.type()},
		op.path,
		std::move(new_path),
		status,
		op.reason,
		op.sources,
		op.confidence,
		op.metadata
	};
}

Journal Journal::create(std::string plan_id)
{
	return Journal{random_uuid(), Timestamp::now().iso_format(), std::move(plan_id)};
}

Journal Journal::load(const fs::path& file)
{
	try
	{
		std::ifstream in{file.string()};
		if (!in)
			BOOST_THROW_EXCEPTION((InvalidDocument()
				<< ErrorCode{std::error_code{errno, std::system_category()}}
			));

		return nlohmann::json::parse(in).get<Journal>();
	}
	catch (nlohmann::json::exception& e)
	{
		BOOST_THROW_EXCEPTION(InvalidDocument()
			<< ErrorCode{make_error_code(Error::invalid_plan)}
			<< Message{e.what()}
			<< Path{file}
		);
	}
	catch (Exception& e)
	{
		e << Path{file};
		throw;
	}
}

fs::path Journal::save(const fs::path& dir) const
{
	std::error_code ec;
	fs::create_directories(dir, ec);
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError() << ErrorCode{ec} << Path{dir});

	auto file = dir / (id + ".json");
	std::ofstream out{file.string()};
	out << nlohmann::json(*this).dump(2) << std::endl;
	if (!out)
		BOOST_THROW_EXCEPTION((SystemError()
			<< ErrorCode{std::error_code{errno, std::system_category()}}
			<< Path{file}
		));
	return file;
}

void from_json(const nlohmann::json& src, JournalEntry& dest)
{
	auto status = parse_status(src.at("status").get<std::string>());
	if (!status)
		BOOST_THROW_EXCEPTION(InvalidDocument()
			<< ErrorCode{make_error_code(Error::invalid_plan)}
			<< Message{"unknown journal entry status \"" + src.at("status").get<std::string>() + "\""}
		);

	dest.op_id      = src.at("op_id").get<std::string>();
	dest.op_type    = src.at("op_type").get<std::string>();
	dest.path       = src.at("path").get<std::string>();
	dest.status     = *status;
	dest.reason     = src.value("reason", std::string{});
	dest.sources    = src.value("sources", std::vector<std::string>{});
	dest.metadata   = src.value("metadata", nlohmann::json::object());

	auto new_path = src.value("new_path", nlohmann::json{});
	dest.new_path = new_path.is_string() ? std::optional<fs::path>{new_path.get<std::string>()} : std::nullopt;

	auto conf = src.value("confidence", nlohmann::json{});
	dest.confidence = conf.is_number() ? std::optional<double>{conf.get<double>()} : std::nullopt;

	auto error = src.value("error", nlohmann::json{});
	dest.error = error.is_string() ? std::optional<std::string>{error.get<std::string>()} : std::nullopt;
}

void to_json(nlohmann::json& dest, const JournalEntry& src)
{
	auto result = nlohmann::json::object();
	result.emplace("op_id",      src.op_id);
	result.emplace("op_type",    src.op_type);
	result.emplace("path",       src.path.string());
	result.emplace("status",     std::string{to_string(src.status)});
	result.emplace("reason",     src.reason);
	result.emplace("sources",    src.sources);
	result.emplace("confidence", src.confidence ? nlohmann::json(*src.confidence) : nlohmann::json{});
	result.emplace("metadata",   src.metadata);
	if (src.new_path)
		result.emplace("new_path", src.new_path->string());
	if (src.error)
		result.emplace("error", *src.error);

	dest = std::move(result);
}

void from_json(const nlohmann::json& src, Journal& dest)
{
	dest.id         = src.at("journal_id").get<std::string>();
	dest.created_at = src.at("created_at").get<std::string>();
	dest.plan_id    = src.at("plan_id").get<std::string>();
	dest.entries    = src.at("entries").get<std::vector<JournalEntry>>();
}

void to_json(nlohmann::json& dest, const Journal& src)
{
	dest = nlohmann::json{
		{"journal_id",  src.id},
		{"created_at",  src.created_at},
		{"plan_id",     src.plan_id},
		{"entries",     src.entries}
	};
}

} // end of namespace
