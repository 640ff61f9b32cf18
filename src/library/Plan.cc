/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/13/2024.
//

#include "Plan.hh"

#include "common/Error.hh"
#include "common/Timestamp.hh"
#include "common/crypto/Random.hh"

#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>

namespace atd {

OperationStatus Thresholds::classify(double confidence) const
{
	if (confidence < require_review_below)
		return OperationStatus::review;
	if (confidence >= auto_accept_above)
		return OperationStatus::pending;
	return OperationStatus::review;
}

Summary& Summary::operator+=(const Summary& other)
{
	duplicate_groups        += other.duplicate_groups;
	deletes                 += other.deletes;
	moves                   += other.moves;
	renames                 += other.renames;
	reviews                 += other.reviews;
	art_fetches             += other.art_fetches;
	tag_updates             += other.tag_updates;
	estimated_reclaim_bytes += other.estimated_reclaim_bytes;
	return *this;
}

Plan Plan::create(std::vector<fs::path> roots, std::vector<Operation> ops, Summary summary, Thresholds thresholds)
{
	return Plan{
		random_uuid(),
		Timestamp::now().iso_format(),
		std::move(roots),
		std::move(ops),
		summary,
		thresholds
	};
}

Plan Plan::load(const fs::path& file)
{
	try
	{
		std::ifstream in{file.string()};
		if (!in)
			BOOST_THROW_EXCEPTION((InvalidDocument()
				<< ErrorCode{std::error_code{errno, std::system_category()}}
			));

		return nlohmann::json::parse(in).get<Plan>();
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

void Plan::save(const fs::path& file) const
{
	std::ofstream out{file.string()};
	out << nlohmann::json(*this).dump(2) << std::endl;
	if (!out)
		BOOST_THROW_EXCEPTION((SystemError()
			<< ErrorCode{std::error_code{errno, std::system_category()}}
			<< Path{file}
		));
}

void from_json(const nlohmann::json& src, Thresholds& dest)
{
	dest.auto_accept_above    = src.at("auto_accept_above").get<double>();
	dest.require_review_below = src.at("require_review_below").get<double>();
}

void to_json(nlohmann::json& dest, const Thresholds& src)
{
	dest = nlohmann::json{
		{"auto_accept_above",    src.auto_accept_above},
		{"require_review_below", src.require_review_below}
	};
}

void from_json(const nlohmann::json& src, Summary& dest)
{
	dest.duplicate_groups        = src.value("duplicate_groups", std::size_t{});
	dest.deletes                 = src.value("delete", std::size_t{});
	dest.moves                   = src.value("move", std::size_t{});
	dest.renames                 = src.value("rename", std::size_t{});
	dest.reviews                 = src.value("review", std::size_t{});
	dest.art_fetches             = src.value("art_fetches", std::size_t{});
	dest.tag_updates             = src.value("tag_updates", std::size_t{});
	dest.estimated_reclaim_bytes = src.value("estimated_reclaim_bytes", std::uint64_t{});
}

void to_json(nlohmann::json& dest, const Summary& src)
{
	dest = nlohmann::json{
		{"duplicate_groups",        src.duplicate_groups},
		{"delete",                  src.deletes},
		{"move",                    src.moves},
		{"rename",                  src.renames},
		{"review",                  src.reviews},
		{"art_fetches",             src.art_fetches},
		{"tag_updates",             src.tag_updates},
		{"estimated_reclaim_bytes", src.estimated_reclaim_bytes}
	};
}

void from_json(const nlohmann::json& src, Plan& dest)
{
	dest.id         = src.at("plan_id").get<std::string>();
	dest.created_at = src.at("created_at").get<std::string>();

	dest.roots.clear();
	for (auto&& root : src.at("root_paths"))
		dest.roots.emplace_back(root.get<std::string>());

	dest.operations = src.at("operations").get<std::vector<Operation>>();

	auto& meta = src.at("metadata");
	dest.summary    = meta.value("summary", nlohmann::json::object()).get<Summary>();

	// without thresholds nothing would be gated, so refuse the plan
	dest.thresholds = meta.at("thresholds").get<Thresholds>();
}

void to_json(nlohmann::json& dest, const Plan& src)
{
	std::vector<std::string> roots;
	for (auto&& root : src.roots)
		roots.push_back(root.string());

	dest = nlohmann::json{
		{"plan_id",     src.id},
		{"created_at",  src.created_at},
		{"root_paths",  roots},
		{"operations",  src.operations},
		{"metadata", {
			{"summary",     src.summary},
			{"thresholds",  src.thresholds}
		}}
	};
}

} // end of namespace
