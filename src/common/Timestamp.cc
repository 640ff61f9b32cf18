/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#include "Timestamp.hh"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <ctime>

namespace atd {

using namespace std::chrono;

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.time_since_epoch().count();
}

void from_json(const nlohmann::json& json, Timestamp& output)
{
	output = Timestamp{Timestamp::duration{json.get<Timestamp::duration::rep>()}};
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.time_since_epoch().count();
}

Timestamp Timestamp::now()
{
	return time_point_cast<Timestamp::duration>(Timestamp::clock::now());
}

std::string Timestamp::iso_format() const
{
	auto tt = system_clock::to_time_t(time_point_cast<system_clock::duration>(*this));
	auto ms = time_since_epoch().count() % 1000;

	std::ostringstream ss;
	std::tm tm_{};
	if (auto tm = ::gmtime_r(&tt, &tm_); tm)
		ss << std::put_time(tm, "%Y-%m-%dT%H:%M:%S")
			<< '.' << std::setw(3) << std::setfill('0') << ms << 'Z';

	return ss.str();
}

} // end of namespace atd
