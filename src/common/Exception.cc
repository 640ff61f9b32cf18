/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#include "Exception.hh"

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/get_error_info.hpp>

namespace atd {

const char* Exception::what() const noexcept
{
	return boost::diagnostic_information_what(*this, true);
}

std::string brief(const boost::exception& e)
{
	std::string result;
	if (auto msg = boost::get_error_info<Message>(e))
		result = *msg;
	else if (auto ec = boost::get_error_info<ErrorCode>(e))
		result = ec->message();
	else
		result = "unexpected error";

	if (auto path = boost::get_error_info<Path>(e))
		result += ": " + path->string();
	if (auto dest = boost::get_error_info<Destination>(e))
		result += " -> " + dest->string();
	return result;
}

} // end of namespace
