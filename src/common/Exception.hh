/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#pragma once

#include <boost/exception/exception.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/exception/info.hpp>
#include <boost/filesystem/path.hpp>

#include <string>
#include <system_error>

namespace atd {

struct Exception : virtual boost::exception, virtual std::exception
{
	const char* what() const noexcept override ;
};

struct SystemError : virtual Exception {};
using ErrorCode   = boost::error_info<struct tag_error_code,  std::error_code>;
using Path        = boost::error_info<struct tag_path,        boost::filesystem::path>;
using Destination = boost::error_info<struct tag_destination, boost::filesystem::path>;
using Message     = boost::error_info<struct tag_message,     std::string>;

// One line summary for the user: the message or error code, followed by the path if any.
std::string brief(const boost::exception& e);

} // end of namespace
