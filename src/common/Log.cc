/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#include "Log.hh"

namespace atd {
namespace detail {

void DetailLog(int priority, std::string &&line)
{
	::syslog(priority, "%s", line.c_str());
}

} // end of namespace detail

void open_log(const char *ident, int max_priority)
{
	::openlog(ident, LOG_PID | LOG_PERROR, LOG_USER);
	::setlogmask(LOG_UPTO(max_priority));
}

} // end of namespace
