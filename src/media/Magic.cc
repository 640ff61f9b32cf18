/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/4/2024.
//

#include "Magic.hh"

namespace atd {

Magic::Magic() : m_cookie{::magic_open(MAGIC_MIME_TYPE)}
{
	if (m_cookie)
		::magic_load(m_cookie, nullptr);
}

Magic::~Magic()
{
	if (m_cookie)
		::magic_close(m_cookie);
}

std::string Magic::mime(const fs::path& path) const
{
	auto result = m_cookie ? ::magic_file(m_cookie, path.c_str()) : nullptr;
	return result ? std::string{result} : std::string{};
}

const Magic& Magic::instance()
{
	thread_local const Magic magic;
	return magic;
}

} // end of namespace
