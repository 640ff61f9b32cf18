/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/4/2024.
//

#pragma once

#include "common/FS.hh"

#include <magic.h>
#include <string>
#include <string_view>

namespace atd {

/// \brief  Container type of a file as its MIME type, e.g. "audio/flac".
class Magic
{
public:
	Magic();
	Magic(const Magic&) = delete;
	Magic(Magic&&) = delete;
	Magic& operator=(const Magic&) = delete;
	Magic& operator=(Magic&&) = delete;
	~Magic();

	// Empty if libmagic cannot tell.
	std::string mime(const fs::path& path) const;

	// libmagic cookies are not thread-safe, so each scanner thread gets its own.
	static const Magic& instance();

private:
	::magic_t m_cookie;
};

} // end of namespace
