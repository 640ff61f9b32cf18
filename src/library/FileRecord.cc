/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/3/2024.
//

#include "FileRecord.hh"

#include "config.hh"

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>

namespace atd {

bool FileRecord::is_lossless() const
{
	auto ext = boost::algorithm::to_lower_copy(path.extension().string());
	return std::find(
		constants::lossless_extensions.begin(),
		constants::lossless_extensions.end(),
		ext
	) != constants::lossless_extensions.end();
}

} // end of namespace
