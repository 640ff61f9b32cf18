/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/3/2024.
//

#pragma once

#include "ContentDigest.hh"

#include "common/FS.hh"

#include <cstdint>
#include <optional>
#include <string>

namespace atd {

/// \brief  What the inventory knows about one audio file, keyed by its absolute path.
struct FileRecord
{
	fs::path        path;
	std::uint64_t   size{};
	std::int64_t    mtime{};    // nanoseconds since epoch
	std::optional<ContentDigest> digest;

	std::string     codec;
	std::string     container;  // MIME type
	double          duration{};
	int             bitrate{};  // kbps
	int             sample_rate{};
	int             channels{};
	bool            has_art{};

	bool is_lossless() const;

	bool operator==(const FileRecord&) const = default;
};

} // end of namespace
