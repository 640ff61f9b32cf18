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

#include "common/Exception.hh"
#include "common/FS.hh"

#include <optional>
#include <string>

namespace atd {

/// \brief  Textual tags of a track. Absent tags are std::nullopt.
struct TagInfo
{
	std::optional<std::string>  artist;
	std::optional<std::string>  title;
	std::optional<std::string>  album;
	std::optional<std::string>  album_artist;
	std::optional<std::string>  year;
	std::optional<int>          track;
	std::optional<int>          disc;
};

struct StreamInfo
{
	std::string codec;
	double      duration{};     // in seconds
	int         bitrate{};      // in kbps
	int         sample_rate{};
	int         channels{};
};

/// \brief  Reads tags and stream properties of audio files.
///
/// Implementations must be safe to call from several scanner threads at the same time.
class MediaProbe
{
public:
	struct Error : virtual Exception {};

public:
	virtual ~MediaProbe() = default;

	virtual TagInfo read_tags(const fs::path& file) const = 0;
	virtual StreamInfo probe(const fs::path& file) const = 0;
	virtual bool has_embedded_art(const fs::path& file) const = 0;
};

} // end of namespace
