/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/11/2024.
//

#pragma once

#include "media/MediaProbe.hh"

#include "common/Exception.hh"
#include "common/FS.hh"

#include <string>
#include <string_view>
#include <vector>

namespace atd {

/// \brief  Relative path pattern filled from the tags of a track.
///
/// "{album_artist}/{album} ({year})/{disc}-{track:02} {title}" gives
/// "Air/Moon Safari (1998)/1-03 Kelly Watch the Stars". Fields are
/// album_artist, artist, album, year, disc, track and title. A width
/// after the colon pads numbers with zeros ("{track:02}").
/// Each path component is sanitized after rendering.
class LayoutTemplate
{
public:
	struct Error : virtual Exception {};

	// widest field padding allowed
	static const std::size_t max_width = 255;

public:
	explicit LayoutTemplate(std::string_view pattern);

	fs::path render(const TagInfo& tags) const;

	const std::string& pattern() const {return m_pattern;}

private:
	struct Segment
	{
		std::string literal;    // text before the field
		std::string field;      // empty for the trailing text
		std::size_t width{};
		bool        zero_fill{};
	};

private:
	std::string             m_pattern;
	std::vector<Segment>    m_segments;
};

// Replace characters not allowed in file names with '_' and collapse whitespace.
std::string sanitize_component(std::string_view component);

} // end of namespace
