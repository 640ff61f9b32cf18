/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/10/2024.
//

#pragma once

#include "media/Fingerprinter.hh"
#include "media/MediaProbe.hh"

#include <boost/throw_exception.hpp>

#include <map>
#include <set>

namespace atd {

/// MediaProbe with canned answers keyed by path. Unknown paths have no tags.
/// Only populated before the scanner threads start.
class FakeProbe : public MediaProbe
{
public:
	TagInfo read_tags(const fs::path& file) const override
	{
		if (unreadable.count(file) > 0)
			BOOST_THROW_EXCEPTION(Error() << Path{file} << Message{"cannot read tags"});

		auto it = tags.find(file);
		return it != tags.end() ? it->second : TagInfo{};
	}

	StreamInfo probe(const fs::path& file) const override
	{
		if (unreadable.count(file) > 0)
			BOOST_THROW_EXCEPTION(Error() << Path{file} << Message{"cannot probe"});

		auto it = streams.find(file);
		return it != streams.end() ? it->second : StreamInfo{"mp3", 180.0, 192, 44100, 2};
	}

	bool has_embedded_art(const fs::path& file) const override
	{
		return art.count(file) > 0;
	}

	std::map<fs::path, TagInfo>     tags;
	std::map<fs::path, StreamInfo>  streams;
	std::set<fs::path>              art;
	std::set<fs::path>              unreadable;
};

/// Fingerprint is the file name, except for the paths in "failures".
class FakeFingerprinter : public Fingerprinter
{
public:
	std::string fingerprint(const fs::path& file) const override
	{
		if (failures.count(file) > 0)
			BOOST_THROW_EXCEPTION(Error() << Path{file} << Message{"fpcalc failed"});
		return "fp:" + file.filename().string();
	}

	std::set<fs::path> failures;
};

} // end of namespace
