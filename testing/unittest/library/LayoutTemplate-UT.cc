/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/11/2024.
//

#include <catch2/catch.hpp>

#include "library/LayoutTemplate.hh"

#include "config.hh"

using namespace atd;

TEST_CASE("render default layout", "[normal]")
{
	LayoutTemplate subject{constants::default_layout};

	TagInfo tags;
	tags.artist         = "Air";
	tags.album_artist   = "Air";
	tags.album          = "Moon Safari";
	tags.year           = "1998";
	tags.track          = 3;
	tags.title          = "Kelly Watch the Stars";

	REQUIRE(subject.render(tags) == fs::path{"Air/Moon Safari (1998)/1-03 Kelly Watch the Stars"});
}

TEST_CASE("missing tags get placeholders", "[normal]")
{
	LayoutTemplate subject{"{album_artist}/{album}/{track:02} {title}"};
	REQUIRE(subject.render({}) == fs::path{"Unknown Artist/Unknown Album/00 Unknown Title"});

	TagInfo tags;
	tags.artist = "Björk";
	REQUIRE(subject.render(tags) == fs::path{"Björk/Unknown Album/00 Unknown Title"});
}

TEST_CASE("tags cannot escape their path component", "[normal]")
{
	LayoutTemplate subject{"{artist}/{title}"};

	TagInfo tags;
	tags.artist = "AC/DC";
	tags.title  = "What?  Where:  *Here*";
	REQUIRE(subject.render(tags) == fs::path{"AC_DC/What_ Where_ _Here_"});

	tags.artist = "..";
	tags.title  = "   ";
	REQUIRE(subject.render(tags) == fs::path{"_/_"});
}

TEST_CASE("sanitize path components", "[normal]")
{
	REQUIRE(sanitize_component("  a \t b  ") == "a b");
	REQUIRE(sanitize_component("a<b>c|d") == "a_b_c_d");
	REQUIRE(sanitize_component("") == "_");
	REQUIRE(sanitize_component(".") == "_");
	REQUIRE(sanitize_component("...") == "...");
}

TEST_CASE("invalid layouts", "[error]")
{
	REQUIRE_THROWS_AS(LayoutTemplate{"{artist"}, LayoutTemplate::Error);
	REQUIRE_THROWS_AS(LayoutTemplate{"artist}"}, LayoutTemplate::Error);
	REQUIRE_THROWS_AS(LayoutTemplate{"{genre}/{title}"}, LayoutTemplate::Error);
	REQUIRE_THROWS_AS(LayoutTemplate{"{track:xx}"}, LayoutTemplate::Error);
	REQUIRE_THROWS_AS(LayoutTemplate{"{track:-2}"}, LayoutTemplate::Error);
	REQUIRE_THROWS_AS(LayoutTemplate{"{track:}"}, LayoutTemplate::Error);
}

TEST_CASE("field widths are bounded", "[error]")
{
	REQUIRE_THROWS_AS(LayoutTemplate{"{track:99999999999999999999} {title}"}, LayoutTemplate::Error);
	REQUIRE_THROWS_AS(LayoutTemplate{"{title:4000000000}"}, LayoutTemplate::Error);
	REQUIRE_THROWS_AS(LayoutTemplate{"{title:256}"}, LayoutTemplate::Error);

	TagInfo tags;
	tags.track = 7;
	auto widest = LayoutTemplate{"{track:0255}"}.render(tags).string();
	REQUIRE(widest.size() == 255);
	REQUIRE(widest.back() == '7');
	REQUIRE_NOTHROW(LayoutTemplate{"plain text"});
}
