/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/4/2024.
//

#include <catch2/catch.hpp>

#include "library/ContentDigest.hh"
#include "common/Exception.hh"

#include <fstream>

using namespace atd;

class ContentDigestUTFixture
{
public:
	ContentDigestUTFixture()
	{
		fs::remove_all(m_dir);
		fs::create_directories(m_dir);
	}

protected:
	fs::path write(const std::string& name, const std::string& content)
	{
		auto path = m_dir / name;
		std::ofstream{path.string(), std::ios::binary} << content;
		return path;
	}

protected:
	const fs::path m_dir{"/tmp/ContentDigest-UT"};
};

TEST_CASE_METHOD(ContentDigestUTFixture, "identical files have the same digest", "[normal]")
{
	std::string big(200'000, 'x');
	auto a = write("a.mp3", big);
	auto b = write("b.flac", big);
	auto c = write("c.mp3", big + "y");

	std::error_code ec;
	auto da = ContentDigest::of_file(a, ec);
	REQUIRE(!ec);
	auto db = ContentDigest::of_file(b, ec);
	REQUIRE(!ec);
	auto dc = ContentDigest::of_file(c, ec);
	REQUIRE(!ec);

	REQUIRE(da == db);
	REQUIRE(da != dc);
	REQUIRE(da != ContentDigest{});
}

TEST_CASE_METHOD(ContentDigestUTFixture, "digest of missing file", "[error]")
{
	std::error_code ec;
	ContentDigest::of_file(m_dir / "missing.mp3", ec);
	REQUIRE(ec);
}

TEST_CASE("digest in hex", "[normal]")
{
	ContentDigest digest;
	digest.fill(0xab);

	auto hex = digest.hex();
	REQUIRE(hex.size() == 64);
	REQUIRE(hex.substr(0, 4) == "abab");
	REQUIRE(ContentDigest::from_hex(hex) == digest);

	nlohmann::json json = digest;
	REQUIRE(json.get<std::string>() == hex);
	REQUIRE(json.get<ContentDigest>() == digest);
}

TEST_CASE("invalid hex digest", "[error]")
{
	REQUIRE_FALSE(ContentDigest::from_hex("abc").has_value());
	REQUIRE_FALSE(ContentDigest::from_hex(std::string(64, 'z')).has_value());
	REQUIRE_THROWS_AS(nlohmann::json("xyz").get<ContentDigest>(), Exception);
}
