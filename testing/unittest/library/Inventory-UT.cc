/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/6/2024.
//

#include <catch2/catch.hpp>

#include "library/Inventory.hh"

using namespace atd;

namespace {

ContentDigest digest_of(unsigned char value)
{
	ContentDigest digest;
	digest.fill(value);
	return digest;
}

FileRecord record(const fs::path& path, std::optional<ContentDigest> digest, int bitrate = 320)
{
	FileRecord rec;
	rec.path    = path;
	rec.size    = 1000;
	rec.mtime   = 1'700'000'000'000'000'000;
	rec.digest  = digest;
	rec.codec   = "mp3";
	rec.container = "audio/mpeg";
	rec.duration  = 201.5;
	rec.bitrate   = bitrate;
	rec.sample_rate = 44100;
	rec.channels    = 2;
	return rec;
}

} // end of local namespace

TEST_CASE("upsert and get file records", "[normal]")
{
	Inventory subject{":memory:"};
	REQUIRE_FALSE(subject.get("/music/a.mp3").has_value());

	auto rec = record("/music/a.mp3", digest_of(1));
	subject.upsert(rec);
	REQUIRE(subject.get("/music/a.mp3") == rec);

	rec.size    = 2000;
	rec.has_art = true;
	rec.digest  = std::nullopt;
	subject.upsert(rec);
	REQUIRE(subject.get("/music/a.mp3") == rec);
	REQUIRE(subject.files().size() == 1);
}

TEST_CASE("duplicates are partitioned by digest", "[normal]")
{
	Inventory subject{":memory:"};
	subject.upsert(record("/music/z.mp3", digest_of(2)));
	subject.upsert(record("/music/b.mp3", digest_of(1)));
	subject.upsert(record("/music/a.mp3", digest_of(1)));
	subject.upsert(record("/music/single.mp3", digest_of(3)));
	subject.upsert(record("/music/y.mp3", digest_of(2)));
	subject.upsert(record("/music/none1.mp3", std::nullopt));
	subject.upsert(record("/music/none2.mp3", std::nullopt));

	auto dups = subject.duplicates();
	REQUIRE(dups.size() == 2);
	REQUIRE(dups[0].size() == 2);
	REQUIRE(dups[0][0].path == "/music/a.mp3");
	REQUIRE(dups[0][1].path == "/music/b.mp3");
	REQUIRE(dups[1][0].path == "/music/y.mp3");
	REQUIRE(dups[1][1].path == "/music/z.mp3");

	auto files = subject.files();
	REQUIRE(files.size() == 7);
	REQUIRE(files.front().path == "/music/a.mp3");
}

TEST_CASE("the last override wins", "[normal]")
{
	Inventory subject{":memory:"};
	auto group = digest_of(5);

	subject.set_override(group, "/music/a.mp3", {Action::remove, std::nullopt, Timestamp::now()});
	subject.set_override(group, "/music/a.mp3", {Action::rename, "{title}", Timestamp::now()});
	subject.set_override(group, "/music/b.mp3", {Action::keep, std::nullopt, Timestamp::now()});
	subject.set_override(digest_of(6), "/music/c.mp3", {Action::skip, std::nullopt, Timestamp::now()});

	auto overrides = subject.overrides(group);
	REQUIRE(overrides.size() == 2);
	REQUIRE(overrides.at("/music/a.mp3").action == Action::rename);
	REQUIRE(overrides.at("/music/a.mp3").rename_template == "{title}");
	REQUIRE(overrides.at("/music/b.mp3").action == Action::keep);

	subject.clear_override(group, "/music/a.mp3");
	REQUIRE(subject.overrides(group).size() == 1);
}

TEST_CASE("fingerprints and statistics", "[normal]")
{
	Inventory subject{":memory:"};
	subject.upsert(record("/music/a.mp3", digest_of(1)));
	subject.upsert(record("/music/b.mp3", digest_of(2)));
	subject.upsert_fingerprint("/music/a.mp3", "AQAAfingerprint");

	REQUIRE(subject.fingerprint("/music/a.mp3") == "AQAAfingerprint");
	REQUIRE_FALSE(subject.fingerprint("/music/b.mp3").has_value());

	auto stats = subject.stats();
	REQUIRE(stats.files == 2);
	REQUIRE(stats.fingerprints == 1);
}

TEST_CASE("operation log", "[normal]")
{
	Inventory subject{":memory:"};
	subject.record_operation({"op1", "plan1", "move", "/music/a.mp3", fs::path{"/dupes/a.mp3"}, "moved"});
	subject.record_operation({"op2", "plan1", "delete", "/music/b.mp3", std::nullopt, "review-required"});
	subject.record_operation({"op3", "plan2", "art_fetch", "/music/c.mp3", std::nullopt, "noop"});

	auto rows = subject.operations("plan1");
	REQUIRE(rows.size() == 2);
	REQUIRE(rows[0].op_id == "op1");
	REQUIRE(rows[0].new_path == fs::path{"/dupes/a.mp3"});
	REQUIRE(rows[1].status == "review-required");
	REQUIRE_FALSE(rows[1].new_path.has_value());
}

TEST_CASE("transaction rolls back unless committed", "[normal]")
{
	Inventory subject{":memory:"};
	{
		Transaction tx{subject};
		subject.upsert(record("/music/a.mp3", digest_of(1)));
	}
	REQUIRE(subject.files().empty());

	{
		Transaction tx{subject};
		subject.upsert(record("/music/a.mp3", digest_of(1)));
		tx.commit();
	}
	REQUIRE(subject.files().size() == 1);
}

TEST_CASE("cannot open inventory in missing directory", "[error]")
{
	REQUIRE_THROWS_AS(Inventory{"/nonexistent/dir/library.db"}, Inventory::Error);
}
