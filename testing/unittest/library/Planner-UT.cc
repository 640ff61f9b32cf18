/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/15/2024.
//

#include <catch2/catch.hpp>

#include "FakeMedia.hh"

#include "library/Inventory.hh"
#include "library/LayoutTemplate.hh"
#include "library/Planner.hh"

#include <tuple>

using namespace atd;

class PlannerUTFixture
{
public:
	PlannerUTFixture()
	{
		m_digest.fill(0xd0);

		m_inventory.upsert(record("/music/a.flac", 1200, 30'000'000, ".flac"));
		m_inventory.upsert(record("/music/a_copy.mp3", 320, 8'000'000, ".mp3"));

		m_opts.roots    = {"/music"};
		m_opts.dupe_dir = fs::path{"/dupes"};
	}

protected:
	FileRecord record(const fs::path& path, int bitrate, std::uint64_t size, const std::string& codec)
	{
		FileRecord rec;
		rec.path    = path;
		rec.size    = size;
		rec.bitrate = bitrate;
		rec.codec   = codec.substr(1);
		rec.digest  = m_digest;
		rec.has_art = true;
		return rec;
	}

	Plan plan() const
	{
		return Planner{m_inventory, m_probe}.plan(m_opts);
	}

protected:
	ContentDigest   m_digest;
	Inventory       m_inventory{":memory:"};
	FakeProbe       m_probe;
	PlanOptions     m_opts;
};

TEST_CASE("threshold classification", "[normal]")
{
	Thresholds subject{0.90, 0.75};
	REQUIRE(subject.classify(0.99) == OperationStatus::pending);
	REQUIRE(subject.classify(0.90) == OperationStatus::pending);
	REQUIRE(subject.classify(0.89) == OperationStatus::review);
	REQUIRE(subject.classify(0.75) == OperationStatus::review);
	REQUIRE(subject.classify(0.10) == OperationStatus::review);

	// inverted thresholds still only give pending or review
	Thresholds inverted{0.5, 0.8};
	REQUIRE(inverted.classify(0.6) == OperationStatus::review);
	REQUIRE(inverted.classify(0.9) == OperationStatus::pending);
}

TEST_CASE("tag confidence", "[normal]")
{
	TagInfo tags;
	REQUIRE(Planner::tag_confidence(tags) == Approx(0.1));

	tags.title = "Kelly Watch the Stars";
	REQUIRE(Planner::tag_confidence(tags) == Approx(0.3));

	tags.artist = "Air";
	tags.album  = "Moon Safari";
	tags.track  = 3;
	REQUIRE(Planner::tag_confidence(tags) == Approx(0.6));

	tags.year         = "1998";
	tags.album_artist = "Air";
	REQUIRE(Planner::tag_confidence(tags) == Approx(0.95));
}

TEST_CASE_METHOD(PlannerUTFixture, "exact duplicate in move mode", "[normal]")
{
	auto subject = plan();
	REQUIRE(subject.operations.size() == 1);

	auto& op = subject.operations.front();
	REQUIRE(op.type() == "move");
	REQUIRE(op.path == "/music/a_copy.mp3");
	REQUIRE(op.new_path() == fs::path{"/dupes/a_copy.mp3"});
	REQUIRE(op.confidence == 0.99);
	REQUIRE(op.status == OperationStatus::pending);
	REQUIRE(op.sources == std::vector<std::string>{"hash"});
	REQUIRE(op.metadata["group_hash"] == m_digest.hex());
	REQUIRE(op.metadata["group_id"] == 1);

	REQUIRE(subject.summary.duplicate_groups == 1);
	REQUIRE(subject.summary.moves == 1);
	REQUIRE(subject.summary.deletes == 0);
	REQUIRE(subject.thresholds == m_opts.thresholds);
	REQUIRE(subject.roots == std::vector<fs::path>{"/music"});
}

TEST_CASE_METHOD(PlannerUTFixture, "override forces delete of the canonical member", "[normal]")
{
	m_inventory.set_override(m_digest, "/music/a.flac", {Action::remove, std::nullopt, Timestamp::now()});

	auto subject = plan();
	REQUIRE(subject.operations.size() == 2);

	auto& del = subject.operations[0];
	REQUIRE(del.type() == "delete");
	REQUIRE(del.path == "/music/a.flac");
	REQUIRE_FALSE(del.new_path().has_value());
	REQUIRE(del.sources == std::vector<std::string>{"hash", "override"});
	REQUIRE(subject.operations[1].type() == "move");

	REQUIRE(subject.summary.deletes == 1);
	REQUIRE(subject.summary.estimated_reclaim_bytes == 30'000'000);
}

TEST_CASE_METHOD(PlannerUTFixture, "delete mode", "[normal]")
{
	m_opts.dedupe_mode = DedupeMode::remove;

	auto subject = plan();
	REQUIRE(subject.operations.size() == 1);
	REQUIRE(subject.operations[0].type() == "delete");
	REQUIRE(subject.operations[0].path == "/music/a_copy.mp3");
	REQUIRE(subject.summary.estimated_reclaim_bytes == 8'000'000);

	m_opts.dedupe_mode = DedupeMode::off;
	REQUIRE(plan().operations.empty());

	m_opts.dedupe_mode = DedupeMode::skip;
	REQUIRE(plan().operations.empty());
}

TEST_CASE_METHOD(PlannerUTFixture, "missing dupe dir downgrades to review", "[normal]")
{
	m_opts.dupe_dir = std::nullopt;

	auto subject = plan();
	REQUIRE(subject.operations.size() == 1);

	auto& op = subject.operations.front();
	REQUIRE(op.type() == "review");
	REQUIRE(op.confidence == 0.4);
	REQUIRE(op.status == OperationStatus::review);
	REQUIRE(op.sources == std::vector<std::string>{"override"});
	REQUIRE(subject.summary.reviews == 1);
	REQUIRE(subject.summary.moves == 0);
}

TEST_CASE_METHOD(PlannerUTFixture, "gray zone confidence needs review", "[normal]")
{
	m_opts.thresholds = Thresholds{0.995, 0.75};

	auto subject = plan();
	REQUIRE(subject.operations.front().confidence == 0.99);
	REQUIRE(subject.operations.front().status == OperationStatus::review);
}

TEST_CASE_METHOD(PlannerUTFixture, "rename override", "[normal]")
{
	TagInfo tags;
	tags.artist = "Air";
	tags.title  = "La Femme d'Argent";
	m_probe.tags["/music/a_copy.mp3"] = tags;

	m_inventory.set_override(m_digest, "/music/a_copy.mp3", {Action::rename, "{artist} - {title}", Timestamp::now()});

	auto subject = plan();
	REQUIRE(subject.operations.size() == 1);

	auto& op = subject.operations.front();
	REQUIRE(op.type() == "rename");
	REQUIRE(op.new_path() == fs::path{"/music/Air - La Femme d'Argent.mp3"});
	REQUIRE(op.confidence == 0.8);
	REQUIRE(op.status == OperationStatus::review);
	REQUIRE(op.metadata["template"] == "{artist} - {title}");

	SECTION("without a template")
	{
		m_inventory.set_override(m_digest, "/music/a_copy.mp3", {Action::rename, std::nullopt, Timestamp::now()});
		auto downgraded = plan();
		REQUIRE(downgraded.operations.front().type() == "review");
		REQUIRE(downgraded.operations.front().confidence == 0.4);
	}
	SECTION("with an invalid template")
	{
		m_inventory.set_override(m_digest, "/music/a_copy.mp3", {Action::rename, "{genre}", Timestamp::now()});
		auto downgraded = plan();
		REQUIRE(downgraded.operations.front().type() == "review");
		REQUIRE(downgraded.operations.front().confidence == 0.4);
	}
	SECTION("with a field width out of range")
	{
		for (auto tmpl : {"{track:99999999999999999999} {title}", "{title:4000000000}"})
		{
			m_inventory.set_override(m_digest, "/music/a_copy.mp3", {Action::rename, tmpl, Timestamp::now()});
			auto downgraded = plan();
			REQUIRE(downgraded.operations.front().type() == "review");
			REQUIRE(downgraded.operations.front().confidence == 0.4);
		}
	}
}

TEST_CASE_METHOD(PlannerUTFixture, "mark review override", "[normal]")
{
	m_inventory.set_override(m_digest, "/music/a.flac", {Action::mark_review, std::nullopt, Timestamp::now()});

	auto subject = plan();
	REQUIRE(subject.operations.size() == 2);
	REQUIRE(subject.operations[0].type() == "review");
	REQUIRE(subject.operations[0].confidence == 0.5);
	REQUIRE(subject.operations[0].reason == "Manual review requested");
}

TEST_CASE_METHOD(PlannerUTFixture, "planning twice gives the same operations", "[normal]")
{
	m_opts.layout = "{artist}/{title}";
	m_inventory.upsert(record("/music/other.mp3", 256, 100, ".mp3"));
	m_inventory.set_override(m_digest, "/music/a.flac", {Action::mark_review, std::nullopt, Timestamp::now()});

	auto key = [](const Plan& plan)
	{
		std::vector<std::tuple<std::string, fs::path, std::optional<fs::path>, std::optional<double>, OperationStatus>> result;
		for (auto&& op : plan.operations)
			result.emplace_back(std::string{op.type()}, op.path, op.new_path(), op.confidence, op.status);
		return result;
	};

	auto first  = plan();
	auto second = plan();
	REQUIRE(first.id != second.id);
	REQUIRE(!first.operations.empty());
	REQUIRE(key(first) == key(second));
}

TEST_CASE_METHOD(PlannerUTFixture, "layout renames", "[normal]")
{
	m_opts.dedupe_mode = DedupeMode::off;
	m_opts.layout = "{artist}/{album}/{track:02} {title}";

	TagInfo tags;
	tags.artist         = "Air";
	tags.album_artist   = "Air";
	tags.album          = "Moon Safari";
	tags.year           = "1998";
	tags.track          = 3;
	tags.title          = "Kelly Watch the Stars";
	m_probe.tags["/music/a.flac"] = tags;

	// already in place
	m_probe.tags["/music/a_copy.mp3"] = TagInfo{};
	m_inventory.upsert(record("/music/Unknown Artist/Unknown Album/00 Unknown Title.mp3", 128, 10, ".mp3"));

	// outside the roots
	m_inventory.upsert(record("/elsewhere/x.mp3", 128, 10, ".mp3"));

	auto subject = plan();
	REQUIRE(subject.operations.size() == 2);

	auto& good = subject.operations[0];
	REQUIRE(good.path == "/music/a.flac");
	REQUIRE(good.new_path() == fs::path{"/music/Air/Moon Safari/03 Kelly Watch the Stars.flac"});
	REQUIRE(good.confidence == Approx(0.95));
	REQUIRE(good.status == OperationStatus::pending);
	REQUIRE(good.reason == "Rename to layout (confidence 0.95)");

	auto& poor = subject.operations[1];
	REQUIRE(poor.path == "/music/a_copy.mp3");
	REQUIRE(poor.new_path() == fs::path{"/music/Unknown Artist/Unknown Album/00 Unknown Title.mp3"});
	REQUIRE(poor.status == OperationStatus::review);

	REQUIRE(subject.summary.renames == 2);
	REQUIRE(subject.summary.reviews == 1);
}

TEST_CASE_METHOD(PlannerUTFixture, "layout below the confidence floor needs review", "[normal]")
{
	m_opts.dedupe_mode = DedupeMode::off;
	m_opts.layout = "{title}";
	m_opts.confidence_threshold = 0.99;

	TagInfo tags;
	tags.artist         = "Air";
	tags.album_artist   = "Air";
	tags.album          = "Moon Safari";
	tags.year           = "1998";
	tags.track          = 3;
	tags.title          = "Kelly Watch the Stars";
	m_probe.tags["/music/a.flac"] = tags;
	m_probe.unreadable.insert("/music/a_copy.mp3");

	auto subject = plan();
	REQUIRE(subject.operations.size() == 1);
	REQUIRE(subject.operations.front().status == OperationStatus::review);
}

TEST_CASE_METHOD(PlannerUTFixture, "missing album art", "[normal]")
{
	auto rec = *m_inventory.get("/music/a_copy.mp3");
	rec.has_art = false;
	m_inventory.upsert(rec);

	auto subject = plan();
	REQUIRE(subject.operations.size() == 2);
	REQUIRE(subject.operations[1].type() == "art_fetch");
	REQUIRE(subject.operations[1].confidence == 0.6);
	REQUIRE(subject.operations[1].status == OperationStatus::review);
	REQUIRE(subject.summary.art_fetches == 1);

	m_opts.art_only = true;
	auto art_only = plan();
	REQUIRE(art_only.operations.size() == 1);
	REQUIRE(art_only.operations[0].type() == "art_fetch");
	REQUIRE(art_only.summary.moves == 0);
}

TEST_CASE_METHOD(PlannerUTFixture, "invalid layout fails before planning", "[error]")
{
	m_opts.layout = "{artist";
	REQUIRE_THROWS_AS(plan(), LayoutTemplate::Error);
}
