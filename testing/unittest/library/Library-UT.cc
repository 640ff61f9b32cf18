/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/18/2024.
//

#include <catch2/catch.hpp>

#include "FakeMedia.hh"

#include "library/Library.hh"

#include <fstream>

using namespace atd;

class LibraryUTFixture
{
public:
	LibraryUTFixture()
	{
		fs::remove_all(m_dir);
		for (auto name : {"a.flac", "b/a copy.mp3", "c.mp3"})
		{
			auto path = m_dir / "music" / name;
			fs::create_directories(path.parent_path());
			std::ofstream{path.string()} << (path.extension() == ".mp3" && path.stem() == "c" ? "unique" : "same audio");
		}
		m_probe.streams[m_dir / "music/a.flac"] = StreamInfo{"flac", 200, 900, 44100, 2};
	}

protected:
	const fs::path      m_dir{"/tmp/Library-UT"};
	FakeProbe           m_probe;
	FakeFingerprinter   m_fingerprinter;
	Library             m_subject{":memory:", m_probe, m_fingerprinter};
};

TEST_CASE_METHOD(LibraryUTFixture, "scan, plan, apply and undo", "[normal]")
{
	auto stats = m_subject.scan({{m_dir / "music"}, 2});
	REQUIRE(stats.hashes_computed == 3);
	REQUIRE(m_subject.cache_stats().files == 3);
	REQUIRE(m_subject.cache_stats().fingerprints == 3);

	auto groups = m_subject.groups({});
	REQUIRE(groups.size() == 1);
	REQUIRE(groups[0].canonical_member().path == m_dir / "music/a.flac");

	PlanOptions opts;
	opts.roots      = {m_dir / "music"};
	opts.dupe_dir   = m_dir / "dupes";
	auto plan = m_subject.plan(opts);
	auto moves = plan_actions(plan, "move");
	REQUIRE(moves.size() == 1);
	REQUIRE(moves[0].path == m_dir / "music/b/a copy.mp3");

	auto result = m_subject.apply(plan, {m_dir / "journals"});
	REQUIRE(fs::exists(m_dir / "dupes/a copy.mp3"));

	auto report = m_subject.undo(result.journal.id, {m_dir / "journals"});
	REQUIRE(report.count(UndoOutcome::restored) == 1);
	REQUIRE(fs::exists(m_dir / "music/b/a copy.mp3"));
}

TEST_CASE_METHOD(LibraryUTFixture, "overrides by pattern and by review command", "[normal]")
{
	m_subject.scan({{m_dir / "music"}, 1});

	auto set = m_subject.set_override(1, Action::remove, "*.mp3", std::nullopt, {});
	REQUIRE(set.size() == 1);

	auto digest = m_subject.groups({})[0].digest;
	auto overrides = m_subject.inventory().overrides(digest);
	REQUIRE(overrides.at(m_dir / "music/b/a copy.mp3").action == Action::remove);

	auto intent = m_subject.review(1, "k all", {});
	REQUIRE(intent.command == ReviewIntent::Command::set);
	overrides = m_subject.inventory().overrides(digest);
	REQUIRE(overrides.size() == 2);
	REQUIRE(overrides.at(m_dir / "music/b/a copy.mp3").action == Action::keep);

	// navigation commands store nothing
	REQUIRE(m_subject.review(1, "next", {}).command == ReviewIntent::Command::next);

	REQUIRE_THROWS_AS(m_subject.set_override(2, Action::keep, "*", std::nullopt, {}), InvalidOverride);
	REQUIRE_THROWS_AS(m_subject.set_override(1, Action::keep, "*.ogg", std::nullopt, {}), InvalidOverride);
}

TEST_CASE_METHOD(LibraryUTFixture, "analyze", "[normal]")
{
	m_subject.scan({{m_dir / "music"}, 1});

	auto report = m_subject.analyze({});
	REQUIRE(report.files_total == 3);
	REQUIRE(report.duplicate_groups == 1);
	REQUIRE(report.duplicate_files == 2);
	REQUIRE(report.missing_art == 3);
	REQUIRE(report.reclaimable_bytes == std::string{"same audio"}.size());
}
