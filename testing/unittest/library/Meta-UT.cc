/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/20/2024.
//

#include <catch2/catch.hpp>

#include "FakeMedia.hh"

#include "library/Applier.hh"
#include "library/Inventory.hh"
#include "library/Meta.hh"
#include "library/Undo.hh"

#include <algorithm>
#include <fstream>
#include <sstream>

using namespace atd;

class MetaUTFixture
{
public:
	MetaUTFixture()
	{
		fs::remove_all(m_dir);
		fs::create_directories(m_music);

		add("Air - Sexy Boy.mp3",                 "Air", "Sexy Boy");
		add("Air - Kelly Watch The Star.mp3",     "Air", "Kelly Watch the Stars");
		add("Daft Punk - One More Time.flac",     "Air", "One More Time");
		add("track01.mp3",                        "Air", "La Femme d'Argent");
		touch(m_music / "unknown.mp3");

		m_opts.roots = {m_music};
	}

protected:
	fs::path touch(const fs::path& path)
	{
		std::ofstream{path.string()} << "audio";
		return path;
	}

	void add(const std::string& name, std::string artist, std::string title)
	{
		TagInfo tags;
		tags.artist = std::move(artist);
		tags.title  = std::move(title);
		m_probe.tags[touch(m_music / name)] = tags;
	}

protected:
	const fs::path  m_dir{"/tmp/Meta-UT"};
	const fs::path  m_music{m_dir / "music"};
	FakeProbe       m_probe;
	MetaOptions     m_opts;
};

TEST_CASE("parse file names", "[normal]")
{
	FilenameFormat subject{"%artist% - %title%"};
	REQUIRE(subject.tokens() == std::vector<std::string>{"artist", "title"});

	auto parsed = subject.parse("Air  -   Kelly Watch the Stars");
	REQUIRE(parsed.size() == 2);
	REQUIRE(parsed["artist"] == "air");
	REQUIRE(parsed["title"] == "kelly watch the stars");

	REQUIRE(subject.parse("no separator").empty());
	REQUIRE(FilenameFormat{"%Track% of %title%"}.parse("03 OF Kelly") ==
		std::map<std::string, std::string>{{"track", "03"}, {"title", "kelly"}});

	// regex characters in the format are literal
	REQUIRE(FilenameFormat{"(%track%) %title%"}.parse("(03) Kelly").at("track") == "03");
	REQUIRE(FilenameFormat{"(%track%) %title%"}.parse("03 Kelly").empty());

	FilenameFormat plain{"plain"};
	REQUIRE(plain.tokens().empty());
	REQUIRE(plain.parse("plain").empty());
	REQUIRE_FALSE(plain.render({}, {}, true));
}

TEST_CASE("render file names", "[normal]")
{
	FilenameFormat subject{"%artist% - %title%"};

	TagInfo tags;
	tags.artist = "Air";
	tags.title  = "What?";
	REQUIRE(subject.render(tags, {}, true) == "Air - What_");
	REQUIRE(subject.render({}, {{"artist", "air"}}, true) == "air - Unknown title");

	// which side wins
	std::map<std::string, std::string> parsed{{"artist", "daft punk"}};
	REQUIRE(subject.render(tags, parsed, true) == "Air - What_");
	REQUIRE(subject.render(tags, parsed, false) == "daft punk - What_");

	tags.track = 3;
	REQUIRE(FilenameFormat{"%track%. %title%"}.render(tags, {}, true) == "3. What_");
}

TEST_CASE("similarity of names", "[normal]")
{
	REQUIRE(similarity("abc", "abc") == 1.0);
	REQUIRE(similarity("", "") == 1.0);
	REQUIRE(similarity("abc", "") == 0.0);
	REQUIRE(similarity("Air", "aIR") == 1.0);
	REQUIRE(similarity("abcd", "bcde") == Approx(0.75));
	REQUIRE(similarity("abxcd", "abcd") == Approx(8.0 / 9.0));

	REQUIRE(normalize_name("  Kelly \t Watch  ") == "kelly watch");
}

TEST_CASE_METHOD(MetaUTFixture, "check file names against tags", "[normal]")
{
	auto issues = check_metadata(m_probe, m_opts);
	REQUIRE(issues.size() == 4);

	auto& typo = issues[0];
	REQUIRE(typo.path == m_music / "Air - Kelly Watch The Star.mp3");
	REQUIRE(typo.expected == "Air - Kelly Watch the Stars");
	REQUIRE(typo.actual == "Air - Kelly Watch The Star");
	REQUIRE(typo.issues.size() == 2);
	REQUIRE(typo.confidence > 0.95);

	auto& other_artist = issues[1];
	REQUIRE(other_artist.path.filename() == "Daft Punk - One More Time.flac");
	REQUIRE(other_artist.issues == std::vector<std::string>{
		"filename mismatch: \"Daft Punk - One More Time\" != \"Air - One More Time\"",
		"artist mismatch: \"Air\" != \"daft punk\""
	});
	REQUIRE(other_artist.confidence < 0.85);

	auto& numbered = issues[2];
	REQUIRE(numbered.path.filename() == "track01.mp3");
	REQUIRE(numbered.issues.size() == 1);

	auto& untagged = issues[3];
	REQUIRE(untagged.issues.size() == 3);
	REQUIRE(untagged.issues[0] == "missing artist tag");
	REQUIRE(untagged.issues[1] == "missing title tag");
	REQUIRE(untagged.expected == "Unknown artist - Unknown title");

	nlohmann::json json = issues;
	REQUIRE(json.size() == 4);
	REQUIRE(json[3]["actual"] == "unknown");
	REQUIRE(json[3]["issues"].size() == 3);

	std::ostringstream text;
	text << numbered;
	REQUIRE(text.str().find("File: " + numbered.path.string() + "\n- filename mismatch") == 0);
	REQUIRE(text.str().find("Confidence: 0.") != std::string::npos);
}

TEST_CASE_METHOD(MetaUTFixture, "unsafe characters in file names", "[normal]")
{
	auto unsafe = touch(m_music / "Air - Sexy Boy?.mp3");
	m_opts.roots = {unsafe};

	auto issues = check_metadata(m_probe, m_opts);
	REQUIRE(issues.size() == 1);
	REQUIRE(std::find(issues[0].issues.begin(), issues[0].issues.end(), "unsafe filename characters") != issues[0].issues.end());
}

TEST_CASE_METHOD(MetaUTFixture, "plan renames from tags", "[normal]")
{
	auto [plan, skipped] = plan_meta_fix(m_probe, m_opts);
	REQUIRE(skipped == 3);
	REQUIRE(plan.summary.renames == 1);
	REQUIRE(plan.operations.size() == 1);

	auto& op = plan.operations.front();
	REQUIRE(op.type() == "rename");
	REQUIRE(op.path == m_music / "Air - Kelly Watch The Star.mp3");
	REQUIRE(op.new_path() == m_music / "Air - Kelly Watch the Stars.mp3");
	REQUIRE(op.status == OperationStatus::pending);
	REQUIRE(op.sources == std::vector<std::string>{"metadata"});
	REQUIRE(op.metadata["expected"] == "Air - Kelly Watch the Stars");
	REQUIRE(op.reason.find("Meta fix rename (confidence 0.9") == 0);
}

TEST_CASE_METHOD(MetaUTFixture, "forced renames need review", "[normal]")
{
	add("Air - One More Time.flac", "Air", "One More Time");

	m_opts.force = true;
	auto [plan, skipped] = plan_meta_fix(m_probe, m_opts);

	// the new name of "Daft Punk - One More Time.flac" is taken
	REQUIRE(skipped == 1);
	REQUIRE(plan.operations.size() == 3);
	REQUIRE(plan.operations[1].new_path() == m_music / "Air - La Femme d'Argent.mp3");
	REQUIRE(plan.operations[1].status == OperationStatus::review);
	REQUIRE(plan.operations[2].new_path() == m_music / "Unknown artist - Unknown title.mp3");
}

TEST_CASE_METHOD(MetaUTFixture, "apply and undo renames from tags", "[normal]")
{
	auto fix = plan_meta_fix(m_probe, m_opts);

	Inventory inventory{":memory:"};
	auto result = Applier{inventory}.apply(fix.plan, {m_dir / "journals"});
	REQUIRE(result.journal.entries.size() == 1);
	REQUIRE(result.journal.entries[0].status == OperationStatus::moved);
	REQUIRE(fs::exists(m_music / "Air - Kelly Watch the Stars.mp3"));
	REQUIRE_FALSE(fs::exists(m_music / "Air - Kelly Watch The Star.mp3"));

	auto report = Undo{{m_dir / "journals"}}.run("last");
	REQUIRE(report.count(UndoOutcome::restored) == 1);
	REQUIRE(fs::exists(m_music / "Air - Kelly Watch The Star.mp3"));
}
