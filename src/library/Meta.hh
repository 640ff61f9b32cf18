/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/20/2024.
//

#pragma once

#include "Plan.hh"

#include "media/MediaProbe.hh"

#include "common/FS.hh"

#include "config.hh"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace atd {

struct MetaOptions
{
	std::vector<fs::path>   roots;
	std::string             format{constants::filename_format};
	bool                    tags_override_filename{true};
	double                  confidence_threshold{0.85};

	// plan renames below the confidence threshold too
	bool                    force{false};
};

/// \brief  A file whose name does not agree with its tags.
struct MetaIssue
{
	fs::path                    path;
	double                      confidence{};
	std::vector<std::string>    issues;
	std::optional<std::string>  expected;   // file name asked for by the tags, without extension
	std::string                 actual;
};

/// \brief  Renames planned from tags, and the files left alone.
struct MetaFix
{
	Plan        plan;
	std::size_t skipped{};
};

/// \brief  File name pattern with %token% placeholders, e.g. "%artist% - %title%".
///
/// Tokens are artist, title, album, track, disc, year and albumartist. A file
/// name is matched against the pattern case-insensitively, and a space in the
/// pattern matches any run of whitespace.
class FilenameFormat
{
public:
	explicit FilenameFormat(std::string_view format);

	const std::vector<std::string>& tokens() const {return m_tokens;}

	// Normalized token values found in "stem". Empty if "stem" does not have
	// the shape of the format.
	std::map<std::string, std::string> parse(const std::string& stem) const;

	// File name for the tags. Tokens without a tag value are taken from "parsed",
	// unless "tags_first" is false, in which case "parsed" wins. Empty if the
	// format has no token.
	std::optional<std::string> render(
		const TagInfo& tags,
		const std::map<std::string, std::string>& parsed,
		bool tags_first
	) const;

private:
	std::string                 m_format;
	std::vector<std::string>    m_tokens;
	std::regex                  m_pattern;
};

std::vector<MetaIssue> check_metadata(const MediaProbe& probe, const MetaOptions& opts);

// Rename operations for files under the roots whose names do not match their tags.
// A file is skipped if the tags give no name, the confidence is too low or the
// new name is taken.
MetaFix plan_meta_fix(const MediaProbe& probe, const MetaOptions& opts);

// Ratcliff/Obershelp similarity of two strings ignoring case, from 0 to 1.
double similarity(std::string_view left, std::string_view right);

// Lower case with whitespace collapsed.
std::string normalize_name(std::string_view value);

void to_json(nlohmann::json& dest, const MetaIssue& src);

// Text form used by "meta-check" and "meta-report".
std::ostream& operator<<(std::ostream& os, const MetaIssue& issue);

} // end of namespace
