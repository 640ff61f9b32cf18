/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/


//
// Created by nestal on 3/20/2024.
//

#include "Meta.hh"
#include "LayoutTemplate.hh"
#include "Scanner.hh"

#include "common/Log.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <cctype>
#include <numeric>
#include <ostream>

namespace atd {
namespace {

const std::regex& token_pattern()
{
	static const std::regex token{"%([a-zA-Z]+)%"};
	return token;
}

const std::string_view unsafe_characters{"<>:\"/\\|?*"};

std::map<std::string, std::string> tag_values(const TagInfo& tags)
{
	auto number = [](const std::optional<int>& value)
	{
		return value ? std::to_string(*value) : std::string{};
	};
	return {
		{"artist",      tags.artist.value_or("")},
		{"title",       tags.title.value_or("")},
		{"album",       tags.album.value_or("")},
		{"track",       number(tags.track)},
		{"disc",        number(tags.disc)},
		{"year",        tags.year.value_or("")},
		{"albumartist", tags.album_artist.value_or("")}
	};
}

TagInfo read_tags(const MediaProbe& probe, const fs::path& path)
{
	try
	{
		return probe.read_tags(path);
	}
	catch (MediaProbe::Error& e)
	{
		Log(LOG_WARNING, "cannot read tags of %1%: %2%", path.string(), brief(e));
		return {};
	}
}

// Mean similarity of the tags to the values in the file name, and of the
// expected name to the actual one.
double confidence(
	const std::map<std::string, std::string>& tags,
	const std::map<std::string, std::string>& parsed,
	const std::optional<std::string>& expected,
	std::string_view stem
)
{
	std::vector<double> scores;
	for (auto&& [token, value] : parsed)
	{
		if (auto tag = tags.find(token); tag != tags.end() && !tag->second.empty())
			scores.push_back(similarity(tag->second, value));
	}
	if (expected)
		scores.push_back(similarity(*expected, stem));

	return scores.empty() ? 0.0 :
		std::accumulate(scores.begin(), scores.end(), 0.0) / static_cast<double>(scores.size());
}

std::vector<fs::path> audio_files(const std::vector<fs::path>& roots)
{
	auto files = Scanner::discover(roots);
	std::sort(files.begin(), files.end());
	return files;
}

std::size_t matching_characters(std::string_view a, std::string_view b)
{
	if (a.empty() || b.empty())
		return 0;

	// longest common block, the earliest one in "a" on ties
	std::size_t size = 0, a_start = 0, b_start = 0;
	std::vector<std::size_t> prev(b.size() + 1), curr(b.size() + 1);
	for (std::size_t i = 1; i <= a.size(); ++i)
	{
		for (std::size_t j = 1; j <= b.size(); ++j)
		{
			curr[j] = a[i-1] == b[j-1] ? prev[j-1] + 1 : 0;
			if (curr[j] > size)
			{
				size    = curr[j];
				a_start = i - size;
				b_start = j - size;
			}
		}
		std::swap(prev, curr);
	}

	if (size == 0)
		return 0;

	return size +
		matching_characters(a.substr(0, a_start), b.substr(0, b_start)) +
		matching_characters(a.substr(a_start + size), b.substr(b_start + size));
}

} // end of local namespace

FilenameFormat::FilenameFormat(std::string_view format) : m_format{format}
{
	std::string pattern;
	auto literal = [&pattern](const std::string& text)
	{
		for (auto ch : text)
		{
			if (std::isspace(static_cast<unsigned char>(ch)))
			{
				pattern += "\\s+";
				continue;
			}
			if (std::string_view{"\\^$.|?*+()[]{}"}.find(ch) != std::string_view::npos)
				pattern.push_back('\\');
			pattern.push_back(ch);
		}
	};

	auto tail = m_format;
	for (std::sregex_iterator it{m_format.begin(), m_format.end(), token_pattern()}, end; it != end; ++it)
	{
		literal(it->prefix().str());
		m_tokens.push_back(boost::algorithm::to_lower_copy((*it)[1].str()));
		pattern += "(.+?)";
		tail = it->suffix().str();
	}
	literal(tail);

	m_pattern = std::regex{pattern, std::regex::ECMAScript | std::regex::icase};
}

std::map<std::string, std::string> FilenameFormat::parse(const std::string& stem) const
{
	std::map<std::string, std::string> result;

	std::smatch match;
	if (m_tokens.empty() || !std::regex_match(stem, match, m_pattern))
		return result;

	for (std::size_t i = 0; i < m_tokens.size(); ++i)
	{
		if (auto value = normalize_name(match[i + 1].str()); !value.empty())
			result[m_tokens[i]] = std::move(value);
	}
	return result;
}

std::optional<std::string> FilenameFormat::render(
	const TagInfo& tags,
	const std::map<std::string, std::string>& parsed,
	bool tags_first
) const
{
	if (m_tokens.empty())
		return std::nullopt;

	auto values = tag_values(tags);
	auto lookup = [](auto& map, const std::string& key)
	{
		auto it = map.find(key);
		return it != map.end() ? it->second : std::string{};
	};

	std::string rendered;
	auto tail = m_format;
	std::size_t index = 0;
	for (std::sregex_iterator it{m_format.begin(), m_format.end(), token_pattern()}, end; it != end; ++it)
	{
		auto& token = m_tokens[index++];
		auto tag    = lookup(values, token);
		auto named  = lookup(parsed, token);

		auto value = tags_first ? (tag.empty() ? named : tag) : (named.empty() ? tag : named);
		rendered += it->prefix().str();
		rendered += value.empty() ? "Unknown " + token : value;
		tail = it->suffix().str();
	}
	rendered += tail;

	return sanitize_component(rendered);
}

std::vector<MetaIssue> check_metadata(const MediaProbe& probe, const MetaOptions& opts)
{
	FilenameFormat format{opts.format};

	std::vector<MetaIssue> result;
	for (auto&& path : audio_files(opts.roots))
	{
		auto tags     = read_tags(probe, path);
		auto values   = tag_values(tags);
		auto stem     = path.stem().string();
		auto parsed   = format.parse(stem);
		auto expected = format.render(tags, parsed, opts.tags_override_filename);

		std::vector<std::string> issues;
		if (values["artist"].empty())
			issues.emplace_back("missing artist tag");
		if (values["title"].empty())
			issues.emplace_back("missing title tag");
		if (stem.find_first_of(unsafe_characters) != std::string::npos)
			issues.emplace_back("unsafe filename characters");
		if (expected && normalize_name(*expected) != normalize_name(stem))
			issues.push_back((boost::format("filename mismatch: \"%1%\" != \"%2%\"") % stem % *expected).str());

		for (auto&& [token, value] : parsed)
		{
			auto tag = values.find(token);
			if (tag != values.end() && !tag->second.empty() && normalize_name(tag->second) != value)
				issues.push_back((boost::format("%1% mismatch: \"%2%\" != \"%3%\"") % token % tag->second % value).str());
		}

		if (!issues.empty())
			result.push_back({path, confidence(values, parsed, expected, stem), std::move(issues), expected, stem});
	}
	return result;
}

MetaFix plan_meta_fix(const MediaProbe& probe, const MetaOptions& opts)
{
	FilenameFormat format{opts.format};
	Thresholds thresholds{opts.confidence_threshold, opts.confidence_threshold};

	std::vector<Operation> ops;
	std::size_t skipped = 0;
	for (auto&& path : audio_files(opts.roots))
	{
		auto tags     = read_tags(probe, path);
		auto stem     = path.stem().string();
		auto parsed   = format.parse(stem);
		auto expected = format.render(tags, parsed, opts.tags_override_filename);
		if (!expected)
		{
			++skipped;
			continue;
		}

		auto dest = path.parent_path() / (*expected + path.extension().string());
		if (dest == path)
			continue;

		auto score = confidence(tag_values(tags), parsed, expected, stem);
		if ((score < opts.confidence_threshold && !opts.force) || fs::exists(dest))
		{
			Log(LOG_DEBUG, "not renaming %1% to %2% (confidence %3$.2f)", path.string(), dest.string(), score);
			++skipped;
			continue;
		}

		ops.push_back(Operation::create(
			op::Rename{dest}, path,
			(boost::format("Meta fix rename (confidence %1$.2f)") % score).str(),
			score, {"metadata"}, thresholds.classify(score),
			{{"expected", *expected}}
		));
	}

	Summary summary;
	summary.renames = ops.size();
	Log(LOG_INFO, "meta fix: %1% files to rename, %2% skipped", ops.size(), skipped);

	return {Plan::create(absolute_paths(opts.roots), std::move(ops), summary, thresholds), skipped};
}

double similarity(std::string_view left, std::string_view right)
{
	if (left.empty() && right.empty())
		return 1.0;

	auto a = boost::algorithm::to_lower_copy(std::string{left});
	auto b = boost::algorithm::to_lower_copy(std::string{right});
	return 2.0 * static_cast<double>(matching_characters(a, b)) / static_cast<double>(a.size() + b.size());
}

std::string normalize_name(std::string_view value)
{
	std::string result;
	bool space = false;
	for (auto ch : value)
	{
		if (std::isspace(static_cast<unsigned char>(ch)))
		{
			space = true;
			continue;
		}
		if (space && !result.empty())
			result.push_back(' ');
		space = false;
		result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
	}
	return result;
}

void to_json(nlohmann::json& dest, const MetaIssue& src)
{
	dest = {
		{"path",        src.path.string()},
		{"confidence",  src.confidence},
		{"issues",      src.issues},
		{"expected",    src.expected ? nlohmann::json(*src.expected) : nlohmann::json{}},
		{"actual",      src.actual}
	};
}

std::ostream& operator<<(std::ostream& os, const MetaIssue& issue)
{
	os << "File: " << issue.path.string() << "\n";
	for (auto&& item : issue.issues)
		os << "- " << item << "\n";
	return os << boost::format("Confidence: %1$.2f\n") % issue.confidence;
}

} // end of namespace
