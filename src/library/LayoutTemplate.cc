/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/11/2024.
//

#include "LayoutTemplate.hh"

#include "common/Error.hh"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/throw_exception.hpp>

#include <array>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace atd {
namespace {

constexpr std::array<std::string_view, 7> fields{
	"album_artist", "artist", "album", "year", "disc", "track", "title"
};

// Text of a field, or the number when the field is numeric.
struct Value
{
	std::string text;
	bool        numeric{};
};

Value field_value(std::string_view field, const TagInfo& tags)
{
	if (field == "album_artist")
		return {tags.album_artist.value_or(tags.artist.value_or("Unknown Artist"))};
	if (field == "artist")
		return {tags.artist.value_or(tags.album_artist.value_or("Unknown Artist"))};
	if (field == "album")
		return {tags.album.value_or("Unknown Album")};
	if (field == "year")
		return {tags.year.value_or("0000")};
	if (field == "disc")
		return {std::to_string(tags.disc.value_or(1)), true};
	if (field == "track")
		return {std::to_string(tags.track.value_or(0)), true};

	return {tags.title.value_or("Unknown Title")};
}

[[noreturn]] void invalid(std::string_view pattern, const std::string& why)
{
	BOOST_THROW_EXCEPTION(LayoutTemplate::Error()
		<< ErrorCode{make_error_code(Error::invalid_template)}
		<< Message{why + " in layout \"" + std::string{pattern} + "\""}
	);
}

} // end of local namespace

LayoutTemplate::LayoutTemplate(std::string_view pattern) : m_pattern{pattern}
{
	Segment current;
	for (std::size_t i = 0; i < pattern.size(); ++i)
	{
		auto ch = pattern[i];
		if (ch == '}')
			invalid(pattern, "unmatched '}'");

		if (ch != '{')
		{
			current.literal.push_back(ch);
			continue;
		}

		auto close = pattern.find('}', i);
		if (close == pattern.npos)
			invalid(pattern, "unmatched '{'");

		auto token = pattern.substr(i + 1, close - i - 1);
		auto colon = token.find(':');
		current.field = std::string{token.substr(0, colon)};
		if (std::find(fields.begin(), fields.end(), current.field) == fields.end())
			invalid(pattern, "unknown field \"" + current.field + "\"");

		if (colon != token.npos)
		{
			auto width = token.substr(colon + 1);
			auto end    = width.data() + width.size();
			auto [ptr, ec] = std::from_chars(width.data(), end, current.width);
			if (width.empty() || ec != std::errc{} || ptr != end || current.width > max_width)
				invalid(pattern, "bad width for \"" + current.field + "\"");

			current.zero_fill = width.front() == '0';
		}

		m_segments.push_back(std::move(current));
		current = Segment{};
		i = close;
	}
	m_segments.push_back(std::move(current));
}

fs::path LayoutTemplate::render(const TagInfo& tags) const
{
	std::string rendered;
	for (auto&& seg : m_segments)
	{
		rendered += seg.literal;
		if (seg.field.empty())
			continue;

		// a tag never adds a directory level
		auto value = field_value(seg.field, tags);
		std::replace(value.text.begin(), value.text.end(), '/', '_');

		if (value.text.size() < seg.width)
		{
			auto pad = std::string(seg.width - value.text.size(), seg.zero_fill && value.numeric ? '0' : ' ');

			// numbers are right aligned, text is left aligned
			value.text = value.numeric ? pad + value.text : value.text + pad;
		}
		rendered += value.text;
	}

	std::vector<std::string> parts;
	boost::algorithm::split(parts, rendered, boost::algorithm::is_any_of("/"));

	fs::path result;
	for (auto&& part : parts)
		result /= sanitize_component(part);
	return result;
}

std::string sanitize_component(std::string_view component)
{
	std::string result;
	bool space = false;
	for (auto ch : component)
	{
		if (std::isspace(static_cast<unsigned char>(ch)))
		{
			space = true;
			continue;
		}
		if (space && !result.empty())
			result.push_back(' ');
		space = false;

		auto bad = std::string_view{"<>:\"/\\|?*"}.find(ch) != std::string_view::npos ||
			static_cast<unsigned char>(ch) < 0x20;
		result.push_back(bad ? '_' : ch);
	}

	// "." and ".." would escape the layout
	if (result.empty() || result == "." || result == "..")
		return "_";
	return result;
}

} // end of namespace
