/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/3/2024.
//

#pragma once

#include "common/crypto/Blake2.hh"
#include "common/FS.hh"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace atd {

/// \brief  Blake2 hash of the full content of a file.
///
/// Two files with the same digest are byte-identical duplicates. The digest
/// is also the durable key of a duplicate group.
struct ContentDigest : std::array<unsigned char, Blake2::size>
{
	ContentDigest() = default;
	explicit ContentDigest(const std::array<unsigned char, Blake2::size>& array);

	static std::optional<ContentDigest> from_hex(std::string_view hex);
	static ContentDigest of_file(const fs::path& file, std::error_code& ec);

	std::string hex() const;
};
static_assert(std::is_standard_layout<ContentDigest>::value);

void from_json(const nlohmann::json& src, ContentDigest& dest);
void to_json(nlohmann::json& dest, const ContentDigest& src);

} // end of namespace
