/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#pragma once

#include <boost/filesystem.hpp>

#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

// wrappers for std::error_code -> boost::error_code
// injected to boost::filesystem to make namespace-dependent lookup works
namespace boost::filesystem {

void rename(const path& src, const path& dest, std::error_code& ec);
void create_directories(const path& dir, std::error_code& ec);

}

namespace atd {
namespace fs = boost::filesystem;

struct FileStat
{
	std::uint64_t   size{};
	std::int64_t    mtime{};        // nanoseconds since epoch
};

FileStat stat_file(const fs::path& path, std::error_code& ec);

// Lexical containment: "path" relative to "root" if "root" is one of its ancestors.
std::optional<fs::path> relative_to(const fs::path& path, const fs::path& root);

// Rename "src" to "dest". Falls back to copy and remove across file systems.
// Never replaces an existing "dest".
void move_file(const fs::path& src, const fs::path& dest, std::error_code& ec);

fs::path expand_user(const fs::path& path);

// Absolute and lexically normal, without a trailing separator.
fs::path absolute_path(const fs::path& path);
std::vector<fs::path> absolute_paths(const std::vector<fs::path>& paths);

} // end of namespace
