/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#include "FS.hh"
#include "Error.hh"

#include <sys/stat.h>
#include <cerrno>
#include <cstdlib>

namespace boost::filesystem {

void rename(const path& src, const path& dest, std::error_code& ec)
{
	boost::system::error_code bec;
	rename(src, dest, bec);
	ec.assign(bec.value(), std::system_category());
}

void create_directories(const path& dir, std::error_code& ec)
{
	boost::system::error_code bec;
	create_directories(dir, bec);
	ec.assign(bec.value(), std::system_category());
}

}

namespace atd {

FileStat stat_file(const fs::path& path, std::error_code& ec)
{
	struct ::stat st{};
	if (::stat(path.c_str(), &st) != 0)
	{
		ec.assign(errno, std::system_category());
		return {};
	}

	ec.clear();
	return {
		static_cast<std::uint64_t>(st.st_size),
		static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 + st.st_mtim.tv_nsec
	};
}

std::optional<fs::path> relative_to(const fs::path& path, const fs::path& root)
{
	// trailing slash in root shows up as "." in boost
	auto base = root.filename_is_dot() ? root.parent_path() : root;

	auto pit = path.begin();
	for (auto&& part : base)
	{
		if (pit == path.end() || *pit != part)
			return std::nullopt;
		++pit;
	}

	fs::path result;
	for (; pit != path.end(); ++pit)
		result /= *pit;
	return result;
}

void move_file(const fs::path& src, const fs::path& dest, std::error_code& ec)
{
	if (fs::exists(dest))
	{
		ec = Error::destination_exists;
		return;
	}
	if (!fs::exists(src))
	{
		ec = Error::source_not_found;
		return;
	}

	fs::rename(src, dest, ec);
	if (ec == std::errc::cross_device_link)
	{
		boost::system::error_code bec;
		fs::copy_file(src, dest, bec);
		if (!bec)
			fs::remove(src, bec);
		ec.assign(bec.value(), std::system_category());
	}
}

fs::path expand_user(const fs::path& path)
{
	auto str = path.string();
	if (str.empty() || str.front() != '~')
		return path;

	auto home = std::getenv("HOME");
	if (!home)
		return path;
	return str.size() > 2 ? fs::path{home} / str.substr(2) : fs::path{home};
}

fs::path absolute_path(const fs::path& path)
{
	auto result = fs::absolute(expand_user(path)).lexically_normal();
	if (result.filename_is_dot() && result.has_parent_path())
		result = result.parent_path();
	return result;
}

std::vector<fs::path> absolute_paths(const std::vector<fs::path>& paths)
{
	std::vector<fs::path> result;
	for (auto&& path : paths)
		result.push_back(absolute_path(path));
	return result;
}

} // end of namespace
