/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/3/2024.
//

#include "ContentDigest.hh"

#include "common/Exception.hh"

#include <boost/algorithm/hex.hpp>
#include <boost/throw_exception.hpp>

#include <cerrno>
#include <fstream>

namespace atd {

ContentDigest::ContentDigest(const std::array<unsigned char, Blake2::size>& array) :
	std::array<unsigned char, Blake2::size>{array}
{
}

std::optional<ContentDigest> ContentDigest::from_hex(std::string_view hex)
{
	try
	{
		ContentDigest result;
		if (hex.size() == result.size()*2)
		{
			boost::algorithm::unhex(hex.begin(), hex.end(), result.begin());
			return result;
		}
	}
	catch (boost::algorithm::hex_decode_error&)
	{
	}
	return std::nullopt;
}

ContentDigest ContentDigest::of_file(const fs::path& file, std::error_code& ec)
{
	std::ifstream in{file.string(), std::ios::in | std::ios::binary};
	if (!in)
	{
		ec.assign(errno ? errno : ENOENT, std::system_category());
		return {};
	}

	Blake2 hash;
	hash.update(in);
	if (in.bad())
	{
		ec.assign(EIO, std::system_category());
		return {};
	}

	ec.clear();
	return ContentDigest{hash.finalize()};
}

std::string ContentDigest::hex() const
{
	std::string result(size()*2, '\0');
	boost::algorithm::hex_lower(begin(), end(), result.begin());
	return result;
}

void from_json(const nlohmann::json& src, ContentDigest& dest)
{
	if (auto digest = ContentDigest::from_hex(src.get<std::string>()); digest)
		dest = *digest;
	else
		BOOST_THROW_EXCEPTION(Exception() << Message{"invalid content digest: " + src.get<std::string>()});
}

void to_json(nlohmann::json& dest, const ContentDigest& src)
{
	dest = src.hex();
}

} // end of namespace
