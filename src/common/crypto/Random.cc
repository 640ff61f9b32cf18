/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#include "Random.hh"

#include <boost/algorithm/hex.hpp>

#include <stdexcept>
#include <system_error>
#include <limits>

#include <openssl/rand.h>
#include <openssl/err.h>

namespace atd {

void secure_random(void *buf, std::size_t size)
{
	if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
		throw std::length_error("random buffer too large");

	if (::RAND_priv_bytes(reinterpret_cast<unsigned char*>(buf), static_cast<int>(size)) != 1)
		throw std::system_error(static_cast<int>(::ERR_get_error()), std::generic_category());
}

std::string random_uuid()
{
	auto bytes = secure_random_array<unsigned char, 16>();
	bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
	bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

	std::string hex(bytes.size()*2, '\0');
	boost::algorithm::hex_lower(bytes.begin(), bytes.end(), hex.begin());
	return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' +
		hex.substr(16, 4) + '-' + hex.substr(20);
}

} // end of namespace atd
