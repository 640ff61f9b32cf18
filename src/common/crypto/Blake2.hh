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

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <iosfwd>
#include <memory>

namespace atd {

class Blake2
{
public:
	Blake2();

	// Full BLAKE2s-256 output. Content digests identify byte-identical files
	// so they are not truncated.
	static const std::size_t size = 32;

	void update(const void *data, std::size_t len);

	// Feed the whole stream in fixed size chunks. Returns the number of bytes
	// consumed. The stream's badbit is left for the caller to check.
	std::uint64_t update(std::istream& in);
	std::array<unsigned char, size> finalize();
	std::size_t finalize(unsigned char *out, std::size_t len);

private:
	struct Deleter {void operator()(::EVP_MD_CTX*);};
	std::unique_ptr<::EVP_MD_CTX, Deleter> m_ctx{::EVP_MD_CTX_new()};
};

} // end of namespace atd
