/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/4/2024.
//

#pragma once

#include "common/Exception.hh"
#include "common/FS.hh"

#include <string>

namespace atd {

/// \brief  Computes acoustic fingerprints.
///
/// A failure (tool missing, undecodable file) throws Fingerprinter::Error. Callers
/// treat it as "no fingerprint" rather than a failure of the file.
class Fingerprinter
{
public:
	struct Error : virtual Exception {};

public:
	virtual ~Fingerprinter() = default;

	virtual std::string fingerprint(const fs::path& file) const = 0;
};

} // end of namespace
