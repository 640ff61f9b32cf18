/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/5/2024.
//

#pragma once

#include "Fingerprinter.hh"

namespace atd {

/// \brief  Chromaprint fingerprints by running the "fpcalc" tool.
class Fpcalc : public Fingerprinter
{
public:
	explicit Fpcalc(fs::path exe = "fpcalc");

	std::string fingerprint(const fs::path& file) const override;

	// Full path of the executable, or empty if it cannot be found.
	fs::path executable() const;
	bool available() const {return !executable().empty();}

	// Extracts the fingerprint from the output of "fpcalc -json".
	static std::string parse_output(std::string_view json);

private:
	fs::path m_exe;
};

} // end of namespace
