/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/6/2024.
//

#pragma once

#include "MediaProbe.hh"

namespace atd {

/// \brief  MediaProbe backed by TagLib.
class TagLibProbe : public MediaProbe
{
public:
	TagInfo read_tags(const fs::path& file) const override;
	StreamInfo probe(const fs::path& file) const override;
	bool has_embedded_art(const fs::path& file) const override;
};

} // end of namespace
