/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/2/2024.
//

#include "Error.hh"

#include <string>

namespace atd {

const std::error_category& atd_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "atd"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::journal_not_found: return "journal not found";
				case Error::destination_exists: return "destination already exists";
				case Error::source_not_found: return "source file not found";
				case Error::invalid_plan: return "invalid plan document";
				case Error::invalid_template: return "invalid layout template";
				case Error::invalid_override: return "invalid override";
				case Error::fingerprint_unavailable: return "fingerprint unavailable";
				case Error::inventory_error: return "inventory error";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), atd_error_category());
}

} // end of namespace
