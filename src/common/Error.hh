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

#include <system_error>

namespace atd {

enum class Error
{
	ok,
	journal_not_found,
	destination_exists,
	source_not_found,
	invalid_plan,
	invalid_template,
	invalid_override,
	fingerprint_unavailable,
	inventory_error,

	unknown_error
};

const std::error_category& atd_error_category();
std::error_code make_error_code(Error err);

} // end of namespace atd

namespace std
{
	template <> struct is_error_code_enum<atd::Error> : true_type {};
}
