/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/5/2024.
//

#include "Fpcalc.hh"

#include "common/Error.hh"

#include <boost/process.hpp>
#include <nlohmann/json.hpp>

#include <iterator>

namespace bp = boost::process;

namespace atd {

Fpcalc::Fpcalc(fs::path exe) : m_exe{std::move(exe)}
{
}

fs::path Fpcalc::executable() const
{
	if (m_exe.has_parent_path())
		return fs::exists(m_exe) ? m_exe : fs::path{};

	return bp::search_path(m_exe.string());
}

std::string Fpcalc::fingerprint(const fs::path& file) const
{
	auto exe = executable();
	if (exe.empty())
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(atd::Error::fingerprint_unavailable)}
			<< Message{m_exe.string() + " not found"}
			<< Path{file}
		);

	bp::ipstream out;
	std::error_code ec;
	bp::child proc{exe, "-json", file.string(), bp::std_out > out, bp::std_err > bp::null, ec};
	if (ec)
		BOOST_THROW_EXCEPTION(Error() << ErrorCode{ec} << Path{file});

	std::string output{std::istreambuf_iterator<char>{out}, std::istreambuf_iterator<char>{}};
	proc.wait(ec);
	if (ec || proc.exit_code() != 0)
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(atd::Error::fingerprint_unavailable)}
			<< Message{"fpcalc exited with " + std::to_string(proc.exit_code())}
			<< Path{file}
		);

	try
	{
		return parse_output(output);
	}
	catch (Error& e)
	{
		e << Path{file};
		throw;
	}
}

std::string Fpcalc::parse_output(std::string_view output)
{
	auto json = nlohmann::json::parse(output, nullptr, false);
	if (json.is_discarded() || !json.is_object())
		BOOST_THROW_EXCEPTION(Error() << Message{"fpcalc output is not JSON"});

	auto fp = json.find("fingerprint");
	if (fp == json.end() || !fp->is_string() || fp->get_ref<const std::string&>().empty())
		BOOST_THROW_EXCEPTION(Error() << Message{"no fingerprint in fpcalc output"});

	return fp->get<std::string>();
}

} // end of namespace
