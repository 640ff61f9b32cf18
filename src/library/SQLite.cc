/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/7/2024.
//

#include "SQLite.hh"

#include "common/Error.hh"

#include <boost/throw_exception.hpp>

namespace atd::sqlite {

Statement::Statement(::sqlite3 *db, std::string_view sql) : m_db{db}
{
	::sqlite3_stmt *stmt{};
	if (::sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK)
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(atd::Error::inventory_error)}
			<< Message{::sqlite3_errmsg(db)}
			<< SQL{std::string{sql}}
		);
	m_stmt.reset(stmt);
}

void Statement::reset()
{
	::sqlite3_reset(m_stmt.get());
	::sqlite3_clear_bindings(m_stmt.get());
}

void Statement::check(int result) const
{
	if (result != SQLITE_OK)
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(atd::Error::inventory_error)}
			<< Message{::sqlite3_errmsg(m_db)}
			<< SQL{::sqlite3_sql(m_stmt.get())}
		);
}

bool Statement::step()
{
	auto result = ::sqlite3_step(m_stmt.get());
	if (result == SQLITE_ROW)
		return true;
	if (result == SQLITE_DONE)
		return false;

	BOOST_THROW_EXCEPTION(Error()
		<< ErrorCode{make_error_code(atd::Error::inventory_error)}
		<< Message{::sqlite3_errmsg(m_db)}
		<< SQL{::sqlite3_sql(m_stmt.get())}
	);
}

void Statement::run()
{
	while (step())
		;
}

bool Statement::is_null(int col) const
{
	return ::sqlite3_column_type(m_stmt.get(), col) == SQLITE_NULL;
}

std::int64_t Statement::integer(int col) const
{
	return ::sqlite3_column_int64(m_stmt.get(), col);
}

double Statement::real(int col) const
{
	return ::sqlite3_column_double(m_stmt.get(), col);
}

std::string Statement::text(int col) const
{
	auto str = reinterpret_cast<const char*>(::sqlite3_column_text(m_stmt.get(), col));
	return str ? std::string{str, static_cast<std::size_t>(::sqlite3_column_bytes(m_stmt.get(), col))} : std::string{};
}

std::optional<std::string> Statement::optional_text(int col) const
{
	return is_null(col) ? std::nullopt : std::optional<std::string>{text(col)};
}

Database::Database(const fs::path& path)
{
	::sqlite3 *db{};
	auto result = ::sqlite3_open_v2(
		path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr
	);

	// sqlite3_open_v2() returns a handle even on error, for the error message
	m_db.reset(db);
	if (result != SQLITE_OK)
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(atd::Error::inventory_error)}
			<< Message{db ? ::sqlite3_errmsg(db) : "out of memory"}
			<< Path{path}
		);
}

void Database::exec(const std::string& sql)
{
	char *msg{};
	if (::sqlite3_exec(m_db.get(), sql.c_str(), nullptr, nullptr, &msg) != SQLITE_OK)
	{
		std::string error{msg ? msg : "unknown error"};
		::sqlite3_free(msg);
		BOOST_THROW_EXCEPTION(Error()
			<< ErrorCode{make_error_code(atd::Error::inventory_error)}
			<< Message{error}
			<< SQL{sql}
		);
	}
}

Statement Database::prepare(std::string_view sql) const
{
	return Statement{m_db.get(), sql};
}

} // end of namespace
