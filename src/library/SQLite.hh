/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/7/2024.
//

#pragma once

#include "common/Exception.hh"
#include "common/FS.hh"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace atd::sqlite {

struct Error : virtual Exception {};
using SQL = boost::error_info<struct tag_sql, std::string>;

namespace detail {
template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
}

/// \brief  A prepared statement. Rows are read by calling step() until it returns false.
class Statement
{
public:
	Statement(::sqlite3 *db, std::string_view sql);
	Statement(Statement&&) = default;
	Statement(const Statement&) = delete;
	Statement& operator=(Statement&&) = default;
	Statement& operator=(const Statement&) = delete;
	~Statement() = default;

	// Bind all parameters in order, starting from the first one.
	template <typename... Args>
	Statement& bind(const Args& ... args)
	{
		reset();
		bind_at(1, args...);
		return *this;
	}

	// Returns true if a row is available.
	bool step();

	// Run the statement to completion, ignoring any rows.
	void run();

	[[nodiscard]] bool is_null(int col) const;
	[[nodiscard]] std::int64_t integer(int col) const;
	[[nodiscard]] double real(int col) const;
	[[nodiscard]] std::string text(int col) const;
	[[nodiscard]] std::optional<std::string> optional_text(int col) const;

private:
	void reset();
	void check(int result) const;

	void bind_at(int)
	{
	}

	template <typename FirstArg, typename ... NextArgs>
	void bind_at(int index, const FirstArg& first, const NextArgs& ... next)
	{
		bind_one(index, first);
		bind_at(index + 1, next...);
	}

	template <typename T>
	void bind_one(int index, const T& value)
	{
		if constexpr (std::is_same_v<T, std::nullptr_t>)
			check(::sqlite3_bind_null(m_stmt.get(), index));

		else if constexpr (detail::is_optional<T>::value)
		{
			if (value)
				bind_one(index, *value);
			else
				check(::sqlite3_bind_null(m_stmt.get(), index));
		}

		else if constexpr (std::is_floating_point_v<T>)
			check(::sqlite3_bind_double(m_stmt.get(), index, value));

		else if constexpr (std::is_integral_v<T>)
			check(::sqlite3_bind_int64(m_stmt.get(), index, static_cast<::sqlite3_int64>(value)));

		// for string, string_view and string literals
		else
		{
			std::string_view str{value};
			check(::sqlite3_bind_text(
				m_stmt.get(), index, str.data(), static_cast<int>(str.size()), SQLITE_TRANSIENT
			));
		}
	}

private:
	struct Finalize
	{
		void operator()(::sqlite3_stmt *stmt) const
		{
			if (stmt)
				::sqlite3_finalize(stmt);
		}
	};
	::sqlite3 *m_db;
	std::unique_ptr<::sqlite3_stmt, Finalize> m_stmt;
};

/// \brief  An open SQLite database. ":memory:" opens a private in-memory one.
class Database
{
public:
	explicit Database(const fs::path& path);
	Database(Database&&) = default;
	Database(const Database&) = delete;
	Database& operator=(Database&&) = default;
	Database& operator=(const Database&) = delete;
	~Database() = default;

	void exec(const std::string& sql);
	Statement prepare(std::string_view sql) const;

	template <typename... Args>
	void run(std::string_view sql, const Args& ... args) const
	{
		prepare(sql).bind(args...).run();
	}

private:
	struct Close
	{
		void operator()(::sqlite3 *db) const
		{
			if (db)
				::sqlite3_close(db);
		}
	};
	std::unique_ptr<::sqlite3, Close> m_db;
};

} // end of namespace
