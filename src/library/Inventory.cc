/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/7/2024.
//

#include "Inventory.hh"

#include "common/Log.hh"

#include <boost/exception/diagnostic_information.hpp>

namespace atd {
namespace {

const char schema[] = R"(
	CREATE TABLE IF NOT EXISTS files (
		path        TEXT PRIMARY KEY,
		size        INTEGER NOT NULL,
		mtime       INTEGER NOT NULL,
		digest      TEXT,
		codec       TEXT,
		container   TEXT,
		duration    REAL,
		bitrate     INTEGER,
		sample_rate INTEGER,
		channels    INTEGER,
		has_art     INTEGER NOT NULL DEFAULT 0
	);
	CREATE INDEX IF NOT EXISTS files_digest ON files(digest);

	CREATE TABLE IF NOT EXISTS fingerprints (
		path        TEXT PRIMARY KEY,
		chromaprint TEXT NOT NULL
	);

	CREATE TABLE IF NOT EXISTS group_overrides (
		group_digest TEXT NOT NULL,
		path         TEXT NOT NULL,
		action       TEXT NOT NULL,
		template     TEXT,
		updated_at   INTEGER NOT NULL,
		PRIMARY KEY (group_digest, path)
	);

	CREATE TABLE IF NOT EXISTS operations (
		op_id       TEXT NOT NULL,
		plan_id     TEXT NOT NULL,
		op_type     TEXT NOT NULL,
		path        TEXT NOT NULL,
		new_path    TEXT,
		status      TEXT NOT NULL,
		recorded_at INTEGER NOT NULL
	);
)";

const char file_columns[] =
	"path, size, mtime, digest, codec, container, duration, bitrate, sample_rate, channels, has_art";

FileRecord read_record(const sqlite::Statement& row)
{
	FileRecord rec;
	rec.path        = row.text(0);
	rec.size        = static_cast<std::uint64_t>(row.integer(1));
	rec.mtime       = row.integer(2);
	if (auto hex = row.optional_text(3))
		rec.digest = ContentDigest::from_hex(*hex);
	rec.codec       = row.text(4);
	rec.container   = row.text(5);
	rec.duration    = row.real(6);
	rec.bitrate     = static_cast<int>(row.integer(7));
	rec.sample_rate = static_cast<int>(row.integer(8));
	rec.channels    = static_cast<int>(row.integer(9));
	rec.has_art     = row.integer(10) != 0;
	return rec;
}

} // end of local namespace

Inventory::Inventory(const fs::path& db) : m_db{db}
{
	if (db != ":memory:")
		m_db.exec("PRAGMA journal_mode=WAL");
	m_db.exec(schema);
}

std::optional<FileRecord> Inventory::get(const fs::path& path) const
{
	auto stmt = m_db.prepare(std::string{"SELECT "} + file_columns + " FROM files WHERE path = ?");
	stmt.bind(path.string());
	return stmt.step() ? std::optional<FileRecord>{read_record(stmt)} : std::nullopt;
}

void Inventory::upsert(const FileRecord& rec)
{
	m_db.run(
		std::string{"INSERT INTO files ("} + file_columns + ") VALUES (?,?,?,?,?,?,?,?,?,?,?) "
		"ON CONFLICT(path) DO UPDATE SET "
			"size=excluded.size, mtime=excluded.mtime, digest=excluded.digest, codec=excluded.codec, "
			"container=excluded.container, duration=excluded.duration, bitrate=excluded.bitrate, "
			"sample_rate=excluded.sample_rate, channels=excluded.channels, has_art=excluded.has_art",
		rec.path.string(),
		rec.size,
		rec.mtime,
		rec.digest ? std::optional<std::string>{rec.digest->hex()} : std::nullopt,
		rec.codec,
		rec.container,
		rec.duration,
		rec.bitrate,
		rec.sample_rate,
		rec.channels,
		rec.has_art
	);
}

std::vector<FileRecord> Inventory::files() const
{
	std::vector<FileRecord> result;
	auto stmt = m_db.prepare(std::string{"SELECT "} + file_columns + " FROM files ORDER BY path");
	while (stmt.step())
		result.push_back(read_record(stmt));
	return result;
}

std::vector<std::vector<FileRecord>> Inventory::duplicates() const
{
	auto stmt = m_db.prepare(
		std::string{"SELECT "} + file_columns + " FROM files WHERE digest IN ("
			"SELECT digest FROM files WHERE digest IS NOT NULL GROUP BY digest HAVING COUNT(*) > 1"
		") ORDER BY digest, path"
	);

	std::vector<std::vector<FileRecord>> result;
	while (stmt.step())
	{
		auto rec = read_record(stmt);
		if (result.empty() || result.back().front().digest != rec.digest)
			result.emplace_back();
		result.back().push_back(std::move(rec));
	}
	return result;
}

void Inventory::upsert_fingerprint(const fs::path& path, std::string_view fingerprint)
{
	m_db.run(
		"INSERT OR REPLACE INTO fingerprints (path, chromaprint) VALUES (?, ?)",
		path.string(), fingerprint
	);
}

std::optional<std::string> Inventory::fingerprint(const fs::path& path) const
{
	auto stmt = m_db.prepare("SELECT chromaprint FROM fingerprints WHERE path = ?");
	stmt.bind(path.string());
	return stmt.step() ? std::optional<std::string>{stmt.text(0)} : std::nullopt;
}

void Inventory::set_override(const ContentDigest& group, const fs::path& path, const GroupOverride& value)
{
	m_db.run(
		"INSERT OR REPLACE INTO group_overrides (group_digest, path, action, template, updated_at) "
		"VALUES (?, ?, ?, ?, ?)",
		group.hex(),
		path.string(),
		to_string(value.action),
		value.rename_template,
		value.updated_at.time_since_epoch().count()
	);
}

void Inventory::clear_override(const ContentDigest& group, const fs::path& path)
{
	m_db.run("DELETE FROM group_overrides WHERE group_digest = ? AND path = ?", group.hex(), path.string());
}

std::map<fs::path, GroupOverride> Inventory::overrides(const ContentDigest& group) const
{
	auto stmt = m_db.prepare(
		"SELECT path, action, template, updated_at FROM group_overrides WHERE group_digest = ?"
	);
	stmt.bind(group.hex());

	std::map<fs::path, GroupOverride> result;
	while (stmt.step())
	{
		auto action = parse_action(stmt.text(1));
		if (!action)
		{
			Log(LOG_WARNING, "ignoring override of %1% with unknown action \"%2%\"", stmt.text(0), stmt.text(1));
			continue;
		}

		result.insert_or_assign(
			fs::path{stmt.text(0)},
			GroupOverride{
				*action,
				stmt.optional_text(2),
				Timestamp{Timestamp::duration{stmt.integer(3)}}
			}
		);
	}
	return result;
}

void Inventory::record_operation(const OperationLogRow& row)
{
	m_db.run(
		"INSERT INTO operations (op_id, plan_id, op_type, path, new_path, status, recorded_at) "
		"VALUES (?, ?, ?, ?, ?, ?, ?)",
		row.op_id,
		row.plan_id,
		row.op_type,
		row.path.string(),
		row.new_path ? std::optional<std::string>{row.new_path->string()} : std::nullopt,
		row.status,
		Timestamp::now().time_since_epoch().count()
	);
}

std::vector<OperationLogRow> Inventory::operations(std::string_view plan_id) const
{
	auto stmt = m_db.prepare(
		"SELECT op_id, plan_id, op_type, path, new_path, status FROM operations "
		"WHERE plan_id = ? ORDER BY rowid"
	);
	stmt.bind(plan_id);

	std::vector<OperationLogRow> result;
	while (stmt.step())
	{
		auto new_path = stmt.optional_text(4);
		result.push_back(OperationLogRow{
			stmt.text(0), stmt.text(1), stmt.text(2), stmt.text(3),
			new_path ? std::optional<fs::path>{*new_path} : std::nullopt,
			stmt.text(5)
		});
	}
	return result;
}

CacheStats Inventory::stats() const
{
	CacheStats result;

	auto files = m_db.prepare("SELECT COUNT(*) FROM files");
	if (files.step())
		result.files = static_cast<std::size_t>(files.integer(0));

	auto fps = m_db.prepare("SELECT COUNT(*) FROM fingerprints");
	if (fps.step())
		result.fingerprints = static_cast<std::size_t>(fps.integer(0));

	return result;
}

void Inventory::begin()
{
	m_db.exec("BEGIN");
}

void Inventory::commit()
{
	m_db.exec("COMMIT");
}

void Inventory::rollback()
{
	m_db.exec("ROLLBACK");
}

Transaction::Transaction(Inventory& inventory) : m_inventory{inventory}
{
	m_inventory.begin();
}

Transaction::~Transaction()
{
	if (!m_done)
	{
		try
		{
			m_inventory.rollback();
		}
		catch (Inventory::Error& e)
		{
			Log(LOG_ERR, "cannot roll back inventory transaction: %1%", boost::diagnostic_information(e));
		}
	}
}

void Transaction::commit()
{
	m_inventory.commit();
	m_done = true;
}

} // end of namespace
