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

#include "FileRecord.hh"
#include "Override.hh"
#include "SQLite.hh"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace atd {

/// \brief  One row of the operation log written by the Applier.
struct OperationLogRow
{
	std::string                 op_id;
	std::string                 plan_id;
	std::string                 op_type;
	fs::path                    path;
	std::optional<fs::path>     new_path;
	std::string                 status;
};

struct CacheStats
{
	std::size_t files{};
	std::size_t fingerprints{};
};

/// \brief  Persistent store of file records, fingerprints, group overrides and the operation log.
///
/// Backed by an SQLite database. Only one thread writes to it: the scanner
/// workers hand their results back to the thread that owns the Inventory.
class Inventory
{
public:
	using Error = sqlite::Error;

public:
	explicit Inventory(const fs::path& db);

	[[nodiscard]] std::optional<FileRecord> get(const fs::path& path) const;
	void upsert(const FileRecord& record);

	// All records, ordered by path.
	[[nodiscard]] std::vector<FileRecord> files() const;

	// Records whose digest is shared by more than one record, partitioned by
	// digest. Partitions are ordered by digest and records by path.
	[[nodiscard]] std::vector<std::vector<FileRecord>> duplicates() const;

	void upsert_fingerprint(const fs::path& path, std::string_view fingerprint);
	[[nodiscard]] std::optional<std::string> fingerprint(const fs::path& path) const;

	void set_override(const ContentDigest& group, const fs::path& path, const GroupOverride& value);
	void clear_override(const ContentDigest& group, const fs::path& path);
	[[nodiscard]] std::map<fs::path, GroupOverride> overrides(const ContentDigest& group) const;

	void record_operation(const OperationLogRow& row);
	[[nodiscard]] std::vector<OperationLogRow> operations(std::string_view plan_id) const;

	[[nodiscard]] CacheStats stats() const;

	void begin();
	void commit();
	void rollback();

private:
	sqlite::Database m_db;
};

/// \brief  Rolls back on destruction unless commit() was called.
class Transaction
{
public:
	explicit Transaction(Inventory& inventory);
	Transaction(const Transaction&) = delete;
	Transaction& operator=(const Transaction&) = delete;
	~Transaction();

	void commit();

private:
	Inventory&  m_inventory;
	bool        m_done{false};
};

} // end of namespace
