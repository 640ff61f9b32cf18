/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/9/2024.
//

#pragma once

#include "FileRecord.hh"

#include "common/FS.hh"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace atd {

class Inventory;
class MediaProbe;
class Fingerprinter;

struct ScanOptions
{
	std::vector<fs::path>   roots;
	std::size_t             jobs{1};
};

/// \brief  A file that could not be scanned, and why.
struct FileError
{
	fs::path    path;
	std::string cause;
};

struct ScannedFile
{
	FileRecord                  record;
	std::optional<std::string>  fingerprint;
};

using ScanResult = std::variant<ScannedFile, FileError>;

struct ScanStats
{
	std::size_t files_scanned{};
	std::size_t fingerprints_computed{};
	std::size_t hashes_computed{};
	std::size_t errors{};

	// one entry for each error
	std::vector<FileError> failures;
};

/// \brief  Walks the library and brings the inventory up-to-date.
///
/// Files whose size and modification time match the inventory are not read
/// again. The rest are digested, probed and fingerprinted by a pool of
/// worker threads. Only the calling thread writes to the inventory.
class Scanner
{
public:
	Scanner(Inventory& inventory, const MediaProbe& probe, const Fingerprinter& fingerprinter);

	ScanStats scan(const ScanOptions& opts);

	// The work of one pending file. Never throws.
	ScanResult process(const fs::path& file) const;

	// Audio files under the roots. A root may also be a single audio file.
	static std::vector<fs::path> discover(const std::vector<fs::path>& roots);
	static bool is_audio(const fs::path& file);

private:
	Inventory&              m_inventory;
	const MediaProbe&       m_probe;
	const Fingerprinter&    m_fingerprinter;
};

} // end of namespace
