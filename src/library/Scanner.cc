/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/9/2024.
//

#include "Scanner.hh"
#include "Inventory.hh"

#include "media/Fingerprinter.hh"
#include "media/Magic.hh"
#include "media/MediaProbe.hh"

#include "common/Log.hh"

#include "config.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/exception/diagnostic_information.hpp>

#include <algorithm>
#include <future>
#include <memory>

namespace atd {

Scanner::Scanner(Inventory& inventory, const MediaProbe& probe, const Fingerprinter& fingerprinter) :
	m_inventory{inventory}, m_probe{probe}, m_fingerprinter{fingerprinter}
{
}

bool Scanner::is_audio(const fs::path& file)
{
	auto ext = boost::algorithm::to_lower_copy(file.extension().string());
	return std::find(
		constants::audio_extensions.begin(),
		constants::audio_extensions.end(),
		ext
	) != constants::audio_extensions.end();
}

std::vector<fs::path> Scanner::discover(const std::vector<fs::path>& roots)
{
	std::vector<fs::path> result;
	for (auto&& root : absolute_paths(roots))
	{
		boost::system::error_code ec;
		if (fs::is_regular_file(root, ec))
		{
			if (is_audio(root))
				result.push_back(root);
			continue;
		}
		if (!fs::is_directory(root, ec))
			continue;

		// unreadable directories are skipped silently
		fs::recursive_directory_iterator it{root, fs::directory_options::skip_permission_denied, ec}, end;
		for (; !ec && it != end; it.increment(ec))
		{
			boost::system::error_code fec;
			if (fs::is_regular_file(it->path(), fec) && is_audio(it->path()))
				result.push_back(it->path());
		}
	}
	return result;
}

ScanResult Scanner::process(const fs::path& file) const
{
	try
	{
		std::error_code ec;
		auto st = stat_file(file, ec);
		if (ec)
			return FileError{file, ec.message()};

		auto digest = ContentDigest::of_file(file, ec);
		if (ec)
			return FileError{file, ec.message()};

		auto stream = m_probe.probe(file);

		ScannedFile result;
		result.record.path        = file;
		result.record.size        = st.size;
		result.record.mtime       = st.mtime;
		result.record.digest      = digest;
		result.record.codec       = stream.codec;
		result.record.container   = Magic::instance().mime(file);
		result.record.duration    = stream.duration;
		result.record.bitrate     = stream.bitrate;
		result.record.sample_rate = stream.sample_rate;
		result.record.channels    = stream.channels;
		result.record.has_art     = m_probe.has_embedded_art(file);

		try
		{
			result.fingerprint = m_fingerprinter.fingerprint(file);
		}
		catch (Fingerprinter::Error& e)
		{
			Log(LOG_DEBUG, "no fingerprint for %1%: %2%", file.string(), brief(e));
		}
		return result;
	}
	catch (Exception& e)
	{
		return FileError{file, brief(e)};
	}
	catch (std::exception& e)
	{
		return FileError{file, e.what()};
	}
}

ScanStats Scanner::scan(const ScanOptions& opts)
{
	Log(LOG_INFO, "scanning %1% root(s) with %2% job(s)", opts.roots.size(), opts.jobs);

	ScanStats stats;
	std::vector<fs::path> pending;
	for (auto&& file : discover(opts.roots))
	{
		std::error_code ec;
		auto st = stat_file(file, ec);
		if (ec)
			continue;

		auto existing = m_inventory.get(file);
		if (existing && existing->size == st.size && existing->mtime == st.mtime)
			stats.files_scanned++;
		else
			pending.push_back(file);
	}

	boost::asio::thread_pool pool{std::max<std::size_t>(opts.jobs, 1)};

	std::vector<std::future<ScanResult>> results;
	results.reserve(pending.size());
	for (auto&& file : pending)
	{
		auto task = std::make_shared<std::packaged_task<ScanResult()>>([this, file]{return process(file);});
		results.push_back(task->get_future());
		boost::asio::post(pool, [task]{(*task)();});
	}

	// Results are written by this thread only, in discovery order.
	Transaction tx{m_inventory};
	for (auto&& future : results)
	{
		stats.files_scanned++;

		auto result = future.get();
		if (auto failed = std::get_if<FileError>(&result))
		{
			Log(LOG_WARNING, "cannot scan %1%: %2%", failed->path.string(), failed->cause);
			stats.errors++;
			stats.failures.push_back(std::move(*failed));
			continue;
		}

		auto& scanned = std::get<ScannedFile>(result);
		m_inventory.upsert(scanned.record);
		stats.hashes_computed++;
		if (scanned.fingerprint)
		{
			m_inventory.upsert_fingerprint(scanned.record.path, *scanned.fingerprint);
			stats.fingerprints_computed++;
		}
	}
	pool.join();
	tx.commit();

	Log(LOG_INFO, "scanned %1% files: %2% hashed, %3% fingerprinted, %4% errors",
		stats.files_scanned, stats.hashes_computed, stats.fingerprints_computed, stats.errors);
	return stats;
}

} // end of namespace
