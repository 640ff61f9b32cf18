/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/17/2024.
//

#include "Undo.hh"

#include "common/Error.hh"
#include "common/Log.hh"

#include <boost/throw_exception.hpp>

#include <algorithm>
#include <utility>

namespace atd {

std::string_view to_string(UndoOutcome outcome)
{
	switch (outcome)
	{
		case UndoOutcome::restored:         return "restored";
		case UndoOutcome::would_restore:    return "would-restore";
		case UndoOutcome::not_reversible:   return "not-reversible";
		case UndoOutcome::skipped_exists:   return "skipped-exists";
		case UndoOutcome::failed:           return "failed";
		case UndoOutcome::skipped:          return "skipped";
	}
	return "unknown";
}

std::size_t UndoReport::count(UndoOutcome outcome) const
{
	return static_cast<std::size_t>(std::count_if(steps.begin(), steps.end(), [outcome](auto&& step)
	{
		return step.outcome == outcome;
	}));
}

Undo::Undo(UndoOptions opts) : m_opts{std::move(opts)}
{
}

fs::path Undo::resolve(std::string_view journal_id) const
{
	if (journal_id == "last")
	{
		std::vector<fs::path> newest;
		std::int64_t newest_mtime{};

		boost::system::error_code ec;
		for (fs::directory_iterator it{m_opts.journal_dir, ec}, end; !ec && it != end; it.increment(ec))
		{
			auto& file = it->path();
			if (file.extension() != ".json" || !fs::is_regular_file(it->status()))
				continue;

			std::error_code sec;
			auto stat = stat_file(file, sec);
			if (sec)
				continue;

			if (newest.empty() || stat.mtime > newest_mtime)
			{
				newest = {file};
				newest_mtime = stat.mtime;
			}
			else if (stat.mtime == newest_mtime)
				newest.push_back(file);
		}

		if (newest.empty())
			BOOST_THROW_EXCEPTION(JournalNotFound()
				<< ErrorCode{make_error_code(Error::journal_not_found)}
				<< Path{m_opts.journal_dir}
			);
		if (newest.size() == 1)
			return newest.front();

		// same modification time: the later "created_at" wins, then the file name
		std::vector<std::pair<std::string, fs::path>> keys;
		for (auto&& file : newest)
		{
			std::string created_at;
			try
			{
				created_at = Journal::load(file).created_at;
			}
			catch (InvalidDocument& e)
			{
				Log(LOG_WARNING, "ignoring unreadable journal %1%: %2%", file.string(), brief(e));
			}
			keys.emplace_back(std::move(created_at), file);
		}
		return std::max_element(keys.begin(), keys.end())->second;
	}

	auto file = m_opts.journal_dir / (std::string{journal_id} + ".json");
	if (!fs::is_regular_file(file))
		BOOST_THROW_EXCEPTION(JournalNotFound()
			<< ErrorCode{make_error_code(Error::journal_not_found)}
			<< Path{file}
		);
	return file;
}

UndoReport Undo::run(std::string_view journal_id) const
{
	auto file = resolve(journal_id);
	auto journal = Journal::load(file);

	UndoReport report{journal.id, file};
	for (auto it = journal.entries.rbegin(); it != journal.entries.rend(); ++it)
		report.steps.push_back(reverse(*it, m_opts.dry_run));

	Log(LOG_INFO, "undo %1%: %2% restored, %3% not reversible, %4% failed",
		journal.id,
		report.count(m_opts.dry_run ? UndoOutcome::would_restore : UndoOutcome::restored),
		report.count(UndoOutcome::not_reversible),
		report.count(UndoOutcome::failed)
	);
	return report;
}

UndoStep Undo::reverse(const JournalEntry& entry, bool dry_run)
{
	UndoStep step{entry.op_id, entry.path, entry.new_path};

	if (entry.status == OperationStatus::deleted)
	{
		Log(LOG_WARNING, "cannot undo deletion of %1%", entry.path.string());
		step.outcome = UndoOutcome::not_reversible;
		return step;
	}

	auto reversible = entry.status == OperationStatus::moved || entry.status == OperationStatus::quarantined;
	if (!reversible || !entry.new_path)
		return step;

	if (fs::exists(entry.path))
	{
		Log(LOG_WARNING, "%1% already exists, not restoring from %2%", entry.path.string(), entry.new_path->string());
		step.outcome = UndoOutcome::skipped_exists;
		return step;
	}

	if (dry_run)
	{
		Log(LOG_NOTICE, "would restore %1% from %2%", entry.path.string(), entry.new_path->string());
		step.outcome = UndoOutcome::would_restore;
		return step;
	}

	std::error_code ec;
	fs::create_directories(entry.path.parent_path(), ec);
	if (!ec)
		move_file(*entry.new_path, entry.path, ec);

	if (ec)
	{
		Log(LOG_ERR, "cannot restore %1% from %2%: %3%", entry.path.string(), entry.new_path->string(), ec.message());
		step.outcome = UndoOutcome::failed;
		step.error   = ec.message();
		return step;
	}

	Log(LOG_NOTICE, "restored %1% from %2%", entry.path.string(), entry.new_path->string());
	step.outcome = UndoOutcome::restored;
	return step;
}

} // end of namespace
