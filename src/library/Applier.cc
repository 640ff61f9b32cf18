/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/16/2024.
//

#include "Applier.hh"
#include "Inventory.hh"

#include "common/Error.hh"
#include "common/Log.hh"

#include <boost/throw_exception.hpp>

namespace atd {
namespace {

void move_or_throw(const fs::path& src, const fs::path& dest)
{
	std::error_code ec;
	fs::create_directories(dest.parent_path(), ec);
	if (!ec)
		move_file(src, dest, ec);

	if (ec == Error::destination_exists)
		BOOST_THROW_EXCEPTION(Applier::Collision() << ErrorCode{ec} << Path{src} << Destination{dest});
	if (ec)
		BOOST_THROW_EXCEPTION(SystemError() << ErrorCode{ec} << Path{src} << Destination{dest});
}

} // end of local namespace

Applier::Applier(Inventory& inventory) : m_inventory{inventory}
{
}

fs::path Applier::quarantine_target(const fs::path& path, const fs::path& dir, const std::vector<fs::path>& roots)
{
	for (auto&& root : roots)
		if (auto rel = relative_to(path, root); rel && !rel->empty())
			return dir / *rel;

	return dir / path.filename();
}

Applier::Result Applier::apply(const Plan& plan, const ApplyOptions& opts)
{
	auto journal = Journal::create(plan.id);
	auto auto_accept = plan.thresholds.auto_accept_above;

	Transaction tx{m_inventory};
	for (auto&& op : plan.operations)
	{
		JournalEntry entry;
		if (!opts.force_low_confidence && op.status == OperationStatus::review)
			entry = JournalEntry::from(op, OperationStatus::review_required);

		else if (!opts.force_low_confidence && op.confidence && *op.confidence < auto_accept)
			entry = JournalEntry::from(op, OperationStatus::skipped_low_confidence);

		else
			entry = execute(op, plan, opts);

		m_inventory.record_operation(OperationLogRow{
			op.id, plan.id, entry.op_type, entry.path, entry.new_path, std::string{to_string(entry.status)}
		});
		journal.entries.push_back(std::move(entry));
	}
	tx.commit();

	auto location = journal.save(opts.journal_dir);
	Log(LOG_NOTICE, "journal %1% written to %2%", journal.id, location.string());

	return {std::move(journal), std::move(location)};
}

JournalEntry Applier::execute(const Operation& op, const Plan& plan, const ApplyOptions& opts)
{
	// move and rename carry their destination, quarantined deletes compute one
	auto destination = op.new_path();
	if (std::holds_alternative<op::Delete>(op.kind) && opts.quarantine.enabled && opts.quarantine.dir)
		destination = quarantine_target(op.path, *opts.quarantine.dir, plan.roots);

	if (opts.dry_run)
		return JournalEntry::from(op, OperationStatus::dry_run, destination);

	try
	{
		if (std::holds_alternative<op::Move>(op.kind) || std::holds_alternative<op::Rename>(op.kind))
		{
			move_or_throw(op.path, *destination);
			Log(LOG_NOTICE, "moved %1% to %2%", op.path.string(), destination->string());
			return JournalEntry::from(op, OperationStatus::moved, destination);
		}

		if (std::holds_alternative<op::Delete>(op.kind))
		{
			if (destination)
			{
				move_or_throw(op.path, *destination);
				Log(LOG_NOTICE, "quarantined %1% to %2%", op.path.string(), destination->string());
				return JournalEntry::from(op, OperationStatus::quarantined, destination);
			}

			boost::system::error_code ec;
			fs::remove(op.path, ec);
			if (ec)
				BOOST_THROW_EXCEPTION((SystemError()
					<< ErrorCode{std::error_code{ec.value(), std::system_category()}}
					<< Path{op.path}
				));

			Log(LOG_NOTICE, "deleted %1%", op.path.string());
			return JournalEntry::from(op, OperationStatus::deleted);
		}

		// art fetches and reviews have nothing to do on the file system
		return JournalEntry::from(op, OperationStatus::noop);
	}
	catch (Exception& e)
	{
		Log(LOG_ERR, "%1% %2% failed: %3%", op.type(), op.path.string(), brief(e));

		auto entry = JournalEntry::from(op, OperationStatus::failed, destination);
		entry.error = brief(e);
		return entry;
	}
}

} // end of namespace
