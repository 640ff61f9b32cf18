/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the audiotidy
    distribution for more details.
*/

//
// Created by nestal on 3/18/2024.
//

#include "Library.hh"

#include "common/Error.hh"
#include "common/Log.hh"

#include <boost/throw_exception.hpp>

namespace atd {

Library::Library(const fs::path& db, const MediaProbe& probe, const Fingerprinter& fingerprinter) :
	m_inventory{db}, m_probe{probe}, m_fingerprinter{fingerprinter}
{
}

ScanStats Library::scan(const ScanOptions& opts)
{
	return Scanner{m_inventory, m_probe, m_fingerprinter}.scan(opts);
}

Plan Library::plan(const PlanOptions& opts) const
{
	return Planner{m_inventory, m_probe}.plan(opts);
}

Applier::Result Library::apply(const Plan& plan, const ApplyOptions& opts)
{
	return Applier{m_inventory}.apply(plan, opts);
}

UndoReport Library::undo(std::string_view journal_id, const UndoOptions& opts) const
{
	return Undo{opts}.run(journal_id);
}

std::vector<DuplicateGroup> Library::groups(const GroupOptions& opts) const
{
	return list_groups(m_inventory, opts);
}

DuplicateGroup Library::group(std::size_t group_id, const GroupOptions& opts) const
{
	auto all = groups(opts);
	auto found = find_group(all, group_id);
	if (!found)
		BOOST_THROW_EXCEPTION(InvalidOverride()
			<< ErrorCode{make_error_code(Error::invalid_override)}
			<< Message{"no duplicate group " + std::to_string(group_id)}
		);
	return *found;
}

std::vector<OverrideIntent> Library::set_override(
	std::size_t group_id,
	Action action,
	std::string_view pattern,
	std::optional<std::string> rename_template,
	const GroupOptions& opts
)
{
	auto intents = override_intents(group(group_id, opts), pattern, action, std::move(rename_template));
	store(intents);
	return intents;
}

ReviewIntent Library::review(std::size_t group_id, std::string_view command, const GroupOptions& opts)
{
	auto intent = parse_review_command(command, group(group_id, opts));
	if (intent.command == ReviewIntent::Command::set)
		store(intent.overrides);
	return intent;
}

void Library::store(const std::vector<OverrideIntent>& intents)
{
	auto now = Timestamp::now();

	Transaction tx{m_inventory};
	for (auto&& intent : intents)
	{
		m_inventory.set_override(intent.group, intent.path, GroupOverride{intent.action, intent.rename_template, now});
		Log(LOG_INFO, "override %1% for %2%", to_string(intent.action), intent.path.string());
	}
	tx.commit();
}

AnalyzeReport Library::analyze(const GroupOptions& opts) const
{
	return atd::analyze(m_inventory, opts);
}

std::vector<MetaIssue> Library::meta_check(const MetaOptions& opts) const
{
	return check_metadata(m_probe, opts);
}

MetaFix Library::meta_fix(const MetaOptions& opts) const
{
	return plan_meta_fix(m_probe, opts);
}

CacheStats Library::cache_stats() const
{
	return m_inventory.stats();
}

} // end of namespace
