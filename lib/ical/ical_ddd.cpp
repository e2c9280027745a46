// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	Temporal dispatch, PERIOD and DATE-TIME lists
 */
#include <ctime>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <calvt/defs.h>
#include <calvt/icalvalue.hpp>
#include <calvt/util.hpp>

namespace calvt {

std::string to_ical(const ddd_value &v)
{
	return std::visit([](const auto &x) { return to_ical(x); }, v);
}

/*
 * The three point-in-time grammars have disjoint shapes (date-time is the
 * only one with a T at offset 8, date the only one of length 8), so
 * picking by shape gives the same result as trying them in turn.
 */
ddd_value ddd_from_ical(std::string_view s, const char *tzid)
{
	if ((s.size() >= 1 && (s[0] == 'P' || s[0] == 'p')) ||
	    (s.size() >= 2 && s[0] == '-' && (s[1] == 'P' || s[1] == 'p')))
		return duration_from_ical(s);
	if (s.size() > 8 && s[8] == 'T')
		return datetime_from_ical(s, tzid);
	if (s.size() == 8)
		return date_from_ical(s);
	if (s.size() == 6 || s.size() == 7)
		return time_from_ical(s, tzid);
	throw invalid_value("DATE-TIME", s, "not a date-time, date, time or duration");
}

ddd_value to_ddd(const native_value &v)
{
	if (auto x = std::get_if<ical_datetime>(&v))
		return *x;
	if (auto x = std::get_if<ical_date>(&v))
		return *x;
	if (auto x = std::get_if<ical_clock>(&v))
		return *x;
	if (auto x = std::get_if<ical_duration>(&v))
		return *x;
	throw invalid_value("DATE-TIME", "", "unsupported native type");
}

/*
 * Seconds from @a to @b. Values in the same zone (or both floating) are
 * compared by wall clock, values in different zones by instant.
 */
static int64_t datetime_diff(const ical_datetime &a, const ical_datetime &b)
{
	if (a.tzid() == b.tzid())
		return b.wall_seconds() - a.wall_seconds();
	if (a.is_floating() || b.is_floating())
		throw invalid_value("PERIOD", to_ical(a) + "/" + to_ical(b),
		      "cannot mix floating and zoned date-times");
	time_t ta = 0, tb = 0;
	if (!a.to_time_t(&ta) || !b.to_time_t(&tb))
		throw invalid_value("PERIOD", to_ical(a) + "/" + to_ical(b),
		      "cannot resolve time zone");
	return static_cast<int64_t>(tb) - ta;
}

/* Seconds from @a to @b for two period endpoints of the same kind */
static int64_t period_diff(const ddd_value &a, const ddd_value &b)
{
	auto da = std::get_if<ical_date>(&a), db = std::get_if<ical_date>(&b);
	if (da != nullptr && db != nullptr)
		return (db->day_number() - da->day_number()) * 86400;
	auto ta = std::get_if<ical_datetime>(&a), tb = std::get_if<ical_datetime>(&b);
	if (ta != nullptr && tb != nullptr)
		return datetime_diff(*ta, *tb);
	throw invalid_value("PERIOD", to_ical(a) + "/" + to_ical(b),
	      "cannot compare a date with a date-time");
}

ical_period::ical_period(const ddd_value &start, const ddd_value &eod) :
	m_start(start), m_end(start)
{
	auto raw = to_ical(start) + "/" + to_ical(eod);
	auto sdate = std::get_if<ical_date>(&start);
	auto sdt = std::get_if<ical_datetime>(&start);
	if (sdate == nullptr && sdt == nullptr)
		throw invalid_value("PERIOD", raw, "start must be a date or date-time");
	if (auto dur = std::get_if<ical_duration>(&eod)) {
		if (dur->negative())
			throw invalid_value("PERIOD", raw, "start is after end");
		m_by_duration = true;
		m_duration = *dur;
		if (sdate != nullptr && dur->total % 86400 != 0)
			throw invalid_value("PERIOD", raw, "a date period needs a whole number of days");
		try {
			if (sdt != nullptr)
				m_end = sdt->add_seconds(dur->total);
			else
				m_end = sdate->add_days(dur->total / 86400);
		} catch (const invalid_value &) {
			throw invalid_value("PERIOD", raw, "end out of range");
		}
		return;
	}
	if (eod.index() != start.index())
		throw invalid_value("PERIOD", raw, "end must be of the same type as start");
	m_end = eod;
	auto diff = period_diff(m_start, m_end);
	if (diff < 0)
		throw invalid_value("PERIOD", raw, "start is after end");
	m_duration = ical_duration(diff);
}

bool ical_period::overlaps(const ical_period &o) const
{
	if (period_diff(o.m_start, m_start) > 0)
		return o.overlaps(*this);
	return period_diff(o.m_start, m_end) > 0;
}

std::string to_ical(const ical_period &v)
{
	if (v.by_duration())
		return to_ical(v.start()) + "/" + to_ical(v.duration());
	return to_ical(v.start()) + "/" + to_ical(v.end());
}

ical_period period_from_ical(std::string_view s, const char *tzid)
{
	auto pos = s.find('/');
	if (pos == s.npos || s.find('/', pos + 1) != s.npos)
		throw invalid_value("PERIOD", s, "expected <start>/<end> or <start>/<duration>");
	try {
		return ical_period(ddd_from_ical(s.substr(0, pos), tzid),
		       ddd_from_ical(s.substr(pos + 1), tzid));
	} catch (const invalid_value &e) {
		throw invalid_value("PERIOD", s, e.reason());
	}
}

ical_ddd_list::ical_ddd_list(std::vector<ddd_value> &&items) :
	m_items(std::move(items))
{
	if (m_items.empty())
		throw invalid_value("DATE-TIME-LIST", "", "list is empty");
	for (const auto &e : m_items)
		if (e.index() != m_items.front().index())
			throw invalid_value("DATE-TIME-LIST", to_ical(e),
			      "list elements must all be of one type");
}

std::string to_ical(const ical_ddd_list &v)
{
	std::string out;
	for (const auto &e : v.items()) {
		if (!out.empty())
			out += ',';
		out += to_ical(e);
	}
	return out;
}

ical_ddd_list ddd_list_from_ical(std::string_view s, const char *tzid)
{
	std::vector<ddd_value> items;
	try {
		for (const auto &seg : gx_split(s, ','))
			items.push_back(ddd_from_ical(seg, tzid));
		return ical_ddd_list(std::move(items));
	} catch (const invalid_value &e) {
		throw invalid_value("DATE-TIME-LIST", s, e.reason());
	}
}

}
