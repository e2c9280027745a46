// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	DATE, TIME, DATE-TIME and DURATION codecs
 */
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <strings.h>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <calvt/ical.hpp>
#include <calvt/icalvalue.hpp>
#include <calvt/timezone.hpp>
#include <calvt/util.hpp>

namespace calvt {

static int64_t floor_div(int64_t a, int64_t b)
{
	auto q = a / b;
	return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

/* Canonical form of a zone name attached to a value: "", "UTC" or an IANA id */
static std::string tzid_canon(std::string_view tzid, const char *type)
{
	if (tzid.empty())
		return {};
	if (icase_equal(tzid, "UTC"))
		return "UTC";
	std::string z(tzid);
	if (!tz::tzvalid(z.c_str()))
		throw invalid_value(type, tzid, "unknown time zone");
	return z;
}

/* Caller-supplied TZID hint; unknown zones are dropped */
static std::string tzid_hint(const char *tzid)
{
	if (tzid == nullptr || *tzid == '\0')
		return {};
	if (strcasecmp(tzid, "UTC") == 0)
		return "UTC";
	if (!tz::tzvalid(tzid)) {
		mlog(LV_DEBUG, "ical: ignoring unknown TZID \"%s\"", tzid);
		return {};
	}
	return tzid;
}

ical_date::ical_date(int y, int m, int d) : m_year(y), m_month(m), m_day(d)
{
	if (y < 1 || y > 9999 || m < 1 || m > 12 || d < 1 ||
	    static_cast<unsigned int>(d) > ical_get_monthdays(y, m))
		throw invalid_value("DATE", fmt::format("{}-{}-{}", y, m, d),
		      "no such calendar date");
}

bool ical_date::operator==(const ical_date &o) const
{
	return m_year == o.m_year && m_month == o.m_month && m_day == o.m_day;
}

bool ical_date::operator<(const ical_date &o) const
{
	return day_number() < o.day_number();
}

/* days since 1970-01-01 */
int64_t ical_date::day_number() const
{
	int64_t y = m_month <= 2 ? m_year - 1 : m_year;
	int64_t era = floor_div(y, 400);
	int64_t yoe = y - era * 400;
	int64_t mp = (m_month + 9) % 12;
	int64_t doy = (153 * mp + 2) / 5 + m_day - 1;
	int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

ical_date ical_date::add_days(int64_t n) const
{
	int64_t z = day_number() + n + 719468;
	int64_t era = floor_div(z, 146097);
	int64_t doe = z - era * 146097;
	int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	int64_t mp = (5 * doy + 2) / 153;
	int d = doy - (153 * mp + 2) / 5 + 1;
	int m = mp < 10 ? mp + 3 : mp - 9;
	int64_t y = yoe + era * 400 + (m <= 2);
	if (y < 1 || y > 9999)
		throw invalid_value("DATE", fmt::format("{}", y), "year out of range");
	return ical_date(y, m, d);
}

std::string to_ical(const ical_date &v)
{
	return fmt::format("{:04}{:02}{:02}", v.year(), v.month(), v.day());
}

ical_date date_from_ical(std::string_view s)
{
	int y, m, d;
	if (!ical_parse_date(std::string(s).c_str(), &y, &m, &d))
		throw invalid_value("DATE", s, "expected YYYYMMDD");
	return ical_date(y, m, d);
}

static bool clock_valid(int h, int m, int s)
{
	return h >= 0 && h <= 23 && m >= 0 && m <= 59 && s >= 0 && s <= 59;
}

ical_clock::ical_clock(int h, int m, int s, std::string_view z) :
	m_hour(h), m_minute(m), m_second(s), m_tzid(tzid_canon(z, "TIME"))
{
	if (!clock_valid(h, m, s))
		throw invalid_value("TIME", fmt::format("{}:{}:{}", h, m, s),
		      "no such time of day");
}

bool ical_clock::operator==(const ical_clock &o) const
{
	return m_hour == o.m_hour && m_minute == o.m_minute &&
	       m_second == o.m_second && m_tzid == o.m_tzid;
}

std::string to_ical(const ical_clock &v)
{
	return fmt::format("{:02}{:02}{:02}{}", v.hour(), v.minute(), v.second(),
	       v.is_utc() ? "Z" : "");
}

ical_clock time_from_ical(std::string_view s, const char *tzid)
{
	auto zone = tzid_hint(tzid);
	std::string_view suffix;
	if (s.size() > 6)
		suffix = s.substr(6);
	if (zone.empty() && !suffix.empty() && suffix != "Z")
		throw invalid_value("TIME", s, "only a Z suffix is supported");
	int h, m, sec;
	if (!ical_parse_clock(std::string(s.substr(0, 6)).c_str(), &h, &m, &sec))
		throw invalid_value("TIME", s, "expected HHMMSS[Z]");
	if (zone.empty() && suffix == "Z")
		zone = "UTC";
	return ical_clock(h, m, sec, zone);
}

ical_datetime::ical_datetime(const ical_date &d, int h, int m, int s,
    std::string_view z) :
	m_date(d), m_hour(h), m_minute(m), m_second(s),
	m_tzid(tzid_canon(z, "DATE-TIME"))
{
	if (!clock_valid(h, m, s))
		throw invalid_value("DATE-TIME", fmt::format("{}:{}:{}", h, m, s),
		      "no such time of day");
}

bool ical_datetime::operator==(const ical_datetime &o) const
{
	return m_date == o.m_date && m_hour == o.m_hour && m_minute == o.m_minute &&
	       m_second == o.m_second && m_tzid == o.m_tzid;
}

int64_t ical_datetime::wall_seconds() const
{
	return m_date.day_number() * 86400 + m_hour * 3600 + m_minute * 60 + m_second;
}

bool ical_datetime::to_time_t(time_t *out) const
{
	if (is_floating())
		return false;
	if (is_utc()) {
		*out = wall_seconds();
		return true;
	}
	struct tm tm{};
	tm.tm_year = m_date.year() - 1900;
	tm.tm_mon  = m_date.month() - 1;
	tm.tm_mday = m_date.day();
	tm.tm_hour = m_hour;
	tm.tm_min  = m_minute;
	tm.tm_sec  = m_second;
	return tz::mktime_z(m_tzid.c_str(), &tm, out);
}

/* Wall-clock arithmetic; the zone is kept as is */
ical_datetime ical_datetime::add_seconds(int64_t n) const
{
	int64_t total = 0;
	if (__builtin_add_overflow(wall_seconds(), n, &total))
		throw invalid_value("DATE-TIME", to_ical(*this), "result out of range");
	auto days = floor_div(total, 86400);
	auto rem  = total - days * 86400;
	return ical_datetime(ical_date(1970, 1, 1).add_days(days), rem / 3600,
	       rem / 60 % 60, rem % 60, m_tzid);
}

std::string to_ical(const ical_datetime &v)
{
	const auto &d = v.date();
	return fmt::format("{:04}{:02}{:02}T{:02}{:02}{:02}{}", d.year(),
	       d.month(), d.day(), v.hour(), v.minute(), v.second(),
	       v.is_utc() ? "Z" : "");
}

/*
 * YYYYMMDDTHHMMSS[Z]. A valid @tzid hint takes precedence over the suffix,
 * whatever it is; without one, only "Z" is accepted.
 */
ical_datetime datetime_from_ical(std::string_view s, const char *tzid)
{
	auto zone = tzid_hint(tzid);
	if (s.size() < 15 || s[8] != 'T')
		throw invalid_value("DATE-TIME", s, "expected YYYYMMDDTHHMMSS[Z]");
	auto suffix = s.substr(15);
	if (zone.empty() && !suffix.empty() && suffix != "Z")
		throw invalid_value("DATE-TIME", s, "only a Z suffix is supported");
	int y, mo, d, h, mi, sec;
	if (!ical_parse_date(std::string(s.substr(0, 8)).c_str(), &y, &mo, &d) ||
	    !ical_parse_clock(std::string(s.substr(9, 6)).c_str(), &h, &mi, &sec))
		throw invalid_value("DATE-TIME", s, "expected YYYYMMDDTHHMMSS[Z]");
	if (zone.empty() && suffix == "Z")
		zone = "UTC";
	return ical_datetime(ical_date(y, mo, d), h, mi, sec, zone);
}

uint64_t ical_duration::days() const
{
	uint64_t mag = total < 0 ? -static_cast<uint64_t>(total) : total;
	return mag / 86400;
}

unsigned int ical_duration::hours() const
{
	uint64_t mag = total < 0 ? -static_cast<uint64_t>(total) : total;
	return mag % 86400 / 3600;
}

unsigned int ical_duration::minutes() const
{
	uint64_t mag = total < 0 ? -static_cast<uint64_t>(total) : total;
	return mag % 3600 / 60;
}

unsigned int ical_duration::seconds() const
{
	uint64_t mag = total < 0 ? -static_cast<uint64_t>(total) : total;
	return mag % 60;
}

std::string to_ical(const ical_duration &v)
{
	std::string out = v.negative() ? "-P" : "P", timepart;
	auto h = v.hours(), m = v.minutes(), s = v.seconds();
	if (h != 0 || m != 0 || s != 0) {
		timepart = "T";
		if (h != 0)
			timepart += fmt::format("{}H", h);
		if (m != 0 || (h != 0 && s != 0))
			timepart += fmt::format("{}M", m);
		if (s != 0)
			timepart += fmt::format("{}S", s);
	}
	if (v.days() == 0 && !timepart.empty())
		return out + timepart;
	return out + fmt::format("{}D", v.days()) + timepart;
}

ical_duration duration_from_ical(std::string_view s)
{
	int64_t secs = 0;
	if (!ical_parse_duration(std::string(s).c_str(), &secs))
		throw invalid_value("DURATION", s, "expected [+|-]P(nW|[nD][T[nH][nM][nS]])");
	return ical_duration(secs);
}

std::optional<std::string> timezone_identifier_of(const ddd_value &v)
{
	const std::string *z = nullptr;
	if (auto dt = std::get_if<ical_datetime>(&v))
		z = &dt->tzid();
	else if (auto c = std::get_if<ical_clock>(&v))
		z = &c->tzid();
	if (z == nullptr || z->empty() || *z == "UTC")
		return std::nullopt;
	return *z;
}

}
