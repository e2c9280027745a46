// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	RFC 5545 value grammar primitives: date, time-of-day, utc-offset,
 *	duration, weekday and frequency tokens, and text escaping.
 */
#include <charconv>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <string>
#include <string_view>
#include <strings.h>
#include <libHX/ctype_helper.h>
#include <calvt/defs.h>
#include <calvt/ical.hpp>

static bool ical_fixed_digits(const char *s, size_t len)
{
	for (size_t i = 0; i < len; ++i)
		if (!HX_isdigit(s[i]))
			return false;
	return true;
}

static int ical_2digit(const char *s)
{
	return (s[0] - '0') * 10 + (s[1] - '0');
}

bool ical_check_leap_year(unsigned int year)
{
	return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

/* 0 for a month outside 1..12 */
unsigned int ical_get_monthdays(unsigned int year, unsigned int month)
{
	static constexpr uint8_t mdays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12)
		return 0;
	return mdays[month-1] + (month == 2 && ical_check_leap_year(year));
}

/* YYYYMMDD, a date that exists in the proleptic Gregorian calendar */
bool ical_parse_date(const char *str_date, int *pyear, int *pmonth, int *pday)
{
	if (strlen(str_date) != 8 || !ical_fixed_digits(str_date, 8))
		return false;
	int year  = ical_2digit(str_date) * 100 + ical_2digit(str_date + 2);
	int month = ical_2digit(str_date + 4);
	int day   = ical_2digit(str_date + 6);
	if (year < 1 || month < 1 || month > 12 || day < 1 ||
	    static_cast<unsigned int>(day) > ical_get_monthdays(year, month))
		return false;
	*pyear  = year;
	*pmonth = month;
	*pday   = day;
	return true;
}

/* HHMMSS */
bool ical_parse_clock(const char *str_time, int *phour, int *pminute,
    int *psecond)
{
	if (strlen(str_time) != 6 || !ical_fixed_digits(str_time, 6))
		return false;
	int hour   = ical_2digit(str_time);
	int minute = ical_2digit(str_time + 2);
	int second = ical_2digit(str_time + 4);
	if (hour > 23 || minute > 59 || second > 59)
		return false;
	*phour   = hour;
	*pminute = minute;
	*psecond = second;
	return true;
}

/*
 * (+|-)HHMM[SS]. The hour field is not range-checked here; callers decide
 * what magnitude they accept.
 */
bool ical_parse_utc_offset(const char *str_offset, int32_t *pseconds)
{
	int factor;
	if (*str_offset == '-')
		factor = -1;
	else if (*str_offset == '+')
		factor = 1;
	else
		return false;
	++str_offset;
	auto len = strlen(str_offset);
	if ((len != 4 && len != 6) || !ical_fixed_digits(str_offset, len))
		return false;
	int hour   = ical_2digit(str_offset);
	int minute = ical_2digit(str_offset + 2);
	int second = len == 6 ? ical_2digit(str_offset + 4) : 0;
	if (minute > 59 || second > 59)
		return false;
	*pseconds = factor * (hour * 3600 + minute * 60 + second);
	return true;
}

/*
 * Consume "<digits><unit>" at @p if present. Returns false only on numeric
 * overflow; *pfound tells whether the component was there.
 */
static bool ical_duration_part(const char *&p, char unit, int64_t mult,
    int64_t *ptotal, bool *pfound)
{
	*pfound = false;
	auto q = p;
	while (HX_isdigit(*q))
		++q;
	if (q == p || *q != unit)
		return true;
	uint64_t v = 0;
	auto res = std::from_chars(p, q, v);
	if (res.ec != std::errc() || v > INT64_MAX)
		return false;
	int64_t part;
	if (__builtin_mul_overflow(static_cast<int64_t>(v), mult, &part) ||
	    __builtin_add_overflow(*ptotal, part, ptotal))
		return false;
	p = q + 1;
	*pfound = true;
	return true;
}

/*
 * [+|-]P(<n>W | [<n>D][T[<n>H][<n>M][<n>S]])
 * The week form excludes everything else; the day/time components must
 * appear in this order and each at most once.
 */
bool ical_parse_duration(const char *str_duration, int64_t *pseconds)
{
	int factor = 1;
	auto ptoken = str_duration;
	if (*ptoken == '+') {
		++ptoken;
	} else if (*ptoken == '-') {
		factor = -1;
		++ptoken;
	}
	if (*ptoken != 'P')
		return false;
	++ptoken;
	int64_t total = 0;
	bool found = false;
	if (!ical_duration_part(ptoken, 'W', 7 * 86400, &total, &found))
		return false;
	if (found) {
		if (*ptoken != '\0')
			return false;
		*pseconds = factor * total;
		return true;
	}
	if (!ical_duration_part(ptoken, 'D', 86400, &total, &found))
		return false;
	if (*ptoken == 'T') {
		++ptoken;
		if (!ical_duration_part(ptoken, 'H', 3600, &total, &found) ||
		    !ical_duration_part(ptoken, 'M', 60, &total, &found) ||
		    !ical_duration_part(ptoken, 'S', 1, &total, &found))
			return false;
	}
	if (*ptoken != '\0')
		return false;
	*pseconds = factor * total;
	return true;
}

static constexpr const char *ical_weekday_names[] = {
	"SU", "MO", "TU", "WE", "TH", "FR", "SA",
};

/* 0=SU .. 6=SA, -1 if @s is not a two-letter weekday code */
int weekday_to_int(const char *s)
{
	for (size_t i = 0; i < std::size(ical_weekday_names); ++i)
		if (strcasecmp(s, ical_weekday_names[i]) == 0)
			return i;
	return -1;
}

/* 7 is accepted as another name for Sunday */
const char *weekday_to_str(unsigned int n)
{
	return n <= 7 ? ical_weekday_names[n % 7] : nullptr;
}

/*
 * [[+|-]<1..53>]<weekday>
 * *pweekorder is 0 when no ordinal was given.
 */
bool ical_parse_byday(const char *str_byday, int *pdayofweek, int *pweekorder)
{
	bool b_negative = false, b_signed = false;
	auto pbegin = str_byday;
	if (*pbegin == '-') {
		b_negative = b_signed = true;
		++pbegin;
	} else if (*pbegin == '+') {
		b_signed = true;
		++pbegin;
	}
	int order = 0;
	if (HX_isdigit(*pbegin)) {
		order = *pbegin++ - '0';
		if (HX_isdigit(*pbegin))
			order = order * 10 + (*pbegin++ - '0');
		if (order < 1 || order > 53)
			return false;
	} else if (b_signed) {
		return false;
	}
	auto dow = weekday_to_int(pbegin);
	if (dow < 0)
		return false;
	*pdayofweek = dow;
	*pweekorder = b_negative ? -order : order;
	return true;
}

static constexpr const char *ical_freq_names[] = {
	"SECONDLY", "MINUTELY", "HOURLY", "DAILY", "WEEKLY", "MONTHLY", "YEARLY",
};

bool ical_parse_frequency(const char *s, ical_frequency *pfreq)
{
	for (size_t i = 0; i < std::size(ical_freq_names); ++i) {
		if (strcasecmp(s, ical_freq_names[i]) == 0) {
			*pfreq = static_cast<ical_frequency>(i);
			return true;
		}
	}
	return false;
}

const char *ical_frequency_to_str(ical_frequency f)
{
	auto i = static_cast<size_t>(f);
	return i < std::size(ical_freq_names) ? ical_freq_names[i] : nullptr;
}

std::string escape_char(std::string_view s)
{
	std::string out;
	out.reserve(s.size());
	for (size_t i = 0; i < s.size(); ++i) {
		if (s[i] == '\\' || s[i] == ';' || s[i] == ',') {
			out += '\\';
		} else if (s[i] == '\n' ||
		    (s[i] == '\r' && i + 1 < s.size() && s[i+1] == '\n')) {
			out += "\\n";
			if (s[i] == '\r')
				++i;
			continue;
		}
		out += s[i];
	}
	return out;
}

std::string unescape_char(std::string_view s)
{
	std::string out;
	out.reserve(s.size());
	for (size_t i = 0; i < s.size(); ++i) {
		if (s[i] != '\\' || i + 1 >= s.size()) {
			out += s[i];
			continue;
		}
		auto c = s[i+1];
		if (c == '\\' || c == ';' || c == ',') {
			out += c;
			++i;
		} else if (c == 'n' || c == 'N') {
			out += '\n';
			++i;
		} else {
			out += '\\';
		}
	}
	return out;
}
