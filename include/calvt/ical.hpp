#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <calvt/defs.h>

enum class ical_frequency {
	second, minute, hour, day, week, month, year,
};

/*
 * Grammar primitives. All of them operate on the exact text given; no
 * whitespace trimming takes place.
 */
extern CVT_EXPORT bool ical_parse_date(const char *str_date, int *pyear, int *pmonth, int *pday);
extern CVT_EXPORT bool ical_parse_clock(const char *str_time, int *phour, int *pminute, int *psecond);
extern CVT_EXPORT bool ical_parse_utc_offset(const char *str_offset, int32_t *pseconds);
extern CVT_EXPORT bool ical_parse_duration(const char *str_duration, int64_t *pseconds);
extern CVT_EXPORT bool ical_parse_byday(const char *str_byday, int *pdayofweek, int *pweekorder);
extern CVT_EXPORT bool ical_parse_frequency(const char *str_freq, ical_frequency *);
extern CVT_EXPORT const char *ical_frequency_to_str(ical_frequency);
extern CVT_EXPORT bool ical_check_leap_year(unsigned int year);
extern CVT_EXPORT unsigned int ical_get_monthdays(unsigned int year, unsigned int month);
extern CVT_EXPORT int weekday_to_int(const char *);
extern CVT_EXPORT const char *weekday_to_str(unsigned int);
extern CVT_EXPORT std::string escape_char(std::string_view);
extern CVT_EXPORT std::string unescape_char(std::string_view);
