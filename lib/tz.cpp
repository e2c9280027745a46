// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	IANA zone lookups, backed by the ICU calendar service
 */
#include <cmath>
#include <cstring>
#include <ctime>
#include <iterator>
#include <memory>
#include <unicode/ucal.h>
#include <unicode/ustring.h>
#include <calvt/defs.h>
#include <calvt/timezone.hpp>
#include <calvt/util.hpp>

using namespace calvt;

namespace {
struct ucal_delete {
	inline void operator()(UCalendar *c) const { ucal_close(c); }
};
}

/* Far enough in the past to make the calendar purely Gregorian */
static constexpr UDate TZ_PROLEPTIC_CHANGE = -1e15;

static bool tz_to_uchar(const char *zone, UChar *out, size_t outmax)
{
	if (zone == nullptr || *zone == '\0' || strlen(zone) >= outmax)
		return false;
	u_uastrcpy(out, zone);
	return true;
}

namespace tz {

bool tzvalid(const char *zone)
{
	UChar uz[128], canon[128];
	if (!tz_to_uchar(zone, uz, std::size(uz)))
		return false;
	UBool is_system = false;
	UErrorCode st = U_ZERO_ERROR;
	ucal_getCanonicalTimeZoneID(uz, -1, canon, std::size(canon), &is_system, &st);
	return U_SUCCESS(st) && is_system;
}

/*
 * Interpret @tm (tm_year, tm_mon, tm_mday, tm_hour, tm_min, tm_sec) as wall
 * clock time in @zone. A wall time in a DST gap or overlap is resolved the
 * way ICU's lenient calendar does it.
 */
bool mktime_z(const char *zone, const struct tm *tm, time_t *out)
{
	UChar uz[128];
	if (!tzvalid(zone) || !tz_to_uchar(zone, uz, std::size(uz)))
		return false;
	UErrorCode st = U_ZERO_ERROR;
	std::unique_ptr<UCalendar, ucal_delete> cal(ucal_open(uz, -1, "",
		UCAL_GREGORIAN, &st));
	if (U_FAILURE(st)) {
		mlog(LV_DEBUG, "tz: ucal_open %s: %s", zone, u_errorName(st));
		return false;
	}
	ucal_setGregorianChange(cal.get(), TZ_PROLEPTIC_CHANGE, &st);
	ucal_clear(cal.get());
	ucal_setDateTime(cal.get(), tm->tm_year + 1900, tm->tm_mon, tm->tm_mday,
		tm->tm_hour, tm->tm_min, tm->tm_sec, &st);
	auto ms = ucal_getMillis(cal.get(), &st);
	if (U_FAILURE(st)) {
		mlog(LV_DEBUG, "tz: %s: %s", zone, u_errorName(st));
		return false;
	}
	*out = static_cast<time_t>(std::floor(ms / 1000));
	return true;
}

}
