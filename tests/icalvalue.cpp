// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <calvt/defs.h>
#include <calvt/ical.hpp>
#include <calvt/icalvalue.hpp>
#include <calvt/util.hpp>
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace calvt;

template<typename F> static bool throws_invalid(F &&f)
{
	try {
		f();
	} catch (const invalid_value &e) {
		printf("\texpected: %s\n", e.what());
		return true;
	}
	return false;
}

static int t_error()
{
	try {
		bool_from_ical("maybe");
		assert(false);
	} catch (const invalid_value &e) {
		assert(strcmp(e.what(), "Invalid BOOLEAN value \"maybe\": expected TRUE or FALSE") == 0);
		assert(e.type() == "BOOLEAN");
		assert(e.raw() == "maybe");
		assert(e.reason() == "expected TRUE or FALSE");
	}
	try {
		utcoffset_from_ical("+2400");
		assert(false);
	} catch (const invalid_value &e) {
		assert(e.reason() == "offset must be less than 24 hours");
	}
	return EXIT_SUCCESS;
}

static int t_scalar()
{
	assert(to_ical(ical_binary{"foo"}) == "Zm9v");
	assert(binary_from_ical("Zm9vYmFy").data == "foobar");
	assert(throws_invalid([] { binary_from_ical("Zm9v*"); }));

	assert(bool_from_ical("TRUE"));
	assert(bool_from_ical("true"));
	assert(!bool_from_ical("False"));
	assert(bool_to_ical(true) == "TRUE" && bool_to_ical(false) == "FALSE");
	assert(throws_invalid([] { bool_from_ical("maybe"); }));
	assert(throws_invalid([] { bool_from_ical(""); }));

	assert(float_to_ical(1.5) == "1.5");
	assert(float_from_ical("+3.25") == 3.25);
	assert(float_from_ical("-0.5") == -0.5);
	assert(throws_invalid([] { float_from_ical("1.5x"); }));
	assert(throws_invalid([] { float_from_ical(""); }));

	assert(integer_to_ical(-17) == "-17");
	assert(integer_from_ical("+5") == 5);
	assert(integer_from_ical("-2147483649") == -2147483649LL);
	assert(throws_invalid([] { integer_from_ical("1.0"); }));
	assert(throws_invalid([] { integer_from_ical("99999999999999999999"); }));
	assert(throws_invalid([] { integer_from_ical("+-1"); }));

	assert(to_ical(ical_uri{"http://example.com/a;b"}) == "http://example.com/a;b");
	assert(uri_from_ical("ftp://x/y").value == "ftp://x/y");
	assert(inline_from_ical("a\\,b").value == "a\\,b");
	assert(to_ical(ical_inline{"raw;text"}) == "raw;text");

	assert(to_ical(ical_text{"a,b;c\\d\ne"}) == "a\\,b\\;c\\\\d\\ne");
	assert(text_from_ical("a\\;b\\nc").value == "a;b\nc");
	assert(text_from_ical("bad\xff").value == "bad?");
	/* embedded NULs are kept */
	auto nul = text_from_ical(std::string_view("ab\0cd", 5)).value;
	assert(nul.size() == 5 && nul == std::string("ab\0cd", 5));
	return EXIT_SUCCESS;
}

static int t_caladdr()
{
	assert(cal_address("user@example.com").value == "mailto:user@example.com");
	assert(cal_address("MAILTO:user@example.com").value == "MAILTO:user@example.com");
	assert(cal_address("nobody").value == "nobody");
	assert(cal_address("a@b").value == "a@b");
	/* decoding keeps the text, encoding adds the scheme */
	auto a = caladdress_from_ical("jsmith@example.com");
	assert(a.value == "jsmith@example.com");
	assert(to_ical(a) == "mailto:jsmith@example.com");
	assert(to_ical(caladdress_from_ical("mailto:x@y.org")) == "mailto:x@y.org");
	assert(to_ical(cal_address::raw("urn:uuid:1234")) == "urn:uuid:1234");
	return EXIT_SUCCESS;
}

static int t_geo()
{
	auto g = geo_from_ical("37.386013;-122.082932");
	assert(g.latitude() == 37.386013 && g.longitude() == -122.082932);
	assert(to_ical(ical_geo(1.5, -2.25)) == "1.5;-2.25");
	assert(geo_from_ical(to_ical(g)) == g);
	assert(throws_invalid([] { geo_from_ical("1;2;3"); }));
	assert(throws_invalid([] { geo_from_ical("1,2"); }));
	assert(throws_invalid([] { geo_from_ical("north;2"); }));
	assert(throws_invalid([] { ical_geo(NAN, 0); }));
	return EXIT_SUCCESS;
}

static int t_utcoffset()
{
	assert(utcoffset_from_ical("-0500").seconds() == -5 * 3600);
	assert(utcoffset_from_ical("+023000").seconds() == 2 * 3600 + 30 * 60);
	assert(utcoffset_from_ical("+0000").seconds() == 0);
	assert(throws_invalid([] { utcoffset_from_ical("+2400"); }));
	assert(throws_invalid([] { utcoffset_from_ical("0500"); }));
	assert(throws_invalid([] { utcoffset_from_ical("+05000"); }));
	assert(throws_invalid([] { utcoffset_from_ical("+0560"); }));
	assert(to_ical(ical_utcoffset(-5 * 3600)) == "-0500");
	assert(to_ical(ical_utcoffset(0)) == "+0000");
	assert(to_ical(ical_utcoffset(3661)) == "+010101");
	assert(to_ical(ical_utcoffset(-(23 * 3600 + 59 * 60))) == "-2359");
	assert(throws_invalid([] { ical_utcoffset(86400); }));
	assert(throws_invalid([] { ical_utcoffset(-86400); }));
	return EXIT_SUCCESS;
}

static int t_date()
{
	auto d = date_from_ical("20230228");
	assert(d.year() == 2023 && d.month() == 2 && d.day() == 28);
	assert(to_ical(ical_date(2024, 2, 29)) == "20240229");
	assert(to_ical(ical_date(1, 1, 1)) == "00010101");
	assert(throws_invalid([] { date_from_ical("20230229"); }));
	assert(throws_invalid([] { date_from_ical("2023-01-01"); }));
	assert(throws_invalid([] { date_from_ical("202301011"); }));
	assert(throws_invalid([] { date_from_ical("00000101"); }));
	assert(ical_date(1970, 1, 1).day_number() == 0);
	assert(ical_date(2023, 1, 1).day_number() == 19358);
	assert(ical_date(2023, 12, 31).add_days(1) == ical_date(2024, 1, 1));
	assert(ical_date(2024, 3, 1).add_days(-1) == ical_date(2024, 2, 29));
	assert(ical_date(2000, 1, 1) < ical_date(2000, 1, 2));
	return EXIT_SUCCESS;
}

static int t_time()
{
	auto t = time_from_ical("123045");
	assert(t.hour() == 12 && t.minute() == 30 && t.second() == 45 && t.tzid().empty());
	assert(to_ical(t) == "123045");
	auto u = time_from_ical("070000Z");
	assert(u.is_utc() && to_ical(u) == "070000Z");
	assert(!timezone_identifier_of(u).has_value());
	auto z = time_from_ical("090000", "Europe/Vienna");
	assert(z.tzid() == "Europe/Vienna" && to_ical(z) == "090000");
	assert(throws_invalid([] { time_from_ical("246000"); }));
	assert(throws_invalid([] { time_from_ical("120060"); }));
	assert(throws_invalid([] { time_from_ical("1200"); }));
	assert(throws_invalid([] { time_from_ical("120000X"); }));
	assert(time_from_ical("120000X", "Europe/Vienna") == ical_clock(12, 0, 0, "Europe/Vienna"));
	assert(throws_invalid([] { ical_clock(1, 2, 3, "No/Such_Zone"); }));
	return EXIT_SUCCESS;
}

static int t_datetime()
{
	auto u = datetime_from_ical("20230101T120000Z");
	assert(u.is_utc() && !u.is_floating());
	assert(u.date() == ical_date(2023, 1, 1) && u.hour() == 12);
	assert(to_ical(u) == "20230101T120000Z");
	time_t ts = 0;
	assert(u.to_time_t(&ts) && ts == 1672574400);

	auto f = datetime_from_ical("20230101T120000");
	assert(f.is_floating());
	assert(to_ical(f) == "20230101T120000");
	assert(!f.to_time_t(&ts));
	assert(!timezone_identifier_of(f).has_value());

	auto ny = datetime_from_ical("20230101T120000", "America/New_York");
	assert(ny.tzid() == "America/New_York");
	assert(to_ical(ny) == "20230101T120000");
	assert(timezone_identifier_of(ny) == std::optional<std::string>("America/New_York"));
	/* EST is UTC-5 */
	assert(ny.to_time_t(&ts) && ts == 1672592400);
	auto summer = datetime_from_ical("20230701T120000", "America/New_York");
	assert(summer.to_time_t(&ts) && ts == 1688227200);

	/* an unknown hint is ignored, a valid one wins over the suffix */
	assert(datetime_from_ical("20230101T120000Z", "Nowhere/Special").is_utc());
	assert(datetime_from_ical("20230101T120000", "Nowhere/Special").is_floating());
	assert(datetime_from_ical("20230101T120000Z", "Europe/Berlin").tzid() == "Europe/Berlin");
	assert(datetime_from_ical("20230101T120000", "utc").is_utc());

	assert(throws_invalid([] { datetime_from_ical("20230101T120000+0100"); }));
	/* with a zone hint the suffix is not looked at */
	auto berlin = datetime_from_ical("20230101T120000+0100", "Europe/Berlin");
	assert(berlin == ical_datetime(ical_date(2023, 1, 1), 12, 0, 0, "Europe/Berlin"));
	assert(to_ical(berlin) == "20230101T120000");
	assert(throws_invalid([] { datetime_from_ical("20230101T120000+0100", "Nowhere/Special"); }));
	assert(throws_invalid([] { datetime_from_ical("20230101 120000"); }));
	assert(throws_invalid([] { datetime_from_ical("20230132T120000"); }));
	assert(throws_invalid([] { datetime_from_ical("20230101T250000"); }));
	assert(throws_invalid([] { ical_datetime(ical_date(2023, 1, 1), 0, 0, 0, "Mars/Olympus"); }));

	auto later = ical_datetime(ical_date(2023, 12, 31), 23, 0, 0).add_seconds(7200);
	assert(later == ical_datetime(ical_date(2024, 1, 1), 1, 0, 0));
	assert(throws_invalid([&] { later.add_seconds(INT64_MAX); }));
	assert(throws_invalid([&] { later.add_seconds(INT64_MIN); }));
	return EXIT_SUCCESS;
}

static int t_duration()
{
	assert(to_ical(ical_duration(-86400)) == "-P1D");
	auto d = duration_from_ical("P15DT5H0M20S");
	assert(!d.negative());
	assert(d.days() == 15 && d.hours() == 5 && d.minutes() == 0 && d.seconds() == 20);
	assert(duration_from_ical("P7W").days() == 49);
	assert(duration_from_ical("-PT30M").total == -1800);
	assert(duration_from_ical("+PT1S").total == 1);
	assert(duration_from_ical("P").total == 0);
	assert(to_ical(ical_duration(0)) == "P0D");
	assert(to_ical(ical_duration(3600)) == "PT1H");
	assert(to_ical(ical_duration(3601)) == "PT1H0M1S");
	assert(to_ical(ical_duration(90061)) == "P1DT1H1M1S");
	assert(to_ical(ical_duration(-1800)) == "-PT30M");
	assert(to_ical(ical_duration(7 * 86400)) == "P7D");
	assert(throws_invalid([] { duration_from_ical("P1W2D"); }));
	assert(throws_invalid([] { duration_from_ical("PT1S1M"); }));
	assert(throws_invalid([] { duration_from_ical("1D"); }));
	assert(throws_invalid([] { duration_from_ical("P1Y"); }));
	assert(throws_invalid([] { duration_from_ical("P99999999999999999999D"); }));
	return EXIT_SUCCESS;
}

static int t_ddd()
{
	assert(std::holds_alternative<ical_date>(ddd_from_ical("20230101")));
	assert(std::holds_alternative<ical_datetime>(ddd_from_ical("20230101T000000Z")));
	assert(std::holds_alternative<ical_clock>(ddd_from_ical("120000")));
	assert(std::holds_alternative<ical_clock>(ddd_from_ical("120000Z")));
	assert(std::holds_alternative<ical_duration>(ddd_from_ical("P1D")));
	assert(std::holds_alternative<ical_duration>(ddd_from_ical("-PT5M")));
	auto v = ddd_from_ical("20230101T090000", "Europe/Vienna");
	assert(std::get<ical_datetime>(v).tzid() == "Europe/Vienna");
	assert(throws_invalid([] { ddd_from_ical("garbage"); }));
	assert(throws_invalid([] { ddd_from_ical(""); }));
	assert(throws_invalid([] { ddd_from_ical("2023010"); }));

	assert(to_ical(ddd_value{ical_date(2023, 5, 6)}) == "20230506");
	assert(to_ical(to_ddd(native_value{ical_duration(60)})) == "PT1M");
	assert(std::holds_alternative<ical_clock>(to_ddd(native_value{ical_clock(1, 2, 3)})));
	assert(throws_invalid([] { to_ddd(native_value{int64_t{5}}); }));
	assert(throws_invalid([] { to_ddd(native_value{ical_text{"x"}}); }));
	return EXIT_SUCCESS;
}

static int t_period()
{
	ical_datetime s(ical_date(2023, 1, 1), 0, 0, 0, "UTC");
	ical_period p(s, ical_duration(86400));
	assert(to_ical(p) == "20230101T000000Z/P1D");
	assert(p.by_duration());
	assert(std::get<ical_datetime>(p.end()) == ical_datetime(ical_date(2023, 1, 2), 0, 0, 0, "UTC"));

	auto q = period_from_ical("20230101T000000Z/20230102T000000Z");
	assert(!q.by_duration() && q.duration().total == 86400);
	assert(to_ical(q) == "20230101T000000Z/20230102T000000Z");
	assert(p == q);
	assert(period_from_ical("20230101T000000Z/P1D") == p);

	/* start > end */
	assert(throws_invalid([&] { ical_period(s, ical_datetime(ical_date(2022, 12, 31), 0, 0, 0, "UTC")); }));
	assert(throws_invalid([&] { ical_period(s, ical_duration(-1)); }));
	assert(throws_invalid([] { period_from_ical("20230102/20230101"); }));
	try {
		period_from_ical("20230102T000000/20230101T000000");
		assert(false);
	} catch (const invalid_value &e) {
		assert(e.type() == "PERIOD");
		assert(e.reason() == "start is after end");
	}

	auto dp = period_from_ical("20230101/P2D");
	assert(std::get<ical_date>(dp.end()) == ical_date(2023, 1, 3));
	assert(to_ical(dp) == "20230101/P2D");
	assert(throws_invalid([] { period_from_ical("20230101/PT1H"); }));
	assert(throws_invalid([] { period_from_ical("20230101/20230101T000000"); }));
	assert(throws_invalid([] { period_from_ical("120000/PT1H"); }));
	assert(throws_invalid([] { period_from_ical("20230101T000000Z"); }));
	assert(throws_invalid([] { period_from_ical("20230101T000000Z/P1D/P1D"); }));
	assert(throws_invalid([] { period_from_ical("20230101T000000/20230101T010000Z"); }));
	try {
		period_from_ical("20230101T000000Z/P106751991167300DT15H30M7S");
		assert(false);
	} catch (const invalid_value &e) {
		assert(e.type() == "PERIOD");
		assert(e.reason() == "end out of range");
	}
	assert(throws_invalid([] { period_from_ical("20230101/P99999999D"); }));

	/* different zones are compared by instant */
	ical_period z(ical_datetime(ical_date(2023, 1, 1), 12, 0, 0, "America/New_York"),
	              ical_datetime(ical_date(2023, 1, 1), 18, 0, 0, "UTC"));
	assert(z.duration().total == 3600);

	auto a = period_from_ical("20230101T000000Z/PT2H");
	auto b = period_from_ical("20230101T010000Z/PT2H");
	auto c = period_from_ical("20230101T020000Z/PT1H");
	assert(a.overlaps(b) && b.overlaps(a));
	assert(b.overlaps(c));
	assert(!a.overlaps(c) && !c.overlaps(a));
	return EXIT_SUCCESS;
}

static int t_list()
{
	auto l = ddd_list_from_ical("20230101,20230102");
	assert(l.items().size() == 2);
	assert(std::get<ical_date>(l.items()[1]) == ical_date(2023, 1, 2));
	assert(to_ical(l) == "20230101,20230102");
	auto z = ddd_list_from_ical("20230101T090000,20230102T090000", "Europe/Vienna");
	assert(std::get<ical_datetime>(z.items()[0]).tzid() == "Europe/Vienna");
	assert(throws_invalid([] { ddd_list_from_ical("20230101,20230101T000000"); }));
	assert(throws_invalid([] { ddd_list_from_ical(""); }));
	assert(throws_invalid([] { ddd_list_from_ical("20230101,"); }));
	assert(throws_invalid([] { ical_ddd_list(std::vector<ddd_value>{}); }));

	auto p = params_of(native_value{z});
	assert(p.size() == 1 && *p.get("TZID") == "Europe/Vienna");
	assert(params_of(native_value{l}).empty());
	assert(params_of(native_value{ddd_list_from_ical("20230101T000000Z,20230102T000000Z")}).empty());
	/* elements in two zones: the last one decides */
	ical_ddd_list mixed(std::vector<ddd_value>{ical_datetime(ical_date(2023, 1, 1), 9, 0, 0, "Europe/Vienna"),
		ical_datetime(ical_date(2023, 1, 2), 9, 0, 0, "America/New_York"),
		ical_datetime(ical_date(2023, 1, 3), 9, 0, 0, "UTC")});
	p = params_of(native_value{mixed});
	assert(p.size() == 1 && *p.get("TZID") == "America/New_York");
	ical_property prop(types_factory::instance().from_ical("EXDATE",
		"20230101T090000,20230108T090000", "Europe/Vienna"));
	assert(*prop.params.get("TZID") == "Europe/Vienna");
	return EXIT_SUCCESS;
}

static int t_weekday()
{
	auto w = weekday_from_ical("2MO");
	assert(w.ordinal() == 2 && w.dow() == 1);
	w = weekday_from_ical("-1FR");
	assert(w.ordinal() == -1 && w.dow() == 5);
	w = weekday_from_ical("su");
	assert(w.ordinal() == 0 && w.dow() == 0);
	assert(weekday_from_ical("+3TU") == ical_weekday(2, 3));
	assert(throws_invalid([] { weekday_from_ical("XX"); }));
	assert(throws_invalid([] { weekday_from_ical("-MO"); }));
	assert(throws_invalid([] { weekday_from_ical("54MO"); }));
	assert(throws_invalid([] { weekday_from_ical("0MO"); }));
	assert(throws_invalid([] { weekday_from_ical("1MON"); }));
	assert(to_ical(ical_weekday(1, 2)) == "2MO");
	assert(to_ical(ical_weekday(5, -1)) == "-1FR");
	assert(to_ical(ical_weekday(6)) == "SA");
	assert(throws_invalid([] { ical_weekday(7); }));
	assert(throws_invalid([] { ical_weekday(9); }));
	assert(throws_invalid([] { ical_weekday(1, 54); }));
	assert(to_ical(ical_weekday()) == "MO");

	assert(frequency_from_ical("weekly") == ical_frequency::week);
	assert(to_ical(ical_frequency::year) == "YEARLY");
	assert(throws_invalid([] { frequency_from_ical("FORTNIGHTLY"); }));
	return EXIT_SUCCESS;
}

static int t_recur()
{
	auto r = recur_from_ical("FREQ=WEEKLY;BYDAY=MO,WE,FR;COUNT=10");
	assert(to_ical(r) == "FREQ=WEEKLY;COUNT=10;BYDAY=MO,WE,FR");
	auto byday = r.get("byday");
	assert(byday != nullptr && byday->size() == 3);
	assert(std::get<ical_weekday>((*byday)[2]) == ical_weekday(5));
	assert(std::get<int64_t>(r.get("COUNT")->front()) == 10);
	assert(std::get<ical_frequency>(r.get("Freq")->front()) == ical_frequency::week);

	assert(to_ical(recur_from_ical("BYDAY=MO;FREQ=DAILY")) == "FREQ=DAILY;BYDAY=MO");
	assert(to_ical(recur_from_ical("freq=monthly;byday=-1fr;bymonth=1,7")) ==
	       "FREQ=MONTHLY;BYDAY=-1FR;BYMONTH=1,7");

	auto u = recur_from_ical("FREQ=DAILY;UNTIL=20231231T235959Z");
	auto &until = std::get<ddd_value>(u.get("UNTIL")->front());
	assert(std::get<ical_datetime>(until).is_utc());
	assert(to_ical(u) == "FREQ=DAILY;UNTIL=20231231T235959Z");
	assert(to_ical(recur_from_ical("UNTIL=20231231;FREQ=YEARLY")) == "FREQ=YEARLY;UNTIL=20231231");

	/* unknown parts are kept as text, after the known ones */
	auto x = recur_from_ical("X-B=1;FREQ=DAILY;X-A=two,three");
	assert(std::get<std::string>(x.get("X-B")->front()) == "1");
	assert(x.get("X-A")->size() == 2);
	assert(to_ical(x) == "FREQ=DAILY;X-A=two,three;X-B=1");
	assert(recur_from_ical(to_ical(x)) == x);

	assert(to_ical(recur_from_ical("FREQ=DAILY;COUNT=1;COUNT=2")) == "FREQ=DAILY;COUNT=2");

	/* BYWEEKNO has no numeric codec of its own and stays text */
	auto wk = recur_from_ical("FREQ=YEARLY;BYWEEKNO=20,-1");
	assert(std::get<std::string>(wk.get("BYWEEKNO")->front()) == "20");
	assert(std::get<std::string>(wk.get("BYWEEKNO")->back()) == "-1");
	assert(to_ical(wk) == "FREQ=YEARLY;BYWEEKNO=20,-1");

	assert(throws_invalid([] { recur_from_ical("FREQ"); }));
	assert(throws_invalid([] { recur_from_ical("FREQ=DAILY=WEEKLY"); }));
	assert(throws_invalid([] { recur_from_ical("FREQ=FORTNIGHTLY"); }));
	assert(throws_invalid([] { recur_from_ical("FREQ=DAILY;BYDAY=XX"); }));
	assert(throws_invalid([] { recur_from_ical("FREQ=DAILY;"); }));
	assert(throws_invalid([] { recur_from_ical("=DAILY"); }));
	try {
		recur_from_ical("FREQ=DAILY;COUNT=ten");
		assert(false);
	} catch (const invalid_value &e) {
		assert(e.type() == "RECUR");
		assert(e.raw() == "FREQ=DAILY;COUNT=ten");
		assert(e.reason() == "COUNT: not an integer");
	}

	ical_recur built;
	built.set("interval", {int64_t{2}});
	built.set("freq", {ical_frequency::month});
	built.set("byday", {ical_weekday(1, 1), ical_weekday(3, -2)});
	assert(to_ical(built) == "FREQ=MONTHLY;INTERVAL=2;BYDAY=1MO,-2WE");
	assert(throws_invalid([&] { built.set("COUNT", {ical_weekday(1)}); }));
	assert(throws_invalid([&] { built.set("FREQ", {}); }));
	assert(throws_invalid([&] { built.set("BAD KEY", {std::string("x")}); }));
	assert(throws_invalid([&] { built.set("BYWEEKNO", {int64_t{20}}); }));

	/* separators cannot be written back, so text parts may not hold them */
	assert(throws_invalid([&] { built.set("X-A", {std::string("a;b")}); }));
	assert(throws_invalid([&] { built.set("X-A", {std::string("a,b")}); }));
	assert(throws_invalid([&] { built.set("X-A", {std::string("a=b")}); }));
	assert(built.get("X-A") == nullptr);
	built.set("X-A", {std::string("a\\b"), std::string("c d")});
	assert(to_ical(built) == "FREQ=MONTHLY;INTERVAL=2;BYDAY=1MO,-2WE;X-A=a\\\\b,c d");
	assert(recur_from_ical(to_ical(built)) == built);
	return EXIT_SUCCESS;
}

static int t_registry()
{
	auto &f = types_factory::instance();
	assert(f.for_property("DTSTART") == ical_vtype::date_time);
	assert(f.for_property("rrule") == ical_vtype::recur);
	assert(f.for_property("Attendee") == ical_vtype::cal_address);
	assert(f.for_property("GEO") == ical_vtype::geo);
	assert(f.for_property("rsvp") == ical_vtype::boolean);
	assert(f.for_property("tzoffsetto") == ical_vtype::utc_offset);
	assert(f.for_property("exdate") == ical_vtype::date_time_list);
	assert(f.for_property("X-WR-CALNAME") == ical_vtype::text);
	assert(strcmp(types_factory::type_name(ical_vtype::date_time), "date-time") == 0);
	assert(types_factory::type_from_name("DATE-TIME") == ical_vtype::date_time);
	assert(types_factory::type_from_name("Float") == ical_vtype::floating);
	assert(!types_factory::type_from_name("no-such-type").has_value());

	auto v = f.from_ical("dtstart", "20230101T120000", "America/New_York");
	assert(std::get<ical_datetime>(v).tzid() == "America/New_York");
	assert(std::holds_alternative<ical_date>(f.from_ical("DTSTART", "20230101")));
	assert(std::holds_alternative<ical_duration>(f.from_ical("trigger", "-PT15M")));
	assert(std::get<bool>(f.from_ical("RSVP", "TRUE")));
	assert(std::get<int64_t>(f.from_ical("priority", "5")) == 5);
	assert(std::get<ical_text>(f.from_ical("summary", "a\\, b")).value == "a, b");
	assert(std::get<ical_text>(f.from_ical("x-custom", "1")).value == "1");
	assert(std::holds_alternative<ical_recur>(f.from_ical("RRULE", "FREQ=DAILY")));
	assert(std::holds_alternative<ical_period>(f.from_ical("freebusy", "20230101T000000Z/PT1H")));
	assert(std::holds_alternative<ical_ddd_list>(f.from_ical("rdate", "20230101,20230201")));

	assert(f.to_ical("geo", native_value{ical_geo(1.5, 2)}) == "1.5;2");
	assert(f.to_ical("DTSTART", native_value{ical_date(2023, 1, 1)}) == "20230101");
	assert(f.to_ical("organizer", native_value{cal_address("boss@example.com")}) == "mailto:boss@example.com");
	assert(f.to_ical("summary", native_value{ical_text{"a;b"}}) == "a\\;b");
	assert(throws_invalid([&] { f.to_ical("priority", native_value{ical_text{"x"}}); }));
	assert(throws_invalid([&] { f.to_ical("dtstart", native_value{int64_t{1}}); }));
	assert(throws_invalid([&] { f.from_ical("priority", "high"); }));

	assert(types_factory::encode_as(ical_vtype::inline_text,
	       types_factory::decode_as(ical_vtype::inline_text, "a,b;c")) == "a,b;c");
	assert(to_ical(native_value{int64_t{42}}) == "42");
	assert(to_ical(native_value{true}) == "TRUE");
	assert(to_ical(native_value{ical_frequency::hour}) == "HOURLY");
	return EXIT_SUCCESS;
}

/* decode(encode(v)) == v for values in canonical form */
static int t_roundtrip()
{
	static constexpr std::pair<ical_vtype, const char *> samples[] = {
		{ical_vtype::binary, "AAECAw=="},
		{ical_vtype::boolean, "FALSE"},
		{ical_vtype::cal_address, "mailto:a@example.org"},
		{ical_vtype::date, "20240229"},
		{ical_vtype::date_time, "20230101T120000Z"},
		{ical_vtype::duration, "-P2DT3H"},
		{ical_vtype::floating, "-12.5"},
		{ical_vtype::integer, "-7"},
		{ical_vtype::period, "20230101T000000Z/PT1H"},
		{ical_vtype::recur, "FREQ=YEARLY;INTERVAL=2;BYDAY=1SU;BYMONTH=3"},
		{ical_vtype::text, "x\\, y\\; z\\\\\\n"},
		{ical_vtype::time, "235959"},
		{ical_vtype::uri, "http://example.com/"},
		{ical_vtype::utc_offset, "-0330"},
		{ical_vtype::geo, "0.5;-0.25"},
		{ical_vtype::date_time_list, "20230101T000000Z,20230102T000000Z"},
	};
	for (const auto &[t, text] : samples) {
		auto v = types_factory::decode_as(t, text);
		auto enc = types_factory::encode_as(t, v);
		if (enc != text)
			printf("%s: \"%s\" -> \"%s\"\n", types_factory::type_name(t), text, enc.c_str());
		assert(enc == text);
		assert(types_factory::decode_as(t, enc) == v);
	}
	return EXIT_SUCCESS;
}

static int t_params()
{
	auto p = params_of(native_value{ical_binary{"x"}});
	assert(p.size() == 2 && *p.get("encoding") == "BASE64" && *p.get("VALUE") == "BINARY");
	p = params_of(native_value{ical_date(2023, 1, 1)});
	assert(p.size() == 1 && *p.get("VALUE") == "DATE");
	p = params_of(native_value{ical_datetime(ical_date(2023, 1, 1), 0, 0, 0, "America/New_York")});
	assert(*p.get("VALUE") == "DATE-TIME" && *p.get("TZID") == "America/New_York");
	p = params_of(native_value{ical_datetime(ical_date(2023, 1, 1), 0, 0, 0, "UTC")});
	assert(p.size() == 1 && !p.contains("TZID"));
	p = params_of(native_value{ical_clock(8, 0, 0, "Europe/Vienna")});
	assert(*p.get("VALUE") == "TIME" && *p.get("TZID") == "Europe/Vienna");
	p = params_of(native_value{ical_text{"hello"}});
	assert(p.empty());
	p = params_of(native_value{period_from_ical("20230101T000000/PT1H", "Europe/Vienna")});
	assert(p.size() == 1 && *p.get("TZID") == "Europe/Vienna");

	/* every property owns its parameters */
	ical_property a(native_value{ical_text{"a"}}), b(native_value{ical_text{"b"}});
	a.params.set("LANGUAGE", "de");
	assert(a.params.size() == 1 && b.params.empty());
	ical_property dt(types_factory::instance().from_ical("DTSTART", "20230101T120000", "Europe/Vienna"));
	assert(*dt.params.get("TZID") == "Europe/Vienna");
	return EXIT_SUCCESS;
}

int main()
{
	mlog_init(nullptr, nullptr, LV_ERR);
	using fpt = decltype(&t_error);
	fpt fct[] = {t_error, t_scalar, t_caladdr, t_geo, t_utcoffset, t_date,
	             t_time, t_datetime, t_duration, t_ddd, t_period, t_list,
	             t_weekday, t_recur, t_registry, t_roundtrip, t_params};
	for (auto f : fct) {
		auto ret = f();
		if (ret != EXIT_SUCCESS)
			return ret;
	}
	return EXIT_SUCCESS;
}
