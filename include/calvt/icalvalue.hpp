#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <calvt/defs.h>
#include <calvt/ical.hpp>
#include <calvt/icase.hpp>

namespace calvt {

/**
 * Raised by every decoder on malformed text and by value constructors on
 * violated invariants.
 *
 * @type:	RFC 5545 type name, e.g. "DATE-TIME"
 * @raw:	offending text (may be empty when a native value was rejected)
 * @reason:	the constraint that was violated
 */
class CVT_EXPORT invalid_value : public std::invalid_argument {
	public:
	invalid_value(const char *type, std::string_view raw, const std::string &reason);
	const std::string &type() const { return m_type; }
	const std::string &raw() const { return m_raw; }
	const std::string &reason() const { return m_reason; }

	private:
	std::string m_type, m_raw, m_reason;
};

using ical_params = icase_omap<std::string>;

struct CVT_EXPORT ical_binary {
	std::string data;
	bool operator==(const ical_binary &o) const { return data == o.data; }
};

/*
 * The constructor applies the mailto: rule (see to_ical); decoding keeps
 * the text as found.
 */
struct CVT_EXPORT cal_address {
	cal_address() = default;
	explicit cal_address(std::string_view);
	static cal_address raw(std::string_view);
	std::string value;
	bool operator==(const cal_address &o) const { return value == o.value; }
};

struct CVT_EXPORT ical_uri {
	std::string value;
	bool operator==(const ical_uri &o) const { return value == o.value; }
};

struct CVT_EXPORT ical_text {
	std::string value;
	bool operator==(const ical_text &o) const { return value == o.value; }
};

/* Unparsed value, carried through verbatim */
struct CVT_EXPORT ical_inline {
	std::string value;
	bool operator==(const ical_inline &o) const { return value == o.value; }
};

class CVT_EXPORT ical_geo {
	public:
	ical_geo() = default;
	ical_geo(double lat, double lon);
	double latitude() const { return m_lat; }
	double longitude() const { return m_lon; }
	bool operator==(const ical_geo &o) const { return m_lat == o.m_lat && m_lon == o.m_lon; }

	private:
	double m_lat = 0, m_lon = 0;
};

/* Signed offset from UTC, |seconds| < 86400 */
class CVT_EXPORT ical_utcoffset {
	public:
	ical_utcoffset() = default;
	explicit ical_utcoffset(int32_t seconds);
	int32_t seconds() const { return m_seconds; }
	bool operator==(const ical_utcoffset &o) const { return m_seconds == o.m_seconds; }

	private:
	int32_t m_seconds = 0;
};

class CVT_EXPORT ical_date {
	public:
	ical_date() = default;
	ical_date(int y, int m, int d);
	int year() const { return m_year; }
	int month() const { return m_month; }
	int day() const { return m_day; }
	bool operator==(const ical_date &o) const;
	bool operator<(const ical_date &o) const;
	int64_t day_number() const;
	ical_date add_days(int64_t) const;

	private:
	int m_year = 1970, m_month = 1, m_day = 1;
};

/*
 * Zone handling of ical_clock and ical_datetime:
 * tzid empty: floating (zone-naive)
 * tzid "UTC": UTC (written with a Z suffix)
 * otherwise: an IANA zone name
 */
class CVT_EXPORT ical_clock {
	public:
	ical_clock() = default;
	ical_clock(int h, int m, int s, std::string_view tzid = {});
	int hour() const { return m_hour; }
	int minute() const { return m_minute; }
	int second() const { return m_second; }
	const std::string &tzid() const { return m_tzid; }
	bool is_utc() const { return m_tzid == "UTC"; }
	bool operator==(const ical_clock &o) const;

	private:
	int m_hour = 0, m_minute = 0, m_second = 0;
	std::string m_tzid;
};

class CVT_EXPORT ical_datetime {
	public:
	ical_datetime() = default;
	ical_datetime(const ical_date &, int h, int m, int s, std::string_view tzid = {});
	const ical_date &date() const { return m_date; }
	int hour() const { return m_hour; }
	int minute() const { return m_minute; }
	int second() const { return m_second; }
	const std::string &tzid() const { return m_tzid; }
	bool is_floating() const { return m_tzid.empty(); }
	bool is_utc() const { return m_tzid == "UTC"; }
	/* seconds since the epoch, reading a floating value as UTC */
	int64_t wall_seconds() const;
	bool to_time_t(time_t *) const;
	ical_datetime add_seconds(int64_t) const;
	bool operator==(const ical_datetime &o) const;

	private:
	ical_date m_date;
	int m_hour = 0, m_minute = 0, m_second = 0;
	std::string m_tzid;
};

struct CVT_EXPORT ical_duration {
	constexpr ical_duration() = default;
	constexpr explicit ical_duration(int64_t s) : total(s) {}
	int64_t total = 0;
	bool negative() const { return total < 0; }
	/* components of the magnitude */
	uint64_t days() const;
	unsigned int hours() const;
	unsigned int minutes() const;
	unsigned int seconds() const;
	bool operator==(const ical_duration &o) const { return total == o.total; }
};

class CVT_EXPORT ical_weekday {
	public:
	ical_weekday() = default;
	ical_weekday(int dow, int ordinal = 0);
	int dow() const { return m_dow; }
	int ordinal() const { return m_ordinal; } /* 0: every such weekday */
	bool operator==(const ical_weekday &o) const { return m_dow == o.m_dow && m_ordinal == o.m_ordinal; }

	private:
	int m_dow = 1, m_ordinal = 0;
};

using ddd_value = std::variant<ical_date, ical_clock, ical_datetime, ical_duration>;

/* Non-empty sequence of temporal values that all hold the same alternative */
class CVT_EXPORT ical_ddd_list {
	public:
	explicit ical_ddd_list(std::vector<ddd_value> &&);
	const std::vector<ddd_value> &items() const { return m_items; }
	bool operator==(const ical_ddd_list &o) const { return m_items == o.m_items; }

	private:
	std::vector<ddd_value> m_items;
};

/*
 * Start is a date or date-time; the second component is a value of the
 * same kind or a duration. Start may not be after end.
 */
class CVT_EXPORT ical_period {
	public:
	ical_period(const ddd_value &start, const ddd_value &end_or_duration);
	const ddd_value &start() const { return m_start; }
	const ddd_value &end() const { return m_end; }
	const ical_duration &duration() const { return m_duration; }
	bool by_duration() const { return m_by_duration; }
	bool overlaps(const ical_period &) const;
	bool operator==(const ical_period &o) const { return m_start == o.m_start && m_end == o.m_end; }

	private:
	ddd_value m_start, m_end;
	ical_duration m_duration;
	bool m_by_duration = false;
};

using recur_item = std::variant<int64_t, ddd_value, ical_weekday, ical_frequency, std::string>;

/*
 * Rule parts keyed by their uppercased name. Each part holds a non-empty
 * list whose element type is fixed by the name: int64_t for COUNT, INTERVAL
 * and the numeric BY* parts, ddd_value for UNTIL, ical_weekday for BYDAY and
 * WKST, ical_frequency for FREQ, std::string for anything else.
 */
class CVT_EXPORT ical_recur {
	public:
	void set(std::string_view key, std::vector<recur_item> &&);
	const std::vector<recur_item> *get(std::string_view key) const { return m_parts.get(key); }
	const icase_omap<std::vector<recur_item>> &parts() const { return m_parts; }
	bool operator==(const ical_recur &o) const { return m_parts == o.m_parts; }

	private:
	icase_omap<std::vector<recur_item>> m_parts;
};

using native_value = std::variant<ical_binary, bool, double, int64_t,
      cal_address, ical_uri, ical_text, ical_geo, ical_utcoffset, ical_date,
      ical_clock, ical_datetime, ical_duration, ical_period, ical_ddd_list,
      ical_recur, ical_weekday, ical_frequency, ical_inline>;

/* A decoded value together with the parameters it implies */
struct CVT_EXPORT ical_property {
	ical_property(native_value);
	native_value value;
	ical_params params;
};

/* Encoders */
extern CVT_EXPORT std::string to_ical(const ical_binary &);
extern CVT_EXPORT std::string bool_to_ical(bool);
extern CVT_EXPORT std::string float_to_ical(double);
extern CVT_EXPORT std::string integer_to_ical(int64_t);
extern CVT_EXPORT std::string to_ical(const cal_address &);
extern CVT_EXPORT std::string to_ical(const ical_uri &);
extern CVT_EXPORT std::string to_ical(const ical_text &);
extern CVT_EXPORT std::string to_ical(const ical_inline &);
extern CVT_EXPORT std::string to_ical(const ical_geo &);
extern CVT_EXPORT std::string to_ical(const ical_utcoffset &);
extern CVT_EXPORT std::string to_ical(const ical_date &);
extern CVT_EXPORT std::string to_ical(const ical_clock &);
extern CVT_EXPORT std::string to_ical(const ical_datetime &);
extern CVT_EXPORT std::string to_ical(const ical_duration &);
extern CVT_EXPORT std::string to_ical(const ddd_value &);
extern CVT_EXPORT std::string to_ical(const ical_period &);
extern CVT_EXPORT std::string to_ical(const ical_ddd_list &);
extern CVT_EXPORT std::string to_ical(const ical_weekday &);
extern CVT_EXPORT std::string to_ical(ical_frequency);
extern CVT_EXPORT std::string to_ical(const ical_recur &);
extern CVT_EXPORT std::string to_ical(const native_value &);

/*
 * Decoders. @tzid is the caller's TZID hint (nullptr or "" for none);
 * an unknown zone name is ignored.
 */
extern CVT_EXPORT ical_binary binary_from_ical(std::string_view);
extern CVT_EXPORT bool bool_from_ical(std::string_view);
extern CVT_EXPORT double float_from_ical(std::string_view);
extern CVT_EXPORT int64_t integer_from_ical(std::string_view);
extern CVT_EXPORT cal_address caladdress_from_ical(std::string_view);
extern CVT_EXPORT ical_uri uri_from_ical(std::string_view);
extern CVT_EXPORT ical_text text_from_ical(std::string_view);
extern CVT_EXPORT ical_inline inline_from_ical(std::string_view);
extern CVT_EXPORT ical_geo geo_from_ical(std::string_view);
extern CVT_EXPORT ical_utcoffset utcoffset_from_ical(std::string_view);
extern CVT_EXPORT ical_date date_from_ical(std::string_view);
extern CVT_EXPORT ical_clock time_from_ical(std::string_view, const char *tzid = nullptr);
extern CVT_EXPORT ical_datetime datetime_from_ical(std::string_view, const char *tzid = nullptr);
extern CVT_EXPORT ical_duration duration_from_ical(std::string_view);
extern CVT_EXPORT ddd_value ddd_from_ical(std::string_view, const char *tzid = nullptr);
extern CVT_EXPORT ical_period period_from_ical(std::string_view, const char *tzid = nullptr);
extern CVT_EXPORT ical_ddd_list ddd_list_from_ical(std::string_view, const char *tzid = nullptr);
extern CVT_EXPORT ical_weekday weekday_from_ical(std::string_view);
extern CVT_EXPORT ical_frequency frequency_from_ical(std::string_view);
extern CVT_EXPORT ical_recur recur_from_ical(std::string_view);

/* Temporal dispatch for generic values; throws if @v is not temporal */
extern CVT_EXPORT ddd_value to_ddd(const native_value &v);
extern CVT_EXPORT std::optional<std::string> timezone_identifier_of(const ddd_value &);
extern CVT_EXPORT ical_params params_of(const native_value &);

enum class ical_vtype {
	binary, boolean, cal_address, date, date_time, duration, floating,
	integer, period, recur, text, time, uri, utc_offset, geo, inline_text,
	date_time_list,
};

/**
 * Maps property and parameter names to their default value type and
 * encodes/decodes by name. The tables are built once and never change.
 */
class CVT_EXPORT types_factory {
	public:
	static const types_factory &instance();
	ical_vtype for_property(std::string_view name) const;
	std::string to_ical(std::string_view name, const native_value &) const;
	native_value from_ical(std::string_view name, std::string_view text, const char *tzid = nullptr) const;

	static const char *type_name(ical_vtype);
	static std::optional<ical_vtype> type_from_name(std::string_view);
	static std::string encode_as(ical_vtype, const native_value &);
	static native_value decode_as(ical_vtype, std::string_view text, const char *tzid = nullptr);

	private:
	types_factory();
	icase_omap<ical_vtype> m_types;
};

}
