// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	Codecs for the non-temporal value types: BINARY, BOOLEAN, FLOAT,
 *	INTEGER, CAL-ADDRESS, URI, TEXT, GEO, UTC-OFFSET and inline text.
 */
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <calvt/ical.hpp>
#include <calvt/icalvalue.hpp>
#include <calvt/util.hpp>

namespace calvt {

invalid_value::invalid_value(const char *type, std::string_view raw,
    const std::string &reason) :
	std::invalid_argument(fmt::format("Invalid {} value \"{}\": {}", type, raw, reason)),
	m_type(type), m_raw(raw), m_reason(reason)
{}

std::string to_ical(const ical_binary &v)
{
	return base64_encode(v.data);
}

ical_binary binary_from_ical(std::string_view s)
{
	ical_binary v;
	if (!base64_decode(s, v.data))
		throw invalid_value("BINARY", s, "not valid base64");
	return v;
}

std::string bool_to_ical(bool v)
{
	return v ? "TRUE" : "FALSE";
}

bool bool_from_ical(std::string_view s)
{
	if (icase_equal(s, "TRUE"))
		return true;
	if (icase_equal(s, "FALSE"))
		return false;
	throw invalid_value("BOOLEAN", s, "expected TRUE or FALSE");
}

std::string float_to_ical(double v)
{
	return fmt::format("{}", v);
}

double float_from_ical(std::string_view s)
{
	auto sv = s;
	if (sv.size() > 1 && sv[0] == '+' && sv[1] != '-')
		sv.remove_prefix(1);
	double v = 0;
	auto res = std::from_chars(sv.data(), sv.data() + sv.size(), v);
	if (sv.empty() || res.ec != std::errc() || res.ptr != sv.data() + sv.size())
		throw invalid_value("FLOAT", s, "not a decimal number");
	return v;
}

std::string integer_to_ical(int64_t v)
{
	return std::to_string(v);
}

int64_t integer_from_ical(std::string_view s)
{
	auto sv = s;
	if (sv.size() > 1 && sv[0] == '+' && sv[1] != '-')
		sv.remove_prefix(1);
	int64_t v = 0;
	auto res = std::from_chars(sv.data(), sv.data() + sv.size(), v);
	if (res.ec == std::errc::result_out_of_range)
		throw invalid_value("INTEGER", s, "out of range");
	if (sv.empty() || res.ec != std::errc() || res.ptr != sv.data() + sv.size())
		throw invalid_value("INTEGER", s, "not an integer");
	return v;
}

/* [^@]+@[^@]+\.[^@]+ anchored at the start only */
static bool caladdr_is_mailbox(std::string_view s)
{
	auto at = s.find('@');
	if (at == 0 || at == s.npos)
		return false;
	auto dom = s.substr(at + 1);
	dom = dom.substr(0, dom.find('@'));
	if (dom.size() < 3)
		return false;
	return dom.substr(1, dom.size() - 2).find('.') != dom.npos;
}

static std::string caladdr_mailto(std::string_view s)
{
	if (str_toupper(s).find("MAILTO:") == std::string::npos &&
	    caladdr_is_mailbox(s))
		return "mailto:" + std::string(s);
	return std::string(s);
}

cal_address::cal_address(std::string_view s) :
	value(caladdr_mailto(normalize_text(s)))
{}

cal_address cal_address::raw(std::string_view s)
{
	cal_address a;
	a.value = normalize_text(s);
	return a;
}

std::string to_ical(const cal_address &v)
{
	return caladdr_mailto(v.value);
}

cal_address caladdress_from_ical(std::string_view s)
{
	return cal_address::raw(s);
}

std::string to_ical(const ical_uri &v)
{
	return v.value;
}

ical_uri uri_from_ical(std::string_view s)
{
	return ical_uri{normalize_text(s)};
}

std::string to_ical(const ical_text &v)
{
	return escape_char(v.value);
}

ical_text text_from_ical(std::string_view s)
{
	return ical_text{unescape_char(normalize_text(s))};
}

std::string to_ical(const ical_inline &v)
{
	return v.value;
}

ical_inline inline_from_ical(std::string_view s)
{
	return ical_inline{normalize_text(s)};
}

ical_geo::ical_geo(double lat, double lon) :
	m_lat(lat), m_lon(lon)
{
	if (!std::isfinite(lat) || !std::isfinite(lon))
		throw invalid_value("GEO", float_to_ical(lat) + ";" + float_to_ical(lon),
		      "coordinates must be finite numbers");
}

std::string to_ical(const ical_geo &v)
{
	return fmt::format("{};{}", v.latitude(), v.longitude());
}

ical_geo geo_from_ical(std::string_view s)
{
	auto pos = s.find(';');
	if (pos == s.npos || s.find(';', pos + 1) != s.npos)
		throw invalid_value("GEO", s, "expected <latitude>;<longitude>");
	try {
		return ical_geo(float_from_ical(s.substr(0, pos)),
		       float_from_ical(s.substr(pos + 1)));
	} catch (const invalid_value &e) {
		throw invalid_value("GEO", s, e.reason());
	}
}

ical_utcoffset::ical_utcoffset(int32_t s) : m_seconds(s)
{
	if (s <= -86400 || s >= 86400)
		throw invalid_value("UTC-OFFSET", std::to_string(s) + "s",
		      "offset must be less than 24 hours");
}

std::string to_ical(const ical_utcoffset &v)
{
	/* "+0000" rather than "-0000" for zero */
	char sign = v.seconds() < 0 ? '-' : '+';
	unsigned int mag = std::abs(v.seconds());
	if (mag % 60 != 0)
		return fmt::format("{}{:02}{:02}{:02}", sign, mag / 3600, mag / 60 % 60, mag % 60);
	return fmt::format("{}{:02}{:02}", sign, mag / 3600, mag / 60 % 60);
}

ical_utcoffset utcoffset_from_ical(std::string_view s)
{
	int32_t secs = 0;
	if (!ical_parse_utc_offset(std::string(s).c_str(), &secs))
		throw invalid_value("UTC-OFFSET", s, "expected (+|-)HHMM[SS]");
	if (secs <= -86400 || secs >= 86400)
		throw invalid_value("UTC-OFFSET", s, "offset must be less than 24 hours");
	return ical_utcoffset(secs);
}

}
