// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	Generic values: encoding by variant, implied parameters and the
 *	name-to-type registry
 */
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <calvt/icalvalue.hpp>
#include <calvt/util.hpp>

namespace calvt {

std::string to_ical(const native_value &v)
{
	return std::visit([](const auto &x) -> std::string {
		using T = std::decay_t<decltype(x)>;
		if constexpr (std::is_same_v<T, bool>)
			return bool_to_ical(x);
		else if constexpr (std::is_same_v<T, double>)
			return float_to_ical(x);
		else if constexpr (std::is_same_v<T, int64_t>)
			return integer_to_ical(x);
		else
			return to_ical(x);
	}, v);
}

ical_params params_of(const native_value &v)
{
	ical_params p;
	if (std::holds_alternative<ical_binary>(v)) {
		p.set("ENCODING", "BASE64");
		p.set("VALUE", "BINARY");
	} else if (std::holds_alternative<ical_date>(v)) {
		p.set("VALUE", "DATE");
	} else if (auto dt = std::get_if<ical_datetime>(&v)) {
		p.set("VALUE", "DATE-TIME");
		auto z = timezone_identifier_of(*dt);
		if (z.has_value())
			p.set("TZID", *z);
	} else if (auto c = std::get_if<ical_clock>(&v)) {
		p.set("VALUE", "TIME");
		auto z = timezone_identifier_of(*c);
		if (z.has_value())
			p.set("TZID", *z);
	} else if (auto per = std::get_if<ical_period>(&v)) {
		auto z = timezone_identifier_of(per->start());
		if (z.has_value())
			p.set("TZID", *z);
	} else if (auto l = std::get_if<ical_ddd_list>(&v)) {
		/* elements are expected to share one zone; the last one wins */
		for (const auto &e : l->items()) {
			auto z = timezone_identifier_of(e);
			if (z.has_value())
				p.set("TZID", *z);
		}
	}
	return p;
}

ical_property::ical_property(native_value v) :
	value(std::move(v)), params(params_of(value))
{}

static constexpr std::pair<ical_vtype, const char *> vtype_names[] = {
	{ical_vtype::binary, "binary"},
	{ical_vtype::boolean, "boolean"},
	{ical_vtype::cal_address, "cal-address"},
	{ical_vtype::date, "date"},
	{ical_vtype::date_time, "date-time"},
	{ical_vtype::duration, "duration"},
	{ical_vtype::floating, "float"},
	{ical_vtype::integer, "integer"},
	{ical_vtype::period, "period"},
	{ical_vtype::recur, "recur"},
	{ical_vtype::text, "text"},
	{ical_vtype::time, "time"},
	{ical_vtype::uri, "uri"},
	{ical_vtype::utc_offset, "utc-offset"},
	{ical_vtype::geo, "geo"},
	{ical_vtype::inline_text, "inline"},
	{ical_vtype::date_time_list, "date-time-list"},
};

/* Default value type of properties and parameters */
static constexpr std::pair<const char *, ical_vtype> property_types[] = {
	/* calendar properties */
	{"calscale", ical_vtype::text},
	{"method", ical_vtype::text},
	{"prodid", ical_vtype::text},
	{"version", ical_vtype::text},
	/* descriptive component properties */
	{"attach", ical_vtype::uri},
	{"categories", ical_vtype::text},
	{"class", ical_vtype::text},
	{"comment", ical_vtype::text},
	{"description", ical_vtype::text},
	{"geo", ical_vtype::geo},
	{"location", ical_vtype::text},
	{"percent-complete", ical_vtype::integer},
	{"priority", ical_vtype::integer},
	{"resources", ical_vtype::text},
	{"status", ical_vtype::text},
	{"summary", ical_vtype::text},
	/* date and time component properties */
	{"completed", ical_vtype::date_time},
	{"dtend", ical_vtype::date_time},
	{"due", ical_vtype::date_time},
	{"dtstart", ical_vtype::date_time},
	{"duration", ical_vtype::duration},
	{"freebusy", ical_vtype::period},
	{"transp", ical_vtype::text},
	/* time zone component properties */
	{"tzid", ical_vtype::text},
	{"tzname", ical_vtype::text},
	{"tzoffsetfrom", ical_vtype::utc_offset},
	{"tzoffsetto", ical_vtype::utc_offset},
	{"tzurl", ical_vtype::uri},
	/* relationship component properties */
	{"attendee", ical_vtype::cal_address},
	{"contact", ical_vtype::text},
	{"organizer", ical_vtype::cal_address},
	{"recurrence-id", ical_vtype::date_time},
	{"related-to", ical_vtype::text},
	{"url", ical_vtype::uri},
	{"uid", ical_vtype::text},
	/* recurrence component properties */
	{"exdate", ical_vtype::date_time_list},
	{"exrule", ical_vtype::recur},
	{"rdate", ical_vtype::date_time_list},
	{"rrule", ical_vtype::recur},
	/* alarm component properties */
	{"action", ical_vtype::text},
	{"repeat", ical_vtype::integer},
	{"trigger", ical_vtype::duration},
	/* change management component properties */
	{"created", ical_vtype::date_time},
	{"dtstamp", ical_vtype::date_time},
	{"last-modified", ical_vtype::date_time},
	{"sequence", ical_vtype::integer},
	{"request-status", ical_vtype::text},
	/* parameters (no name clashes with properties) */
	{"altrep", ical_vtype::uri},
	{"cn", ical_vtype::text},
	{"cutype", ical_vtype::text},
	{"delegated-from", ical_vtype::cal_address},
	{"delegated-to", ical_vtype::cal_address},
	{"dir", ical_vtype::uri},
	{"encoding", ical_vtype::text},
	{"fmttype", ical_vtype::text},
	{"fbtype", ical_vtype::text},
	{"language", ical_vtype::text},
	{"member", ical_vtype::cal_address},
	{"partstat", ical_vtype::text},
	{"range", ical_vtype::text},
	{"related", ical_vtype::text},
	{"reltype", ical_vtype::text},
	{"role", ical_vtype::text},
	{"rsvp", ical_vtype::boolean},
	{"sent-by", ical_vtype::cal_address},
	{"value", ical_vtype::text},
};

types_factory::types_factory()
{
	for (const auto &[name, type] : property_types)
		m_types.set(name, type);
}

const types_factory &types_factory::instance()
{
	static const types_factory factory;
	return factory;
}

ical_vtype types_factory::for_property(std::string_view name) const
{
	auto t = m_types.get(name);
	return t != nullptr ? *t : ical_vtype::text;
}

const char *types_factory::type_name(ical_vtype t)
{
	for (const auto &[type, name] : vtype_names)
		if (type == t)
			return name;
	return "text";
}

std::optional<ical_vtype> types_factory::type_from_name(std::string_view s)
{
	for (const auto &[type, name] : vtype_names)
		if (icase_equal(s, name))
			return type;
	return std::nullopt;
}

template<typename T> static const T &vtype_expect(ical_vtype t, const native_value &v)
{
	auto p = std::get_if<T>(&v);
	if (p == nullptr)
		throw invalid_value(str_toupper(types_factory::type_name(t)).c_str(),
		      "", "native value does not belong to this type");
	return *p;
}

std::string types_factory::encode_as(ical_vtype t, const native_value &v)
{
	switch (t) {
	case ical_vtype::binary: return calvt::to_ical(vtype_expect<ical_binary>(t, v));
	case ical_vtype::boolean: return bool_to_ical(vtype_expect<bool>(t, v));
	case ical_vtype::cal_address: return calvt::to_ical(vtype_expect<cal_address>(t, v));
	case ical_vtype::date:
	case ical_vtype::date_time:
	case ical_vtype::duration:
	case ical_vtype::time:
		return calvt::to_ical(to_ddd(v));
	case ical_vtype::floating: return float_to_ical(vtype_expect<double>(t, v));
	case ical_vtype::integer: return integer_to_ical(vtype_expect<int64_t>(t, v));
	case ical_vtype::period: return calvt::to_ical(vtype_expect<ical_period>(t, v));
	case ical_vtype::recur: return calvt::to_ical(vtype_expect<ical_recur>(t, v));
	case ical_vtype::text: return calvt::to_ical(vtype_expect<ical_text>(t, v));
	case ical_vtype::uri: return calvt::to_ical(vtype_expect<ical_uri>(t, v));
	case ical_vtype::utc_offset: return calvt::to_ical(vtype_expect<ical_utcoffset>(t, v));
	case ical_vtype::geo: return calvt::to_ical(vtype_expect<ical_geo>(t, v));
	case ical_vtype::inline_text: return calvt::to_ical(vtype_expect<ical_inline>(t, v));
	case ical_vtype::date_time_list: return calvt::to_ical(vtype_expect<ical_ddd_list>(t, v));
	}
	throw invalid_value("TEXT", "", "unknown value type");
}

native_value types_factory::decode_as(ical_vtype t, std::string_view s,
    const char *tzid)
{
	switch (t) {
	case ical_vtype::binary: return binary_from_ical(s);
	case ical_vtype::boolean: return bool_from_ical(s);
	case ical_vtype::cal_address: return caladdress_from_ical(s);
	case ical_vtype::date:
	case ical_vtype::date_time:
	case ical_vtype::duration:
	case ical_vtype::time:
		return std::visit([](auto &&x) -> native_value { return x; },
		       ddd_from_ical(s, tzid));
	case ical_vtype::floating: return float_from_ical(s);
	case ical_vtype::integer: return integer_from_ical(s);
	case ical_vtype::period: return period_from_ical(s, tzid);
	case ical_vtype::recur: return recur_from_ical(s);
	case ical_vtype::text: return text_from_ical(s);
	case ical_vtype::uri: return uri_from_ical(s);
	case ical_vtype::utc_offset: return utcoffset_from_ical(s);
	case ical_vtype::geo: return geo_from_ical(s);
	case ical_vtype::inline_text: return inline_from_ical(s);
	case ical_vtype::date_time_list: return ddd_list_from_ical(s, tzid);
	}
	throw invalid_value("TEXT", s, "unknown value type");
}

std::string types_factory::to_ical(std::string_view name, const native_value &v) const
{
	return encode_as(for_property(name), v);
}

native_value types_factory::from_ical(std::string_view name,
    std::string_view text, const char *tzid) const
{
	return decode_as(for_property(name), text, tzid);
}

}
