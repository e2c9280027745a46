// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	RECUR codec, with the weekday and frequency sub-codecs
 */
#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/core.h>
#include <libHX/ctype_helper.h>
#include <calvt/ical.hpp>
#include <calvt/icalvalue.hpp>
#include <calvt/util.hpp>

namespace calvt {

namespace {

enum class recur_kind {
	integer, ddd, weekday, frequency, text,
};

}

/* Rule parts are written in this order; FREQ must come first for some clients. */
static constexpr const char *recur_canonical_order[] = {
	"FREQ", "UNTIL", "COUNT", "INTERVAL", "BYSECOND", "BYMINUTE", "BYHOUR",
	"BYDAY", "BYMONTHDAY", "BYYEARDAY", "BYWEEKNO", "BYMONTH", "BYSETPOS",
	"WKST",
};

static recur_kind recur_part_kind(std::string_view key)
{
	static constexpr const char *integer_keys[] = {
		"COUNT", "INTERVAL", "BYSECOND", "BYMINUTE", "BYHOUR",
		"BYMONTHDAY", "BYYEARDAY", "BYMONTH", "BYSETPOS",
	};
	for (auto k : integer_keys)
		if (icase_equal(key, k))
			return recur_kind::integer;
	if (icase_equal(key, "UNTIL"))
		return recur_kind::ddd;
	if (icase_equal(key, "BYDAY") || icase_equal(key, "WKST"))
		return recur_kind::weekday;
	if (icase_equal(key, "FREQ"))
		return recur_kind::frequency;
	return recur_kind::text;
}

static bool recur_canonical(std::string_view key)
{
	return std::any_of(std::begin(recur_canonical_order),
	       std::end(recur_canonical_order),
	       [&](const char *k) { return icase_equal(key, k); });
}

ical_weekday::ical_weekday(int d, int ord) : m_dow(d), m_ordinal(ord)
{
	if (d < 0 || d > 6 || ord < -53 || ord > 53)
		throw invalid_value("WEEKDAY", fmt::format("{}/{}", ord, d),
		      "no such weekday selector");
}

std::string to_ical(const ical_weekday &v)
{
	if (v.ordinal() == 0)
		return weekday_to_str(v.dow());
	return fmt::format("{}{}", v.ordinal(), weekday_to_str(v.dow()));
}

ical_weekday weekday_from_ical(std::string_view s)
{
	int dow = 0, order = 0;
	if (!ical_parse_byday(std::string(s).c_str(), &dow, &order))
		throw invalid_value("WEEKDAY", s, "expected [[+|-]n]SU|MO|TU|WE|TH|FR|SA");
	return ical_weekday(dow, order);
}

std::string to_ical(ical_frequency f)
{
	auto s = ical_frequency_to_str(f);
	if (s == nullptr)
		throw invalid_value("FREQUENCY", "", "no such frequency");
	return s;
}

ical_frequency frequency_from_ical(std::string_view s)
{
	ical_frequency f;
	if (!ical_parse_frequency(std::string(s).c_str(), &f))
		throw invalid_value("FREQUENCY", s, "expected SECONDLY, MINUTELY, HOURLY, DAILY, WEEKLY, MONTHLY or YEARLY");
	return f;
}

static bool recur_item_fits(recur_kind kind, const recur_item &item)
{
	switch (kind) {
	case recur_kind::integer: return std::holds_alternative<int64_t>(item);
	case recur_kind::ddd: return std::holds_alternative<ddd_value>(item);
	case recur_kind::weekday: return std::holds_alternative<ical_weekday>(item);
	case recur_kind::frequency: return std::holds_alternative<ical_frequency>(item);
	case recur_kind::text: return std::holds_alternative<std::string>(item);
	}
	return false;
}

void ical_recur::set(std::string_view key, std::vector<recur_item> &&items)
{
	if (key.empty() || !std::all_of(key.begin(), key.end(),
	    [](char c) { return HX_isalnum(c) || c == '-'; }))
		throw invalid_value("RECUR", key, "invalid rule part name");
	if (items.empty())
		throw invalid_value("RECUR", key, "rule part has no values");
	auto kind = recur_part_kind(key);
	for (const auto &e : items) {
		if (!recur_item_fits(kind, e))
			throw invalid_value("RECUR", key, "value type does not match rule part");
		/* the rule grammar has no escape for its own separators */
		auto txt = std::get_if<std::string>(&e);
		if (txt != nullptr && txt->find_first_of(";,=") != txt->npos)
			throw invalid_value("RECUR", *txt, "text rule part value contains ';', ',' or '='");
	}
	m_parts.set(str_toupper(key), std::move(items));
}

static std::string recur_item_to_ical(const recur_item &item)
{
	if (auto x = std::get_if<int64_t>(&item))
		return integer_to_ical(*x);
	if (auto x = std::get_if<ddd_value>(&item))
		return to_ical(*x);
	if (auto x = std::get_if<ical_weekday>(&item))
		return to_ical(*x);
	if (auto x = std::get_if<ical_frequency>(&item))
		return to_ical(*x);
	return escape_char(std::get<std::string>(item));
}

static recur_item recur_item_from_ical(recur_kind kind, std::string_view s)
{
	switch (kind) {
	case recur_kind::integer: return integer_from_ical(s);
	case recur_kind::ddd: return ddd_from_ical(s);
	case recur_kind::weekday: return weekday_from_ical(s);
	case recur_kind::frequency: return frequency_from_ical(s);
	case recur_kind::text: return text_from_ical(s).value;
	}
	return std::string(s);
}

/*
 * Known parts in canonical order, then the rest (X-names) sorted by name.
 */
std::string to_ical(const ical_recur &v)
{
	std::string out;
	auto emit = [&](const std::string &key, const std::vector<recur_item> &vals) {
		if (!out.empty())
			out += ';';
		out += key;
		out += '=';
		for (size_t i = 0; i < vals.size(); ++i) {
			if (i > 0)
				out += ',';
			out += recur_item_to_ical(vals[i]);
		}
	};
	for (auto key : recur_canonical_order) {
		auto vals = v.get(key);
		if (vals != nullptr)
			emit(key, *vals);
	}
	std::vector<const std::pair<std::string, std::vector<recur_item>> *> extra;
	for (const auto &e : v.parts())
		if (!recur_canonical(e.first))
			extra.push_back(&e);
	std::sort(extra.begin(), extra.end(),
		[](const auto *a, const auto *b) { return a->first < b->first; });
	for (auto e : extra)
		emit(e->first, e->second);
	return out;
}

/*
 * KEY=VAL[,VAL...][;KEY=...]. A repeated key replaces the earlier one.
 */
ical_recur recur_from_ical(std::string_view s)
{
	ical_recur r;
	for (const auto &pair : gx_split(s, ';')) {
		auto eq = pair.find('=');
		if (eq == 0 || eq == pair.npos || pair.find('=', eq + 1) != pair.npos)
			throw invalid_value("RECUR", s, "malformed rule part \"" + pair + "\"");
		auto key = str_toupper(std::string_view(pair).substr(0, eq));
		auto kind = recur_part_kind(key);
		std::vector<recur_item> items;
		try {
			for (const auto &tok : gx_split(std::string_view(pair).substr(eq + 1), ','))
				items.push_back(recur_item_from_ical(kind, tok));
			r.set(key, std::move(items));
		} catch (const invalid_value &e) {
			throw invalid_value("RECUR", s, key + ": " + e.reason());
		}
	}
	return r;
}

}
