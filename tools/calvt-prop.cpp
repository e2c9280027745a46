// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 * calvt-prop [-c config] [-z zone] [-v] [file...]
 * 	Decode NAME[;PARAM=VAL...]:VALUE lines (already unfolded) by their
 * 	registered value type and print the re-encoded value and the
 * 	parameters it implies.
 */
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <unistd.h>
#include <libHX/io.h>
#include <libHX/option.h>
#include <calvt/config_file.hpp>
#include <calvt/defs.h>
#include <calvt/icalvalue.hpp>
#include <calvt/util.hpp>

using namespace calvt;

static char *g_config_path, *g_zone;
static unsigned int g_verbose;
static constexpr HXoption g_options_table[] = {
	{nullptr, 'c', HXTYPE_STRING, &g_config_path, nullptr, nullptr, 0, "Config file to read", "FILE"},
	{nullptr, 'v', HXTYPE_NONE | HXOPT_INC, &g_verbose, nullptr, nullptr, 0, "More log output (may be repeated)"},
	{nullptr, 'z', HXTYPE_STRING, &g_zone, nullptr, nullptr, 0, "Time zone for values without TZID", "ZONE"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static constexpr cfg_directive calvt_prop_cfg_defaults[] = {
	{"default_timezone", ""},
	{"input_charset", "UTF-8"},
	{"log_file", "-"},
	{"log_level", "4", CFG_SIZE, "1", "6"},
	{"reencode", "true", CFG_BOOL},
	CFG_TABLE_END,
};

static std::string g_default_zone, g_charset;
static bool g_reencode = true;

namespace {

struct content_line {
	std::string name, value;
	ical_params params;
};

}

/* Strip one level of DQUOTEs from a parameter value */
static std::string unquote(std::string_view s)
{
	std::string out;
	for (auto c : s)
		if (c != '"')
			out += c;
	return out;
}

/*
 * Split at the first ':' outside of quotes; the part before it is the name
 * followed by ;-separated parameters.
 */
static bool parse_content_line(std::string_view line, content_line &cl)
{
	bool quoted = false;
	size_t colon = line.npos;
	for (size_t i = 0; i < line.size(); ++i) {
		if (line[i] == '"')
			quoted = !quoted;
		else if (line[i] == ':' && !quoted) {
			colon = i;
			break;
		}
	}
	if (colon == line.npos || colon == 0)
		return false;
	cl.value = line.substr(colon + 1);
	auto head = line.substr(0, colon);
	size_t start = 0;
	bool first = true;
	quoted = false;
	for (size_t i = 0; i <= head.size(); ++i) {
		if (i < head.size() && head[i] == '"')
			quoted = !quoted;
		if (i < head.size() && (head[i] != ';' || quoted))
			continue;
		auto tok = head.substr(start, i - start);
		start = i + 1;
		if (first) {
			cl.name = tok;
			first = false;
			continue;
		}
		auto eq = tok.find('=');
		if (eq == 0 || eq == tok.npos)
			return false;
		cl.params.set(tok.substr(0, eq), unquote(tok.substr(eq + 1)));
	}
	return !cl.name.empty();
}

static bool do_line(const char *file, size_t lineno, std::string_view raw)
{
	auto line = normalize_text(raw, g_charset.c_str());
	content_line cl;
	if (!parse_content_line(line, cl)) {
		mlog(LV_ERR, "%s:%zu: not a NAME[;PARAM=VAL]:VALUE line", file, lineno);
		return false;
	}
	auto &factory = types_factory::instance();
	auto type = factory.for_property(cl.name);
	auto vparam = cl.params.get("VALUE");
	if (vparam != nullptr) {
		auto t = types_factory::type_from_name(*vparam);
		if (t.has_value())
			type = *t;
		else
			mlog(LV_DEBUG, "%s:%zu: unknown VALUE=%s, using default type",
			        file, lineno, vparam->c_str());
	}
	auto tzid = cl.params.get("TZID");
	const char *zone = tzid != nullptr ? tzid->c_str() : g_default_zone.c_str();
	try {
		ical_property prop(types_factory::decode_as(type, cl.value, zone));
		printf("%s (%s): %s\n", cl.name.c_str(), types_factory::type_name(type),
		       g_reencode ? types_factory::encode_as(type, prop.value).c_str() :
		       cl.value.c_str());
		for (const auto &[k, v] : prop.params)
			printf("\t%s=%s\n", k.c_str(), v.c_str());
	} catch (const invalid_value &e) {
		mlog(LV_ERR, "%s:%zu: %s: %s", file, lineno, cl.name.c_str(), e.what());
		return false;
	}
	return true;
}

static errno_t do_file(const char *file, unsigned int *failures)
{
	size_t slurp_len = 0;
	std::unique_ptr<char[], stdlib_delete> slurp_data(strcmp(file, "-") == 0 ?
		HX_slurp_fd(STDIN_FILENO, &slurp_len) : HX_slurp_file(file, &slurp_len));
	if (slurp_data == nullptr) {
		mlog(LV_ERR, "Unable to read from %s: %s", file, strerror(errno));
		return errno;
	}
	std::string_view data(slurp_data.get(), slurp_len);
	size_t lineno = 0;
	while (!data.empty()) {
		auto nl = data.find('\n');
		auto line = data.substr(0, nl);
		data = nl == data.npos ? std::string_view() : data.substr(nl + 1);
		++lineno;
		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);
		if (line.empty())
			continue;
		if (!do_line(file, lineno, line))
			++*failures;
	}
	return 0;
}

int main(int argc, const char **argv) try
{
	setvbuf(stdout, nullptr, _IOLBF, 0);
	if (HX_getopt(g_options_table, &argc, &argv, HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_FAILURE;
	auto cfg = config_file_prg(g_config_path, "calvt-prop.cfg", calvt_prop_cfg_defaults);
	if (cfg == nullptr) {
		fprintf(stderr, "Something went wrong with config files\n");
		return EXIT_FAILURE;
	}
	auto level = cfg->get_ll("log_level") + g_verbose;
	mlog_init("calvt-prop", cfg->get_value("log_file"), level > LV_DEBUG ? LV_DEBUG : level);
	g_default_zone = g_zone != nullptr ? g_zone : cfg->get_value("default_timezone");
	g_charset  = cfg->get_value("input_charset");
	g_reencode = parse_bool(cfg->get_value("reencode"));

	unsigned int failures = 0;
	if (argc < 2) {
		if (do_file("-", &failures) != 0)
			return EXIT_FAILURE;
	}
	for (int i = 1; i < argc; ++i)
		if (do_file(argv[i], &failures) != 0)
			return EXIT_FAILURE;
	if (failures > 0) {
		mlog(LV_NOTICE, "%u line(s) could not be decoded", failures);
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
} catch (const std::bad_alloc &) {
	fprintf(stderr, "ENOMEM\n");
	return EXIT_FAILURE;
}
