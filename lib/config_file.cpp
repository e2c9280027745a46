// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	"key = value" configuration files. Blank lines and lines starting with
 *	'#' are skipped; keys are case-insensitive.
 */
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <memory>
#include <new>
#include <string>
#include <libHX/ctype_helper.h>
#include <libHX/string.h>
#include <calvt/config_file.hpp>
#include <calvt/defs.h>
#include <calvt/util.hpp>
#ifndef PKGSYSCONFDIR
#	define PKGSYSCONFDIR "/etc/calvt"
#endif

using namespace calvt;

static bool cfg_key_valid(const char *key)
{
	if (*key == '\0')
		return false;
	for (; *key != '\0'; ++key)
		if (!HX_isalnum(*key) && *key != '-' && *key != '_')
			return false;
	return true;
}

static std::string cfg_key_fold(const char *key)
{
	std::string k = key;
	HX_strlower(k.data());
	return k;
}

static unsigned long long cfg_size(const char *s)
{
	return HX_strtoull_unit(s, nullptr, 1024);
}

/* Bring one directive's value into canonical form, or fill in its default */
static void cfg_apply_directive(config_file &cfg, const cfg_directive &d)
{
	auto cur = cfg.get_value(d.key);
	std::string v = cur != nullptr ? cur : d.deflt != nullptr ? d.deflt : "";
	if (cur == nullptr && d.deflt == nullptr)
		return;
	if (d.flags & CFG_BOOL) {
		v = parse_bool(v.c_str()) ? "1" : "0";
	} else if (d.flags & CFG_SIZE) {
		auto n = cfg_size(v.c_str());
		if (d.min != nullptr && n < cfg_size(d.min))
			n = cfg_size(d.min);
		if (d.max != nullptr && n > cfg_size(d.max))
			n = cfg_size(d.max);
		v = std::to_string(n);
	}
	if (!cfg.set_value(d.key, v.c_str()))
		mlog(LV_WARN, "config: cannot set \"%s\" to \"%s\"", d.key, v.c_str());
}

static void cfg_apply_table(config_file &cfg, const cfg_directive *table)
{
	for (; table != nullptr && table->key != nullptr; ++table)
		cfg_apply_directive(cfg, *table);
	/* what the table filled in is not a change to save */
	for (auto &e : cfg.m_vars)
		e.second.m_touched = false;
}

/* "key = value"; anything without '=' or with an empty key is ignored */
static void cfg_read_line(config_file &cfg, char *line)
{
	line[strcspn(line, "\r\n")] = '\0';
	HX_strltrim(line);
	if (*line == '\0' || *line == '#')
		return;
	auto eq = strchr(line, '=');
	if (eq == nullptr)
		return;
	*eq = '\0';
	auto value = eq + 1;
	HX_strrtrim(line);
	HX_strltrim(value);
	HX_strrtrim(value);
	if (*line != '\0' && !cfg.set_value(line, value))
		mlog(LV_DEBUG, "config %s: skipping key \"%s\"", cfg.m_filename.c_str(), line);
}

/**
 * Parse @filename and apply the @key_desc defaults.
 * Returns nullptr with errno set if the file cannot be read.
 */
std::shared_ptr<config_file> config_file_init(const char *filename,
    const cfg_directive *key_desc) try
{
	std::unique_ptr<FILE, file_deleter> fp(fopen(filename, "r"));
	if (fp == nullptr)
		return nullptr;
	auto cfg = std::make_shared<config_file>();
	cfg->m_filename = filename;
	char line[1024];
	while (fgets(line, std::size(line), fp.get()) != nullptr)
		cfg_read_line(*cfg, line);
	cfg_apply_table(*cfg, key_desc);
	return cfg;
} catch (const std::bad_alloc &) {
	errno = ENOMEM;
	return nullptr;
}

/**
 * Look for @fb in each directory of the colon-separated @sdlist and use the
 * first one found. Without any, the result holds only the defaults. A file
 * that exists but cannot be read is an error.
 */
std::shared_ptr<config_file> config_file_initd(const char *fb,
    const char *sdlist, const cfg_directive *key_desc) try
{
	if (sdlist == nullptr || strchr(fb, '/') != nullptr)
		return config_file_init(fb, key_desc);
	for (const auto &dir : gx_split(sdlist, ':')) {
		if (dir.empty())
			continue;
		auto path = dir + "/" + fb;
		errno = 0;
		auto cfg = config_file_init(path.c_str(), key_desc);
		if (cfg != nullptr)
			return cfg;
		if (errno == ENOENT)
			continue;
		mlog(LV_ERR, "config: %s: %s", path.c_str(), strerror(errno));
		return nullptr;
	}
	auto cfg = std::make_shared<config_file>();
	cfg->m_filename = fb;
	cfg_apply_table(*cfg, key_desc);
	return cfg;
} catch (const std::bad_alloc &) {
	errno = ENOMEM;
	return nullptr;
}

/**
 * For programs: an explicitly given file (@ov) must exist; otherwise @fb is
 * looked up in $CALVT_CONFIG_PATH or the installed sysconf directory.
 */
std::shared_ptr<config_file> config_file_prg(const char *ov, const char *fb,
    const cfg_directive *key_desc)
{
	if (ov != nullptr) {
		auto cfg = config_file_init(ov, key_desc);
		if (cfg == nullptr)
			mlog(LV_ERR, "config: %s: %s", ov, strerror(errno));
		return cfg;
	}
	auto env = getenv("CALVT_CONFIG_PATH");
	return config_file_initd(fb, env != nullptr ? env : PKGSYSCONFDIR, key_desc);
}

const char *config_file::get_value(const char *key) const
{
	if (!cfg_key_valid(key))
		return nullptr;
	auto i = m_vars.find(cfg_key_fold(key));
	return i != m_vars.end() ? i->second.m_val.c_str() : nullptr;
}

unsigned long long config_file::get_ll(const char *key) const
{
	auto v = get_value(key);
	if (v == nullptr) {
		mlog(LV_ERR, "config: key \"%s\" is neither set nor has a default", key);
		throw cfg_error(std::string("config key \"") + key + "\" unset");
	}
	return strtoull(v, nullptr, 0);
}

/* '#' would start a comment when read back, so it is refused */
bool config_file::set_value(const char *key, const char *value)
{
	if (!cfg_key_valid(key) || strchr(value, '#') != nullptr)
		return false;
	auto k = cfg_key_fold(key);
	auto [it, added] = m_vars.try_emplace(k);
	if (added)
		m_order.push_back(std::move(k));
	else if (it->second.m_val == value)
		return true;
	it->second.m_val = value;
	it->second.m_touched = true;
	return true;
}

/* Rewrite the file, in the order keys were first seen, if anything changed */
bool config_file::save()
{
	if (std::none_of(m_vars.cbegin(), m_vars.cend(),
	    [](const auto &e) { return e.second.m_touched; }))
		return true;
	std::unique_ptr<FILE, file_deleter> fp(fopen(m_filename.c_str(), "w"));
	if (fp == nullptr) {
		mlog(LV_ERR, "config: cannot write %s: %s", m_filename.c_str(), strerror(errno));
		return false;
	}
	for (const auto &k : m_order)
		fprintf(fp.get(), "%s = %s\n", k.c_str(), m_vars.at(k).m_val.c_str());
	for (auto &e : m_vars)
		e.second.m_touched = false;
	return true;
}
