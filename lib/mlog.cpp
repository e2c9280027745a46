// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	Process-wide logger: stderr (coloured on a terminal), an append-only
 *	file, or syslog.
 */
#include <atomic>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <syslog.h>
#include <unistd.h>
#include <calvt/defs.h>
#include <calvt/util.hpp>

namespace calvt {

namespace {

enum class log_target {
	console, file, syslog,
};

struct log_state {
	log_target target = log_target::console;
	std::atomic<unsigned int> max_level{LV_NOTICE};
	bool color = false;
	std::string ident;
	std::unique_ptr<FILE, file_deleter> fp;
	std::mutex lock;
};

}

static log_state g_log;

/* indexed by level; LV_INFO stays uncoloured */
static constexpr const char *mlog_colors[] = {
	"", "\e[1;31m", "\e[1;31m", "\e[31m", "\e[1;37m", "", "\e[1;30m",
};

/**
 * @ident:	tag for syslog and log file lines (may be nullptr)
 * @filename:	"-", "" or nullptr for stderr, "syslog", or a path
 * @max_level:	messages above this level are dropped
 */
void mlog_init(const char *ident, const char *filename, unsigned int max_level)
{
	std::unique_lock hold(g_log.lock);
	g_log.max_level = max_level;
	g_log.ident = ident != nullptr ? ident : "";
	g_log.fp.reset();
	g_log.color = isatty(STDERR_FILENO);
	if (filename == nullptr || *filename == '\0' || strcmp(filename, "-") == 0) {
		g_log.target = log_target::console;
		setvbuf(stderr, nullptr, _IOLBF, 0);
		return;
	}
	if (strcmp(filename, "syslog") == 0) {
		g_log.target = log_target::syslog;
		openlog(g_log.ident.empty() ? nullptr : g_log.ident.c_str(), LOG_PID, LOG_USER);
		/* LV_x corresponds to LOG_(x+1) */
		setlogmask(LOG_UPTO(max_level + 1));
		return;
	}
	g_log.fp.reset(fopen(filename, "a"));
	if (g_log.fp != nullptr) {
		g_log.target = log_target::file;
		setvbuf(g_log.fp.get(), nullptr, _IOLBF, 0);
		return;
	}
	auto se = errno;
	g_log.target = log_target::console;
	hold.unlock();
	mlog(LV_ERR, "Could not open %s for writing: %s. Using stderr.",
	        filename, strerror(se));
}

void mlog(unsigned int level, const char *fmt, ...)
{
	if (level > g_log.max_level)
		return;
	char msg[4096];
	va_list args;
	va_start(args, fmt);
	vsnprintf(msg, std::size(msg), fmt, args);
	va_end(args);

	std::lock_guard hold(g_log.lock);
	switch (g_log.target) {
	case log_target::syslog:
		syslog(level + 1, "%s", msg);
		return;
	case log_target::file: {
		char stamp[32];
		auto now = time(nullptr);
		struct tm tmbuf;
		strftime(stamp, std::size(stamp), "%FT%T", localtime_r(&now, &tmbuf));
		fprintf(g_log.fp.get(), "<%u>%s %s%s%s\n", level, stamp,
		        g_log.ident.c_str(), g_log.ident.empty() ? "" : ": ", msg);
		return;
	}
	case log_target::console: {
		auto color = g_log.color && level < std::size(mlog_colors) ?
		             mlog_colors[level] : "";
		fprintf(stderr, "%s%s%s\n", color, msg, *color != '\0' ? "\e[0m" : "");
		return;
	}
	}
}

}
