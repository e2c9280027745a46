#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <calvt/defs.h>

enum cfg_flags {
	CFG_BOOL = 0x1U, /* stored as "1" or "0" */
	CFG_SIZE = 0x2U, /* number with optional k/M/G suffix, clamped to [min,max] */
};

/* One row of a program's defaults table; end the table with CFG_TABLE_END */
struct cfg_directive {
	const char *key = nullptr, *deflt = nullptr;
	unsigned int flags = 0;
	const char *min = nullptr, *max = nullptr;
};
#define CFG_TABLE_END {}

struct CVT_EXPORT config_file {
	const char *get_value(const char *key) const __attribute__((nonnull(2)));
	/* throws cfg_error for keys without value or default */
	unsigned long long get_ll(const char *key) const __attribute__((nonnull(2)));
	bool set_value(const char *key, const char *value) __attribute__((nonnull(2,3)));
	bool save();

	struct entry {
		std::string m_val;
		bool m_touched = false;
	};
	std::string m_filename;
	std::map<std::string, entry> m_vars; /* lowercased keys */
	std::vector<std::string> m_order;
};

struct cfg_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

extern CVT_EXPORT std::shared_ptr<config_file> config_file_init(const char *path, const cfg_directive *);
extern CVT_EXPORT std::shared_ptr<config_file> config_file_initd(const char *basename, const char *searchdirs, const cfg_directive *);
extern CVT_EXPORT std::shared_ptr<config_file> config_file_prg(const char *override_path, const char *basename, const cfg_directive *);
