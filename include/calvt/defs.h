#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#define CVT_EXPORT __attribute__((visibility("default")))

enum cvt_loglevel {
	LV_CRIT = 1,
	LV_ERR = 2,
	LV_WARN = 3,
	LV_NOTICE = 4,
	LV_INFO = 5,
	LV_DEBUG = 6,
};

namespace calvt {

struct stdlib_delete {
	inline void operator()(void *x) const { free(x); }
};
struct file_deleter {
	inline void operator()(FILE *f) const { fclose(f); }
};
using errno_t = int;

}
