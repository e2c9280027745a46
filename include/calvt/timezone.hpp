#pragma once
#include <ctime>
#include <calvt/defs.h>

namespace tz {
extern CVT_EXPORT bool tzvalid(const char *zone);
extern CVT_EXPORT bool mktime_z(const char *zone, const struct tm *, time_t *);
}
