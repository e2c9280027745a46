#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <calvt/defs.h>

extern CVT_EXPORT int encode64(const void *in, size_t inlen, char *out, size_t outmax, size_t *outlen);
extern CVT_EXPORT int decode64_ex(const char *in, size_t inlen, void *out, size_t outmax, size_t *outlen);

namespace calvt {

extern CVT_EXPORT bool utf8_valid(std::string_view);
extern CVT_EXPORT void utf8_filter(std::string &);
extern CVT_EXPORT bool string_to_utf8(const char *charset, std::string_view in, std::string &out);
extern CVT_EXPORT std::string normalize_text(std::string_view, const char *charset = "UTF-8");
extern CVT_EXPORT bool parse_bool(const char *s);
extern CVT_EXPORT std::vector<std::string> gx_split(std::string_view, char sep);
extern CVT_EXPORT std::string base64_encode(const std::string_view &);
extern CVT_EXPORT bool base64_decode(const std::string_view &, std::string &out);
extern CVT_EXPORT void mlog_init(const char *ident, const char *file, unsigned int level);
extern CVT_EXPORT void mlog(unsigned int level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

}
