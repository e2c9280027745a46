// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2024 grommunio GmbH
// This file is part of calvt.
/*
 *	this file includes some utility functions that will be used by the
 *	value codecs and the tools
 */
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iconv.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <strings.h>
#include <calvt/defs.h>
#include <calvt/util.hpp>

using namespace calvt;

#define OK	(0)
#define FAIL	(-1)
#define BUFOVER (-2)

static constexpr char basis_64[] =
	"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static constexpr int8_t index_64[128] = {
	-1,-1,-1,-1, -1,-1,-1,-1, -1,-1,-1,-1, -1,-1,-1,-1,
	-1,-1,-1,-1, -1,-1,-1,-1, -1,-1,-1,-1, -1,-1,-1,-1,
	-1,-1,-1,-1, -1,-1,-1,-1, -1,-1,-1,62, -1,-1,-1,63,
	52,53,54,55, 56,57,58,59, 60,61,-1,-1, -1,-1,-1,-1,
	-1, 0, 1, 2,  3, 4, 5, 6,  7, 8, 9,10, 11,12,13,14,
	15,16,17,18, 19,20,21,22, 23,24,25,-1, -1,-1,-1,-1,
	-1,26,27,28, 29,30,31,32, 33,34,35,36, 37,38,39,40,
	41,42,43,44, 45,46,47,48, 49,50,51,-1, -1,-1,-1,-1
};

static inline int char64(unsigned char c)
{
	return c > 127 ? -1 : index_64[c];
}

static inline bool b64_blank(unsigned char c)
{
	return c == '\r' || c == '\n' || c == ' ' || c == '\t';
}

/*
 * Encodes without line breaks.
 * On success, 0 is returned and @out is NUL-terminated (@outlen does not count NUL).
 */
int encode64(const void *vin, size_t inlen, char *out,
    size_t outmax, size_t *outlen)
{
	auto in = static_cast<const unsigned char *>(vin);
	size_t olen = (inlen + 2) / 3 * 4;
	if (outlen != nullptr)
		*outlen = olen;
	if (olen >= outmax)
		return BUFOVER;
	while (inlen > 0) {
		/* a short final group is zero-filled and padded with '=' */
		unsigned int n = inlen >= 3 ? 3 : inlen;
		uint32_t grp = in[0] << 16;
		if (n > 1)
			grp |= in[1] << 8;
		if (n > 2)
			grp |= in[2];
		out[0] = basis_64[grp >> 18];
		out[1] = basis_64[(grp >> 12) & 0x3f];
		out[2] = n > 1 ? basis_64[(grp >> 6) & 0x3f] : '=';
		out[3] = n > 2 ? basis_64[grp & 0x3f] : '=';
		out += 4;
		in += n;
		inlen -= n;
	}
	*out = '\0';
	return OK;
}

/*
 * Whitespace (CR, LF, SP, HT) between quanta is skipped. Any other character
 * outside the alphabet, a truncated final quantum, or data after padding is
 * an error.
 * @vout needs space for inlen*3/4+1 bytes.
 * On success, @vout is NUL-terminated (@outlen does not count NUL).
 */
int decode64_ex(const char *in, size_t inlen, void *vout,
    size_t outmax, size_t *outlen)
{
	auto out = static_cast<uint8_t *>(vout);
	size_t outpos = 0;
	int quad[4], qn = 0, pad = 0;

	if (in == nullptr || vout == nullptr || outlen == nullptr)
		return FAIL;
	*outlen = 0;
	if ((inlen + 3) / 4 * 3 >= outmax)
		return BUFOVER;
	for (size_t i = 0; i < inlen; ++i) {
		auto c = static_cast<unsigned char>(in[i]);
		if (b64_blank(c))
			continue;
		if (c == '=') {
			if (qn < 2)
				return FAIL;
			++pad;
			quad[qn++] = 0;
		} else {
			if (pad > 0 || char64(c) < 0)
				return FAIL;
			quad[qn++] = char64(c);
		}
		if (qn < 4)
			continue;
		out[outpos++] = (quad[0] << 2) | (quad[1] >> 4);
		if (pad < 2)
			out[outpos++] = ((quad[1] << 4) & 0xf0) | (quad[2] >> 2);
		if (pad < 1)
			out[outpos++] = ((quad[2] << 6) & 0xc0) | quad[3];
		qn = 0;
		if (pad > 0) {
			/* nothing but whitespace may follow the padding */
			for (++i; i < inlen; ++i)
				if (!b64_blank(in[i]))
					return FAIL;
			break;
		}
	}
	if (qn != 0)
		return FAIL;
	out[outpos] = '\0';
	*outlen = outpos;
	return OK;
}

namespace calvt {

static unsigned int utf8_seqlen(unsigned char ch)
{
	if (ch < 0x80)
		return 1;
	else if (ch >= 0xC2 && ch < 0xE0)
		return 2;
	else if (ch >= 0xE0 && ch < 0xF0)
		return 3;
	else if (ch >= 0xF0 && ch < 0xF5)
		return 4;
	return 0;
}

/* Length of the well-formed sequence at @p (at most @left bytes), or 0 */
static unsigned int utf8_seqcheck(const unsigned char *p, size_t left)
{
	auto n = utf8_seqlen(*p);
	if (n == 0 || n > left)
		return 0;
	for (unsigned int i = 1; i < n; ++i)
		if ((p[i] & 0xC0) != 0x80)
			return 0;
	return n;
}

/* check for invalid UTF-8 */
bool utf8_valid(std::string_view str)
{
	auto p = reinterpret_cast<const unsigned char *>(str.data());
	for (size_t left = str.size(); left > 0; ) {
		auto n = utf8_seqcheck(p, left);
		if (n == 0)
			return false;
		p += n;
		left -= n;
	}
	return true;
}

/* Replace every byte of a malformed UTF-8 sequence by '?' */
void utf8_filter(std::string &str)
{
	for (size_t i = 0; i < str.size(); ) {
		auto n = utf8_seqcheck(reinterpret_cast<const unsigned char *>(&str[i]),
		         str.size() - i);
		if (n == 0)
			str[i++] = '?';
		else
			i += n;
	}
}

bool string_to_utf8(const char *charset, std::string_view in, std::string &out)
{
	if (strcasecmp(charset, "UTF-8") == 0 || strcasecmp(charset, "UTF8") == 0 ||
	    strcasecmp(charset, "ASCII") == 0 || strcasecmp(charset, "US-ASCII") == 0) {
		out.assign(in);
		return true;
	}
	out.clear();
	if (in.empty())
		return true;
	auto conv_id = iconv_open("UTF-8", charset);
	if (conv_id == iconv_t(-1)) {
		mlog(LV_DEBUG, "iconv_open %s: %s", charset, strerror(errno));
		return false;
	}
	std::string buf;
	buf.resize(in.size() * 4 + 4);
	auto pin = const_cast<char *>(in.data());
	auto pout = buf.data();
	size_t in_len = in.size(), out_len = buf.size();
	auto ret = iconv(conv_id, &pin, &in_len, &pout, &out_len);
	iconv_close(conv_id);
	if (ret == static_cast<size_t>(-1))
		return false;
	buf.resize(buf.size() - out_len);
	out = std::move(buf);
	return true;
}

/**
 * Turn @in (encoded in @charset) into valid UTF-8. Should the conversion
 * fail, the input is taken as UTF-8 and broken sequences are replaced.
 */
std::string normalize_text(std::string_view in, const char *charset)
{
	std::string out;
	if (!string_to_utf8(charset, in, out)) {
		mlog(LV_DEBUG, "normalize_text: cannot convert from \"%s\", falling back to UTF-8",
		        charset);
		out.assign(in);
	}
	/* iconv output and ASCII-labelled input can still carry junk */
	if (!utf8_valid(out))
		utf8_filter(out);
	return out;
}

bool parse_bool(const char *s)
{
	if (s == nullptr)
		return false;
	char *end = nullptr;
	if (strtoul(s, &end, 0) == 0 && *end == '\0')
		return false;
	if (strcasecmp(s, "no") == 0 || strcasecmp(s, "off") == 0 ||
	    strcasecmp(s, "false") == 0)
		return false;
	return true;
}

std::vector<std::string> gx_split(std::string_view sv, char sep)
{
	size_t start = 0, pos;
	std::vector<std::string> out;
	while ((pos = sv.find(sep, start)) != sv.npos) {
		out.emplace_back(sv.substr(start, pos - start));
		start = pos + 1;
	}
	out.emplace_back(sv.substr(start));
	return out;
}

/* encode64/decode64_ex also write a trailing NUL; std::string has room for it */
std::string base64_encode(const std::string_view &x)
{
	std::string out((x.size() + 2) / 3 * 4, '\0');
	size_t len = 0;
	if (encode64(x.data(), x.size(), out.data(), out.size() + 1, &len) != OK)
		return {};
	out.resize(len);
	return out;
}

bool base64_decode(const std::string_view &x, std::string &out)
{
	std::string buf(x.size() / 4 * 3 + 4, '\0');
	size_t len = 0;
	if (decode64_ex(x.data(), x.size(), buf.data(), buf.size() + 1, &len) != OK) {
		out.clear();
		return false;
	}
	buf.resize(len);
	out = std::move(buf);
	return true;
}

}
