#pragma once
#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <strings.h>
#include <libHX/ctype_helper.h>
#include <calvt/defs.h>

namespace calvt {

struct CVT_EXPORT icasehash {
	inline size_t operator()(std::string s) const {
		std::transform(s.begin(), s.end(), s.begin(), HX_toupper);
		return std::hash<std::string>{}(std::move(s));
	}
};

struct CVT_EXPORT icasecmp {
	inline bool operator()(const std::string &a, const std::string &b) const {
		return strcasecmp(a.c_str(), b.c_str()) == 0;
	}
};

static inline bool icase_equal(std::string_view a, std::string_view b)
{
	return a.size() == b.size() && strncasecmp(a.data(), b.data(), a.size()) == 0;
}

static inline std::string str_toupper(std::string_view s)
{
	std::string r(s);
	std::transform(r.begin(), r.end(), r.begin(), HX_toupper);
	return r;
}

/**
 * Map with ASCII-case-insensitive keys that remembers insertion order.
 * Keys are stored the way they were first set; a later set() with a
 * differently-cased spelling replaces the value, not the position.
 * Equality ignores the order.
 */
template<typename T> class icase_omap {
	public:
	using value_type = std::pair<std::string, T>;
	using const_iterator = typename std::vector<value_type>::const_iterator;

	icase_omap() = default;
	icase_omap(std::initializer_list<value_type> l)
	{
		for (auto &&e : l)
			set(e.first, e.second);
	}

	const T *get(std::string_view key) const
	{
		auto i = m_index.find(std::string(key));
		return i != m_index.end() ? &m_items[i->second].second : nullptr;
	}
	bool contains(std::string_view key) const { return m_index.find(std::string(key)) != m_index.end(); }
	T &set(std::string_view key, T value)
	{
		auto i = m_index.find(std::string(key));
		if (i != m_index.end()) {
			m_items[i->second].second = std::move(value);
			return m_items[i->second].second;
		}
		m_index.emplace(std::string(key), m_items.size());
		m_items.emplace_back(std::string(key), std::move(value));
		return m_items.back().second;
	}
	bool erase(std::string_view key)
	{
		auto i = m_index.find(std::string(key));
		if (i == m_index.end())
			return false;
		auto pos = i->second;
		m_index.erase(i);
		m_items.erase(m_items.begin() + pos);
		for (auto &e : m_index)
			if (e.second > pos)
				--e.second;
		return true;
	}
	inline size_t size() const { return m_items.size(); }
	inline bool empty() const { return m_items.empty(); }
	inline const_iterator begin() const { return m_items.cbegin(); }
	inline const_iterator end() const { return m_items.cend(); }

	bool operator==(const icase_omap &o) const
	{
		if (size() != o.size())
			return false;
		for (const auto &[k, v] : m_items) {
			auto ov = o.get(k);
			if (ov == nullptr || !(*ov == v))
				return false;
		}
		return true;
	}
	bool operator!=(const icase_omap &o) const { return !operator==(o); }

	private:
	std::vector<value_type> m_items;
	std::unordered_map<std::string, size_t, icasehash, icasecmp> m_index;
};

}
