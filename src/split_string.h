#pragma once

#include <utility>

#include <boost/utility/string_view.hpp>
#include "namespaces.h"

namespace httpsig {

/*
 * Iterate over the separator-delimited items of a string_view,
 * with surrounding whitespace trimmed from each item.
 *
 * for (string_view v : SplitString("a=1; b ;;c", ';')) {
 *     cout << "\"" << v << "\"" << endl;
 * }
 *
 * // Output:
 * // "a=1"
 * // "b"
 * // ""
 * // "c"
 */
class SplitString {
    using string_view = boost::string_view;

public:
    using value_type = string_view;

    struct const_iterator {
        string_view body;
        string_view rest;
        char separator;

        string_view operator*() const;
        const_iterator& operator++(); // prefix
        bool operator==(const_iterator) const;
        bool operator!=(const_iterator) const;
    };

    SplitString(string_view body, char separator)
        : _body(body)
        , _separator(separator)
    {}

    const_iterator begin() const;
    const_iterator end() const;

private:
    static const_iterator split_first(string_view, char);

private:
    string_view _body;
    char _separator;
};

inline bool is_whitespace(char c) {
    return c == ' ' || c == '\t';
}

inline void trim_whitespace(boost::string_view& v) {
    while (!v.empty() && is_whitespace(v.front())) v.remove_prefix(1);
    while (!v.empty() && is_whitespace(v.back()))  v.remove_suffix(1);
}

// Strip one pair of surrounding double quotes.
// Returns false (leaving `v` untouched) if `v` is not quoted.
inline bool unquote(boost::string_view& v) {
    if (v.size() < 2 || v.front() != '"' || v.back() != '"') return false;
    v.remove_prefix(1);
    v.remove_suffix(1);
    return true;
}

inline
SplitString::const_iterator SplitString::begin() const
{
    return split_first(_body, _separator);
}

inline
SplitString::const_iterator SplitString::end() const
{
    return const_iterator{ string_view(nullptr, 0)
                         , string_view(nullptr, 0)
                         , _separator};
}

inline
boost::string_view SplitString::const_iterator::operator*() const
{
    return body;
}

inline
SplitString::const_iterator& SplitString::const_iterator::operator++() // prefix
{
    auto i = split_first(rest, separator);
    *this = i;
    return *this;
}

inline
SplitString::const_iterator SplitString::split_first(string_view v, char separator)
{
    if (!v.data()) {
        return const_iterator{ string_view(nullptr, 0)
                             , string_view(nullptr, 0)
                             , separator};
    }

    auto pos = v.find(separator);

    if (pos == string_view::npos) {
        trim_whitespace(v);
        return const_iterator{v, string_view(nullptr, 0), separator};
    }

    auto body = v.substr(0, pos);
    auto rest = v.substr(pos + 1);

    trim_whitespace(body);

    return const_iterator{body, rest, separator};
}

inline
bool SplitString::const_iterator::operator==(const_iterator other) const
{
    // string_view("") is not the same as string_view(nullptr, 0) here,
    // the latter marks the end of the iteration.
    static const auto same = [](string_view v1, string_view v2) {
        return (v1.data() && v2.data())
             ? v1 == v2
             : v1.data() == v2.data();
    };

    return same(body, other.body) && same(rest, other.rest);
}

inline
bool SplitString::const_iterator::operator!=(const_iterator other) const
{
    return !(*this == other);
}

// Split at the first `at`, trimming both halves.
// The second half is empty if `at` does not occur.
inline
std::pair<boost::string_view, boost::string_view>
split_string_pair(boost::string_view v, char at) {
    using boost::string_view;

    auto at_pos = v.find(at);

    if (at_pos == string_view::npos) {
        trim_whitespace(v);
        return std::make_pair(v, string_view("", 0));
    }

    auto key = v.substr(0, at_pos);
    auto val = v.substr(at_pos + 1);

    trim_whitespace(key);
    trim_whitespace(val);

    return std::make_pair(key, val);
}

} // httpsig namespace
