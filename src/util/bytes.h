#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <string>
#include <vector>
#include <boost/utility/string_view.hpp>
#include <boost/optional.hpp>

namespace httpsig {
namespace util {
namespace bytes {

template<class B> struct is_byte_type { static const bool value = false; };
template<class S> struct is_bytestring_type { static const bool value = false; };

template<> struct is_byte_type<char> { static const bool value = true; };
template<> struct is_byte_type<signed char> { static const bool value = true; };
template<> struct is_byte_type<unsigned char> { static const bool value = true; };

template<> struct is_bytestring_type<std::string> { static const bool value = true; };
template<> struct is_bytestring_type<boost::string_view> { static const bool value = true; };
template<class B> struct is_bytestring_type<std::vector<B>> { static const bool value = is_byte_type<B>::value; };
template<std::size_t N, class B> struct is_bytestring_type<std::array<B, N>> { static const bool value = is_byte_type<B>::value; };

template<class S> std::string to_string(const S& bytestring)
{
    static_assert(is_bytestring_type<S>::value, "Not a bytestring type");
    return std::string(reinterpret_cast<const char *>(bytestring.data()), bytestring.size());
}

// The caller guarantees that `bytestring` holds exactly `N` bytes.
template<class B, std::size_t N, class S> std::array<B, N> to_array(const S& bytestring)
{
    static_assert(is_byte_type<B>::value, "Not a byte type");
    static_assert(is_bytestring_type<S>::value, "Not a bytestring type");
    assert(bytestring.size() == N);
    std::array<B, N> output;
    std::copy(
        reinterpret_cast<const B *>(bytestring.data()),
        reinterpret_cast<const B *>(bytestring.data()) + bytestring.size(),
        output.begin()
    );
    return output;
}

inline bool is_hex(boost::string_view s)
{
    static const std::string hex_chars = "0123456789abcdefABCDEF";

    for (size_t i = 0; i < s.size(); i++) {
        if (hex_chars.find(s[i]) == std::string::npos) {
            return false;
        }
    }

    return true;
}

// Lowercase hexadecimal.
template<class S> std::string to_hex(const S& bytestring)
{
    static_assert(is_bytestring_type<S>::value, "Not a bytestring type");
    static const char* digits = "0123456789abcdef";
    std::string output;
    output.reserve(bytestring.size() * 2);
    for (unsigned int i = 0; i < bytestring.size(); i++) {
        unsigned char c = bytestring.data()[i];
        output += digits[(c >> 4) & 0xf];
        output += digits[(c >> 0) & 0xf];
    }
    return output;
}

inline
boost::optional<unsigned char> from_hex(char c)
{
    if ('0' <= c && c <= '9') {
        return c - '0';
    } else if ('a' <= c && c <= 'f') {
        return 10 + c - 'a';
    } else if ('A' <= c && c <= 'F') {
        return 10 + c - 'A';
    } else return boost::none;
}

inline
boost::optional<unsigned char> from_hex(char c1, char c2)
{
    auto on1 = from_hex(c1);
    if (!on1) return boost::none;
    auto on2 = from_hex(c2);
    if (!on2) return boost::none;
    return *on1*16+*on2;
}

// Odd-length input is rejected.
inline boost::optional<std::string> from_hex(boost::string_view hex)
{
    if (hex.size() % 2 != 0) return boost::none;

    std::string output(hex.size() / 2, '\0');

    for (size_t i = 0; i < output.size(); ++i) {
        auto oc = from_hex(hex[2*i], hex[2*i + 1]);
        if (!oc) return boost::none;
        output[i] = *oc;
    }

    return output;
}

} // bytes namespace
} // util namespace
} // httpsig namespace
