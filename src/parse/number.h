#pragma once

#include <cstdint>
#include <limits>
#include <type_traits>
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

namespace httpsig { namespace parse {

//--------------------------------------------------------------------

namespace detail {
    inline
    bool is_digit(char c) { return '0' <= c && c <= '9'; }

    inline
    uint8_t digit(char c) { return c - '0'; }

    template<size_t byte_count> struct MaxStr;
    template<> struct MaxStr<1> { boost::string_view str() { return boost::string_view("255", 3); } };
    template<> struct MaxStr<2> { boost::string_view str() { return boost::string_view("65535", 5); } };
    template<> struct MaxStr<4> { boost::string_view str() { return boost::string_view("4294967295", 10); } };
    template<> struct MaxStr<8> { boost::string_view str() { return boost::string_view("18446744073709551615", 20); } };

    template<size_t byte_count> struct Unsigned;
    template<> struct Unsigned<1> { using type = uint8_t; };
    template<> struct Unsigned<2> { using type = uint16_t; };
    template<> struct Unsigned<4> { using type = uint32_t; };
    template<> struct Unsigned<8> { using type = uint64_t; };
}

//--------------------------------------------------------------------

// Consume a decimal number from the front of `s`.
// On failure `s` is left untouched.
template<class T>
std::enable_if_t< std::is_unsigned<T>::value && std::is_integral<T>::value
                , boost::optional<T>
                >
number(boost::string_view& s)
{
    auto s_ = s;

    bool zeros_stripped = false;

    // Strip leading zeros
    while (s.starts_with('0')) {
        zeros_stripped = true;
        s.remove_prefix(1);
    }

    size_t endpos = 0;

    while (endpos < s.size() && detail::is_digit(s[endpos])) {
        ++endpos;
    }

    if (endpos == 0) {
        if (zeros_stripped) {
            return T(0);
        }
        s = s_;
        return boost::none;
    }

    auto max_str = detail::MaxStr<sizeof(T)>().str();

    // Check the parsed string will fit into T without overflow.
    if (endpos > max_str.size()) {
        s = s_;
        return boost::none;
    }

    if (endpos == max_str.size()) {
        for (size_t i = 0; i < endpos; ++i) {
            auto d_in  = detail::digit(s[i]);
            auto d_max = detail::digit(max_str[i]);

            if (d_in > d_max) {
                s = s_;
                return boost::none;
            }

            if (d_in < d_max) {
                break;
            }
        }
    }

    T r = 0;
    T m = 1;

    for (size_t i = 0; i < endpos; ++i) {
        uint8_t d = detail::digit(s[endpos-i-1]);

        r += m * d;
        m *= 10;
    }

    s.remove_prefix(endpos);
    return r;
}

template<class T>
std::enable_if_t< std::is_signed<T>::value && std::is_integral<T>::value
                , boost::optional<T>
                >
number(boost::string_view& s)
{
    using Abs = typename detail::Unsigned<sizeof(T)>::type;

    if (s.empty()) return boost::none;

    auto s_ = s;

    bool negative = false;

    if (s[0] == '+') {
        s.remove_prefix(1);
    }
    else if (s[0] == '-') {
        negative = true;
        s.remove_prefix(1);
    }

    auto abs_opt = number<Abs>(s);

    if (!abs_opt) {
        s = s_;
        return boost::none;
    }

    Abs abs = *abs_opt;

    if (abs == 0) {
        return T(0);
    }

    if (!negative) {
        if (abs > static_cast<Abs>(std::numeric_limits<T>::max())) {
            s = s_;
            return boost::none;
        }
        return static_cast<T>(abs);
    }
    else {
        // `abs` may exceed T::max() by one when negative.
        if ((abs - 1) <= static_cast<Abs>(std::numeric_limits<T>::max())) {
            return static_cast<T>(-static_cast<T>(abs - 1) - 1);
        }
        s = s_;
        return boost::none;
    }
}

// The whole of `s` must be a number.
template<class T>
boost::optional<T> whole_number(boost::string_view s)
{
    auto n = number<T>(s);
    if (!n || !s.empty()) return boost::none;
    return n;
}

//--------------------------------------------------------------------
}} // namespaces
