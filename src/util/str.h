#pragma once

#include <sstream>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

namespace httpsig { namespace util {

// Overloads for types whose `operator<<` does not print
// what a log line needs.

inline
void arg_to_stream(std::ostream& s, boost::system::error_code ec) {
    s << '"' << ec.message() << '"';
}

inline
void arg_to_stream(std::ostream& s, const std::vector<std::string>& v) {
    s << '[';
    bool first = true;
    for (const auto& e : v) {
        if (!first) s << ", ";
        s << e;
        first = false;
    }
    s << ']';
}

template<class T>
inline
void arg_to_stream(std::ostream& s, const boost::optional<T>& o) {
    if (o) s << *o;
    else   s << "none";
}

template<class Arg>
inline
void arg_to_stream(std::ostream& s, const Arg& arg) {
    s << arg;
}

inline
void args_to_stream(std::ostream&) { }

template<class Arg, class... Args>
inline
void args_to_stream(std::ostream& s, Arg&& arg, Args&&... args) {
    const auto& a = arg;
    arg_to_stream(s, a);
    args_to_stream(s, std::forward<Args>(args)...);
}

template<class... Args>
inline
std::string str(Args&&... args) {
    std::ostringstream ss;
    args_to_stream(ss, std::forward<Args>(args)...);
    return ss.str();
}

// Join the elements of `v` with `sep`.
inline
std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string ret;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) ret += sep;
        ret += v[i];
    }
    return ret;
}

}} // namespaces
