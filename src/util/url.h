#pragma once

#include <string>
#include <optional>
#include <boost/utility/string_view.hpp>

namespace httpsig::util {

// Absolute `http` or `https` URL.
struct Url {
    //      https://example.com:8042/over/there?name=ferret#nose
    //      \___/   \______________/\_________/ \_________/ \__/
    //        |            |            |            |        |
    //     scheme      authority       path        query   fragment

    std::string scheme;
    std::string host;
    std::string port;      // maybe empty
    std::string path;      // maybe empty
    std::string query;     // maybe empty
    std::string fragment;  // maybe empty

    // Empty if the scheme is not http(s) or the host is missing.
    static
    std::optional<Url> from(const boost::string_view url);

    // The request target as covered by `@target-uri`:
    // the path (`/` if empty) followed by `?query` if there is a query.
    std::string target() const;

    std::string host_and_port() const {
        if (port.empty()) {
            return host;
        } else {
            return host + ':' + port;
        }
    }
};

} // namespace httpsig::util
