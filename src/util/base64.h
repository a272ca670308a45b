#pragma once

#include <string>

#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

namespace httpsig { namespace util {

namespace detail {
std::string base64_encode(const char*, size_t);
}

// Standard alphabet, padded.
template<class In>
std::string base64_encode(const In& in) {
    return detail::base64_encode(reinterpret_cast<const char*>(in.data()), in.size());
}

// Returns `none` if `in` is not padded standard base64.
boost::optional<std::string> base64_decode(const boost::string_view in);

}} // httpsig::util namespace
