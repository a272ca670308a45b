#include "base64.h"

#include <algorithm>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace httpsig { namespace util {

std::string detail::base64_encode(const char* data, size_t size) {
    using namespace boost::archive::iterators;
    using It = base64_from_binary<transform_width<const char*, 6, 8>>;
    It begin = data;
    It end   = data + size;
    std::string out(begin, end);  // encode to base64
    return out.append((3 - size % 3) % 3, '=');  // add padding
}

static bool is_base64_char(char c) {
    return ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z')
        || ('0' <= c && c <= '9') || c == '+' || c == '/';
}

boost::optional<std::string> base64_decode(const boost::string_view in) {
    using namespace boost::archive::iterators;

    if (in.size() % 4 != 0) return boost::none;

    auto npad = static_cast<size_t>(std::count(in.begin(), in.end(), '='));
    if (npad > 2) return boost::none;

    auto data = in.substr(0, in.size() - npad);

    // Padding only at the end.
    if (!std::all_of(data.begin(), data.end(), is_base64_char)) return boost::none;

    // The binary-from-base64 iterator does not accept padding characters,
    // so decode the data part and drop the partial trailing byte.
    using It = transform_width<binary_from_base64<const char*>, 8, 6>;
    std::string out(It(data.data()), It(data.data() + data.size()));
    out.resize(data.size() * 6 / 8);
    return out;
}

}} // httpsig::util namespace
