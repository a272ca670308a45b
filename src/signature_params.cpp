#include "signature_params.h"
#include "util/random.h"
#include "util/str.h"

#include <algorithm>
#include <chrono>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/regex.hpp>

namespace httpsig {

SignatureComponents::SignatureComponents( bool method
                                        , bool target_uri
                                        , std::vector<std::string> headers
                                        , bool content_digest)
    : method(method)
    , target_uri(target_uri)
    , content_digest(content_digest)
{
    set_headers(std::move(headers));
}

void SignatureComponents::set_headers(std::vector<std::string> headers)
{
    for (auto& h : headers) boost::algorithm::to_lower(h);
    _headers = std::move(headers);
}

void SignatureComponents::add_header(boost::string_view name)
{
    auto h = normalize_header_name(name);
    if (!covers_header(h)) _headers.push_back(std::move(h));
}

bool SignatureComponents::covers_header(boost::string_view name) const
{
    auto h = normalize_header_name(name);
    return std::find(_headers.begin(), _headers.end(), h) != _headers.end();
}

bool SignatureComponents::empty() const
{
    return !method && !target_uri && !content_digest && _headers.empty();
}

std::string generate_nonce()
{
    return util::random::uuid_v4();
}

int64_t current_timestamp()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

bool is_valid_nonce(boost::string_view nonce)
{
    static const boost::regex rx(
            "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$",
            boost::regex::icase);
    return boost::regex_match(nonce.begin(), nonce.end(), rx);
}

bool is_valid_timestamp(int64_t ts)
{
    return ts >= min_signature_timestamp && ts <= max_signature_timestamp;
}

bool is_valid_key_id(boost::string_view keyid)
{
    if (keyid.empty() || keyid.size() > max_key_id_length) return false;
    return std::none_of(keyid.begin(), keyid.end(), [] (char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n'
            || c == '\v' || c == '\f';
    });
}

bool is_valid_header_name(boost::string_view name)
{
    static const boost::regex rx("^[!#$%&'*+\\-.0-9A-Z^_`a-z|~]+$");
    return boost::regex_match(name.begin(), name.end(), rx);
}

std::string normalize_header_name(boost::string_view name)
{
    return boost::algorithm::to_lower_copy(std::string(name));
}

std::string format_signature_params( const std::vector<std::string>& covered
                                   , const SignatureParams& p)
{
    std::string list;
    for (const auto& c : covered) {
        if (!list.empty()) list += ' ';
        list += util::str('"', c, '"');
    }

    return util::str( '(', list, ')'
                    , ";created=", p.created
                    , ";keyid=\"", p.keyid, '"'
                    , ";alg=\"", p.alg, '"'
                    , ";nonce=\"", p.nonce, '"');
}

} // httpsig namespace
