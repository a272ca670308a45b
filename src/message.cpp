#include "message.h"
#include "error.h"
#include "util/str.h"

#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

namespace httpsig {

bool is_standard_method(http::verb v)
{
    switch (v) {
        case http::verb::get:
        case http::verb::head:
        case http::verb::post:
        case http::verb::put:
        case http::verb::delete_:
        case http::verb::patch:
        case http::verb::options:
        case http::verb::connect:
        case http::verb::trace:
            return true;
        default:
            return false;
    }
}

boost::optional<http::verb> parse_method(boost::string_view s)
{
    auto v = http::string_to_verb(s);
    if (!is_standard_method(v)) return boost::none;
    return v;
}

static void check_method(http::verb method)
{
    if (!is_standard_method(method)) {
        throw std::invalid_argument(util::str("Unsupported HTTP method: ", http::to_string(method)));
    }
}

SignableMessage::SignableMessage( http::verb method
                                , std::string url
                                , const HeaderList& headers
                                , boost::optional<std::string> body)
    : _method(method)
    , _url(std::move(url))
    , _body(std::move(body))
{
    check_method(_method);
    for (const auto& h : headers) {
        _headers.set(h.first, h.second);
    }
}

SignableMessage::SignableMessage( http::verb method
                                , std::string url
                                , http::fields headers
                                , boost::optional<std::string> body)
    : _method(method)
    , _url(std::move(url))
    , _headers(std::move(headers))
    , _body(std::move(body))
{
    check_method(_method);
}

std::string SignableMessage::method_string() const
{
    return std::string(http::to_string(_method));
}

boost::optional<std::string> SignableMessage::header(boost::string_view name) const
{
    auto it = _headers.find(name);
    if (it == _headers.end()) return boost::none;
    return std::string(it->value());
}

SignableMessage SignableMessage::with_header(boost::string_view name, boost::string_view value) const
{
    auto copy = *this;
    copy._headers.set(name, value);
    return copy;
}

SignableMessage SignableMessage::with_headers(const http::fields& fields) const
{
    auto copy = *this;
    for (const auto& f : fields) {
        copy._headers.set(f.name_string(), f.value());
    }
    return copy;
}

SignableMessage SignableMessage::without_header(boost::string_view name) const
{
    auto copy = *this;
    copy._headers.erase(name);
    return copy;
}

SignableMessage SignableMessage::with_body(boost::optional<std::string> body) const
{
    auto copy = *this;
    copy._body = std::move(body);
    return copy;
}

VerifiableResponse::VerifiableResponse( unsigned status
                                      , http::fields headers
                                      , boost::optional<std::string> body
                                      , std::string url
                                      , http::verb method)
    : status(status)
    , headers(std::move(headers))
    , body(std::move(body))
    , url(std::move(url))
    , method(method)
{
    if (status < 100 || status > 599) {
        throw VerificationError( verification_error::invalid_message
                               , util::str("Invalid HTTP status code: ", status)
                               , {{"status", std::to_string(status)}});
    }
}

SignableMessage VerifiableResponse::as_message() const
{
    return SignableMessage(method, url, headers, body);
}

HeaderList header_list(const http::fields& fields)
{
    HeaderList ret;
    for (const auto& f : fields) {
        ret.emplace_back( boost::algorithm::to_lower_copy(std::string(f.name_string()))
                        , std::string(f.value()));
    }
    return ret;
}

} // httpsig namespace
