#pragma once

#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

#include "namespaces.h"

namespace httpsig {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// GET, HEAD, POST, PUT, DELETE, PATCH, OPTIONS, CONNECT and TRACE.
bool is_standard_method(http::verb);

// Case-sensitive, as in the request line.
boost::optional<http::verb> parse_method(boost::string_view);

// The HTTP facts which a signature may cover: method, absolute URL,
// header fields (case-insensitive names) and an optional body.
// Immutable; the `with_*` functions return modified copies.
class SignableMessage {
public:
    // Later headers with the same (case-insensitive) name replace earlier
    // ones.  Throws `std::invalid_argument` for a non-standard method.
    SignableMessage( http::verb method
                   , std::string url
                   , const HeaderList& headers = {}
                   , boost::optional<std::string> body = boost::none);

    SignableMessage( http::verb method
                   , std::string url
                   , http::fields headers
                   , boost::optional<std::string> body);

    http::verb method() const { return _method; }
    std::string method_string() const;

    const std::string& url() const { return _url; }
    const http::fields& headers() const { return _headers; }
    const boost::optional<std::string>& body() const { return _body; }

    // A body is present and non-empty.
    bool has_body() const { return _body && !_body->empty(); }

    // `none` if absent; an empty string if present with an empty value.
    boost::optional<std::string> header(boost::string_view name) const;

    boost::optional<std::string> content_type() const { return header("content-type"); }
    size_t content_size() const { return _body ? _body->size() : 0; }

    SignableMessage with_header(boost::string_view name, boost::string_view value) const;
    SignableMessage with_headers(const http::fields&) const;
    SignableMessage without_header(boost::string_view name) const;
    SignableMessage with_body(boost::optional<std::string> body) const;

private:
    http::verb _method;
    std::string _url;
    http::fields _headers;
    boost::optional<std::string> _body;
};

// A response to be verified.  Its `@method` and `@target-uri` are those of
// the request it answers.
struct VerifiableResponse {
    unsigned status;
    http::fields headers;
    boost::optional<std::string> body;
    std::string url;
    http::verb method = http::verb::get;

    // Throws `VerificationError` (INVALID_MESSAGE) unless 100 <= status <= 599.
    VerifiableResponse( unsigned status
                      , http::fields headers
                      , boost::optional<std::string> body
                      , std::string url
                      , http::verb method = http::verb::get);

    SignableMessage as_message() const;
};

// Copy of `fields` with lowercase names, in order.
HeaderList header_list(const http::fields& fields);

} // httpsig namespace
