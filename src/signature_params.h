#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/utility/string_view.hpp>

namespace httpsig {

// Earliest and latest acceptable `created` values (years 2000 and 2100).
static const int64_t min_signature_timestamp = 946684800;
static const int64_t max_signature_timestamp = 4102444800;

static const size_t max_key_id_length = 256;

// The only supported signature algorithm.
static const char signature_algorithm[] = "ed25519";

// The label used in `Signature-Input` and `Signature`.
static const char default_signature_label[] = "sig1";

// Which facts of a message a signature covers.
class SignatureComponents {
public:
    SignatureComponents() = default;

    // Header names are lowercased.
    SignatureComponents( bool method
                       , bool target_uri
                       , std::vector<std::string> headers
                       , bool content_digest);

    bool method = false;
    bool target_uri = false;
    bool content_digest = false;

    const std::vector<std::string>& headers() const { return _headers; }
    void set_headers(std::vector<std::string>);
    void add_header(boost::string_view);

    bool covers_header(boost::string_view name) const;

    // No component at all is enabled.
    bool empty() const;

private:
    std::vector<std::string> _headers;
};

struct SignatureParams {
    int64_t created = 0;
    std::string keyid;
    std::string alg = signature_algorithm;
    std::string nonce;
};

// Random version 4 UUID.
std::string generate_nonce();

// Unix time in seconds.
int64_t current_timestamp();

// Case-insensitive version 4 UUID shape.
bool is_valid_nonce(boost::string_view);

bool is_valid_timestamp(int64_t);

// Non-empty, without whitespace and at most `max_key_id_length` long.
bool is_valid_key_id(boost::string_view);

// An RFC 7230 token.
bool is_valid_header_name(boost::string_view);

std::string normalize_header_name(boost::string_view);

// `("c1" "c2");created=N;keyid="k";alg="a";nonce="n"`
std::string format_signature_params( const std::vector<std::string>& covered
                                   , const SignatureParams&);

} // httpsig namespace
