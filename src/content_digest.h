#pragma once

#include <string>

#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

namespace httpsig {

enum class DigestAlgorithm { sha256, sha512 };

// "sha-256" or "sha-512".
const char* to_string(DigestAlgorithm);
boost::optional<DigestAlgorithm> parse_digest_algorithm(boost::string_view);

// Digest of a message body as carried by the `Content-Digest` header.
struct ContentDigest {
    DigestAlgorithm algorithm;
    std::string value;         // base64 of the raw digest
    std::string header_value;  // "<algorithm>=:<value>:"
};

// An absent body digests as the empty byte string.
ContentDigest calculate_content_digest( const boost::optional<std::string>& body
                                      , DigestAlgorithm = DigestAlgorithm::sha256);

ContentDigest calculate_content_digest( boost::string_view body
                                      , DigestAlgorithm = DigestAlgorithm::sha256);

// Parse a `Content-Digest` header value.  Throws `VerificationError`
// (INVALID_CONTENT_DIGEST_FORMAT) on bad syntax, on an unsupported
// algorithm, or if the value does not decode to a digest of the
// algorithm's size.
ContentDigest parse_content_digest(boost::string_view header_value);

// Recompute the digest of `body` with the algorithm of `expected`
// and compare.
bool verify_content_digest( const boost::optional<std::string>& body
                          , const ContentDigest& expected);

} // httpsig namespace
