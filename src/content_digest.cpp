#include "content_digest.h"
#include "error.h"
#include "util/base64.h"
#include "util/hash.h"
#include "util/str.h"

#include <boost/regex.hpp>

namespace httpsig {

static util::hash_algorithm hash_algorithm_for(DigestAlgorithm a)
{
    switch (a) {
        case DigestAlgorithm::sha256: return util::hash_algorithm::sha256;
        case DigestAlgorithm::sha512: return util::hash_algorithm::sha512;
    }
    return util::hash_algorithm::sha256;
}

const char* to_string(DigestAlgorithm a)
{
    switch (a) {
        case DigestAlgorithm::sha256: return "sha-256";
        case DigestAlgorithm::sha512: return "sha-512";
    }
    return "unknown";
}

boost::optional<DigestAlgorithm> parse_digest_algorithm(boost::string_view s)
{
    if (s == "sha-256") return DigestAlgorithm::sha256;
    if (s == "sha-512") return DigestAlgorithm::sha512;
    return boost::none;
}

static ContentDigest make_digest(DigestAlgorithm algorithm, std::string value)
{
    auto header_value = util::str(to_string(algorithm), "=:", value, ':');
    return ContentDigest{algorithm, std::move(value), std::move(header_value)};
}

ContentDigest calculate_content_digest( boost::string_view body
                                      , DigestAlgorithm algorithm)
{
    auto raw = util::digest(hash_algorithm_for(algorithm), body);
    return make_digest(algorithm, util::base64_encode(raw));
}

ContentDigest calculate_content_digest( const boost::optional<std::string>& body
                                      , DigestAlgorithm algorithm)
{
    if (!body) return calculate_content_digest(boost::string_view(), algorithm);
    return calculate_content_digest(boost::string_view(*body), algorithm);
}

ContentDigest parse_content_digest(boost::string_view header_value)
{
    static const boost::regex rx("([^=]+)=:([^:]+):");

    auto fail = [&] (std::string msg) {
        return VerificationError( verification_error::invalid_content_digest_format
                                , std::move(msg)
                                , {{"content_digest", std::string(header_value)}});
    };

    boost::cmatch m;
    if (!boost::regex_match(header_value.begin(), header_value.end(), m, rx)) {
        throw fail("Invalid Content-Digest header format");
    }

    auto algorithm = parse_digest_algorithm(boost::string_view(m[1].first, m[1].length()));
    if (!algorithm) {
        throw fail(util::str("Unsupported content digest algorithm: ", m[1].str()));
    }

    auto value = m[2].str();
    auto raw = util::base64_decode(value);
    if (!raw || raw->size() != util::digest_size(hash_algorithm_for(*algorithm))) {
        throw fail("Content digest value is not a valid base64 digest");
    }

    return make_digest(*algorithm, std::move(value));
}

bool verify_content_digest( const boost::optional<std::string>& body
                          , const ContentDigest& expected)
{
    return calculate_content_digest(body, expected.algorithm).value == expected.value;
}

} // httpsig namespace
