#define BOOST_TEST_MODULE signature_extractor
#include <boost/test/included/unit_test.hpp>

#include <string>

#include <error.h>
#include <signature_extractor.h>

#include <namespaces.h>
#include "util/test_keys.h"

BOOST_AUTO_TEST_SUITE(httpsig_signature_extractor)

using namespace std;
using namespace httpsig;

using test::CryptoFixture;
BOOST_GLOBAL_FIXTURE(CryptoFixture);

static const string sig_hex(128, 'a');

static const string sig_input =
    "sig1=(\"@method\" \"@target-uri\" \"content-digest\")"
    ";created=1700000000;keyid=\"client-key-1\";alg=\"ed25519\""
    ";nonce=\"4b0f2a3e-1c5d-4e6f-8a7b-9c0d1e2f3a4b\"";

static const string digest_header =
    "sha-256=:47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=:";

static http::fields headers( boost::optional<string> input
                           , boost::optional<string> signature
                           , boost::optional<string> digest = boost::none) {
    http::fields f;
    if (input) f.set("Signature-Input", *input);
    if (signature) f.set("Signature", *signature);
    if (digest) f.set("Content-Digest", *digest);
    return f;
}

static verification_error error_of(const http::fields& f) {
    try {
        extract_signature_data(f);
    } catch (const VerificationError& e) {
        return static_cast<verification_error>(e.code().value());
    }
    BOOST_FAIL("expected a VerificationError");
    return verification_error::verification_failed;
}

BOOST_AUTO_TEST_CASE(test_extract) {
    auto data = extract_signature_data(headers(sig_input, "sig1=:" + sig_hex + ":", digest_header));

    BOOST_REQUIRE_EQUAL(data.label, "sig1");
    BOOST_REQUIRE_EQUAL(data.signature, sig_hex);
    BOOST_REQUIRE_EQUAL(data.covered.size(), 3u);
    BOOST_REQUIRE(data.covers("@target-uri"));
    BOOST_REQUIRE(!data.covers("content-type"));

    BOOST_REQUIRE_EQUAL(data.params.created, 1700000000);
    BOOST_REQUIRE_EQUAL(data.params.keyid, "client-key-1");
    BOOST_REQUIRE_EQUAL(data.params.alg, "ed25519");
    BOOST_REQUIRE_EQUAL(data.params.nonce, test::fixed_nonce);

    BOOST_REQUIRE(data.content_digest);
    BOOST_REQUIRE(data.content_digest->algorithm == DigestAlgorithm::sha256);
    BOOST_REQUIRE_EQUAL(*data.content_digest_header, digest_header);
}

BOOST_AUTO_TEST_CASE(test_has_signature_headers) {
    BOOST_REQUIRE(has_signature_headers(headers(sig_input, string("sig1=:ab:"))));
    BOOST_REQUIRE(!has_signature_headers(headers(sig_input, boost::none)));
    BOOST_REQUIRE(!has_signature_headers(headers(boost::none, string("sig1=:ab:"))));
}

BOOST_AUTO_TEST_CASE(test_errors) {
    auto sig = string("sig1=:" + sig_hex + ":");

    BOOST_REQUIRE(error_of(headers(boost::none, sig))
                  == verification_error::missing_signature_input);
    BOOST_REQUIRE(error_of(headers(sig_input, boost::none))
                  == verification_error::missing_signature);
    BOOST_REQUIRE(error_of(headers(string("sig1=\"@method\";created=1"), sig))
                  == verification_error::invalid_signature_input_format);
    BOOST_REQUIRE(error_of(headers(string("sig1=(\"@method\");created=1;keyid=\"k\";alg=\"ed25519\""), sig))
                  == verification_error::invalid_signature_input_format);
    BOOST_REQUIRE(error_of(headers(sig_input, string("sig1=" + sig_hex)))
                  == verification_error::invalid_signature_format);
    BOOST_REQUIRE(error_of(headers(sig_input, string("sig2=:" + sig_hex + ":")))
                  == verification_error::signature_id_mismatch);
    BOOST_REQUIRE(error_of(headers(sig_input, sig, string("sha-256=abc")))
                  == verification_error::invalid_content_digest_format);
}

BOOST_AUTO_TEST_CASE(test_reconstruct_uses_sent_digest) {
    auto data = extract_signature_data(headers(sig_input, "sig1=:" + sig_hex + ":", digest_header));

    // The body does not match the digest; reconstruction still uses the
    // header as sent, detecting tampering is up to the digest check.
    SignableMessage rq( http::verb::post, "https://example.com/a"
                      , HeaderList{}, string("tampered"));

    auto cm = reconstruct(rq, data);

    BOOST_REQUIRE_EQUAL(cm.lines.size(), 4u);
    BOOST_REQUIRE_EQUAL(cm.lines[2], "\"content-digest\": " + digest_header);
    BOOST_REQUIRE_EQUAL(cm.lines[3], "\"@signature-params\": " + sig_input.substr(5));
}

BOOST_AUTO_TEST_SUITE_END()
