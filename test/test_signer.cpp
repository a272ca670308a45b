#define BOOST_TEST_MODULE signer
#include <boost/test/included/unit_test.hpp>

#include <functional>
#include <string>

#include <error.h>
#include <signer.h>
#include <signing_config.h>
#include <util/bytes.h>

#include <namespaces.h>
#include "util/test_keys.h"

BOOST_AUTO_TEST_SUITE(httpsig_signer)

using namespace std;
using namespace httpsig;

using test::CryptoFixture;
BOOST_GLOBAL_FIXTURE(CryptoFixture);

static const string rq_url = "https://api.example.com/orders";
static const int64_t rq_created = 1700000000;

static SigningConfigBuilder builder(SecurityProfile profile = SecurityProfile::standard) {
    SigningConfigBuilder b;
    b.profile(profile)
     .key_id("client-key-1")
     .private_key(test::private_key_bytes());
    return b;
}

static SigningOptions fixed_options() {
    SigningOptions o;
    o.nonce = test::fixed_nonce;
    o.created = rq_created;
    return o;
}

static signing_error error_of(std::function<void()> f) {
    try {
        f();
    } catch (const SigningError& e) {
        BOOST_REQUIRE(e.code().category() == signing_category());
        return static_cast<signing_error>(e.code().value());
    }
    BOOST_FAIL("expected a SigningError");
    return signing_error::signing_failed;
}

BOOST_AUTO_TEST_CASE(test_minimal_get) {
    Signer signer(builder(SecurityProfile::minimal).build());
    SignableMessage rq(http::verb::get, rq_url);

    auto r = signer.sign(rq, fixed_options());

    BOOST_REQUIRE_EQUAL(r.signature_input,
        "sig1=(\"@method\" \"@target-uri\");created=1700000000"
        ";keyid=\"client-key-1\";alg=\"ed25519\";nonce=\"" + test::fixed_nonce + "\"");
    BOOST_REQUIRE(r.headers.find("content-digest") == r.headers.end());
    BOOST_REQUIRE(r.headers.find("content-type") == r.headers.end());

    // "sig1=:" + 128 hex digits + ":"
    BOOST_REQUIRE_EQUAL(r.signature.size(), 6u + 128u + 1u);
    BOOST_REQUIRE_EQUAL(r.signature.substr(0, 6), "sig1=:");

    auto sig = util::bytes::from_hex(r.signature.substr(6, 128));
    BOOST_REQUIRE(sig);
    BOOST_REQUIRE(test::public_key().verify( r.canonical_message
                                           , util::bytes::to_array<uint8_t, 64>(*sig)));
}

BOOST_AUTO_TEST_CASE(test_post_with_digest) {
    Signer signer(builder().build());
    SignableMessage rq(http::verb::post, rq_url, HeaderList{}, string("{\"a\":1}"));

    auto r = signer.sign(rq, fixed_options());

    BOOST_REQUIRE_EQUAL(r.headers["content-digest"],
                        "sha-256=:AVq9f1zFei3ZS3WQ8ErYCEJzkF7jPsXOvq5iJ2qX+GI=:");
    // Covered and absent, so synthesized from the body.
    BOOST_REQUIRE_EQUAL(r.headers["content-type"], "application/json");

    auto signed_rq = r.apply(rq);
    BOOST_REQUIRE_EQUAL(*signed_rq.header("signature"), r.signature);
    BOOST_REQUIRE(!rq.header("signature"));
}

BOOST_AUTO_TEST_CASE(test_deterministic) {
    Signer signer(builder().build());
    SignableMessage rq( http::verb::put, rq_url
                      , HeaderList{{"content-type", "text/plain"}}
                      , string("body"));

    auto r1 = signer.sign(rq, fixed_options());
    auto r2 = signer.sign(rq, fixed_options());

    BOOST_REQUIRE_EQUAL(r1.signature, r2.signature);
    BOOST_REQUIRE_EQUAL(r1.canonical_message, r2.canonical_message);

    auto o = fixed_options();
    o.nonce = boost::none;
    auto r3 = signer.sign(rq, o);
    auto r4 = signer.sign(rq, o);

    BOOST_REQUIRE_NE(r3.params.nonce, r4.params.nonce);
    BOOST_REQUIRE_NE(r3.signature, r4.signature);
    BOOST_REQUIRE(is_valid_nonce(r3.params.nonce));
}

BOOST_AUTO_TEST_CASE(test_generators) {
    auto config = builder(SecurityProfile::minimal)
        .nonce_generator([] { return test::fixed_nonce; })
        .timestamp_generator([] { return rq_created; })
        .build();

    auto r = Signer(config).sign(SignableMessage(http::verb::get, rq_url));

    BOOST_REQUIRE_EQUAL(r.params.nonce, test::fixed_nonce);
    BOOST_REQUIRE_EQUAL(r.params.created, rq_created);
}

BOOST_AUTO_TEST_CASE(test_invalid_options) {
    Signer signer(builder().build());
    SignableMessage rq(http::verb::get, rq_url);

    BOOST_REQUIRE(error_of([&] {
        auto o = fixed_options();
        o.nonce = string("not-a-uuid");
        signer.sign(rq, o);
    }) == signing_error::invalid_nonce);

    BOOST_REQUIRE(error_of([&] {
        auto o = fixed_options();
        o.created = int64_t(100);
        signer.sign(rq, o);
    }) == signing_error::invalid_timestamp);

    BOOST_REQUIRE(error_of([&] {
        auto o = fixed_options();
        o.components = SignatureComponents();
        signer.sign(rq, o);
    }) == signing_error::invalid_signature_components);

    BOOST_REQUIRE(error_of([&] {
        signer.sign(SignableMessage(http::verb::get, "not a url"), fixed_options());
    }) == signing_error::invalid_url);
}

BOOST_AUTO_TEST_CASE(test_invalid_config) {
    BOOST_REQUIRE(error_of([] {
        builder().key_id("").build();
    }) == signing_error::invalid_key_id);

    BOOST_REQUIRE(error_of([] {
        builder().key_id("has space").build();
    }) == signing_error::invalid_key_id);

    BOOST_REQUIRE(error_of([] {
        builder().private_key(string(16, 'x')).build();
    }) == signing_error::invalid_private_key);

    BOOST_REQUIRE(error_of([] {
        builder().private_key(string(32, '\0')).build();
    }) == signing_error::invalid_private_key);

    BOOST_REQUIRE(error_of([] {
        builder().method(false).target_uri(false).headers({})
                 .content_digest(false).build();
    }) == signing_error::invalid_signature_components);

    BOOST_REQUIRE(error_of([] {
        builder().add_header("bad header").build();
    }) == signing_error::invalid_signature_components);

    BOOST_REQUIRE(error_of([] {
        builder().label("a=b").build();
    }) == signing_error::invalid_config);
}

BOOST_AUTO_TEST_CASE(test_required_headers) {
    Signer signer(builder().require_header("Authorization").build());
    SignableMessage rq(http::verb::get, rq_url);

    BOOST_REQUIRE(error_of([&] {
        signer.sign(rq, fixed_options());
    }) == signing_error::missing_required_header);

    auto r = signer.sign(rq.with_header("authorization", "Bearer t"), fixed_options());
    BOOST_REQUIRE(r.signature_input.find("\"authorization\"") != string::npos);

    // Strict headers fail on any configured header which is absent.
    Signer strict(builder(SecurityProfile::strict).strict_headers(true).build());
    BOOST_REQUIRE(error_of([&] {
        strict.sign(rq, fixed_options());
    }) == signing_error::missing_required_header);

    // Otherwise absent headers are left out.
    Signer lax(builder(SecurityProfile::strict).build());
    auto r2 = lax.sign(rq, fixed_options());
    BOOST_REQUIRE(r2.signature_input.find("user-agent") == string::npos);
    BOOST_REQUIRE(r2.headers["content-digest"].starts_with("sha-512=:"));
}

BOOST_AUTO_TEST_CASE(test_update_config) {
    Signer signer(builder().build());

    auto bad = signer.config();
    bad.key_id = "";
    BOOST_REQUIRE_THROW(signer.update_config(bad), SigningError);
    BOOST_REQUIRE_EQUAL(signer.config().key_id, "client-key-1");

    signer.update_config(builder().key_id("client-key-2").build());
    BOOST_REQUIRE_EQUAL(signer.config().key_id, "client-key-2");
}

BOOST_AUTO_TEST_CASE(test_default_content_type) {
    BOOST_REQUIRE_EQUAL(default_content_type(" [1, 2] "), "application/json");
    BOOST_REQUIRE_EQUAL(default_content_type("{}"), "application/json");
    BOOST_REQUIRE_EQUAL(default_content_type("hello"), "application/octet-stream");
}

BOOST_AUTO_TEST_SUITE_END()
