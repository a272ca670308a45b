#define BOOST_TEST_MODULE middleware
#include <boost/test/included/unit_test.hpp>

#include <memory>
#include <string>

#include <error.h>
#include <policy_registry.h>
#include <signer.h>
#include <signing_client.h>
#include <verification_middleware.h>

#include <namespaces.h>
#include "util/test_keys.h"

BOOST_AUTO_TEST_SUITE(httpsig_middleware)

using namespace std;
using namespace httpsig;

using test::CryptoFixture;
BOOST_GLOBAL_FIXTURE(CryptoFixture);

static const string server_key_id = "server-key-1";

struct MiddlewareFixture {
    RuleFactory rules;
    shared_ptr<Verifier> verifier;
    Signer server_signer;

    MiddlewareFixture()
        : server_signer(SigningConfigBuilder()
                            .profile(SecurityProfile::standard)
                            .key_id(server_key_id)
                            .private_key(test::private_key())
                            .build())
    {
        VerifierConfig c;
        c.policies = PolicyRegistry::load_file("config/policies.json", rules);
        c.public_keys[server_key_id] = test::public_key();
        verifier = make_shared<Verifier>(move(c));
    }

    // A response from the server, signed unless `sign` is false.
    VerifiableResponse response(const string& url, bool sign = true, string body = "{\"ok\":true}") {
        http::fields f;
        f.set("content-type", "application/json");
        VerifiableResponse r(200, f, body, url);

        if (sign) {
            for (const auto& h : server_signer.sign(r.as_message()).headers) {
                r.headers.set(h.name_string(), h.value());
            }
        }
        return r;
    }
};

BOOST_FIXTURE_TEST_CASE(test_response_verification, MiddlewareFixture) {
    ResponseVerifier rv(verifier, ResponseVerifierConfig());

    auto ok = rv.process(response("https://api.example.com/a"));
    BOOST_REQUIRE(ok.verification);
    BOOST_REQUIRE(ok.verification->is_valid());

    auto unsigned_ = rv.process(response("https://api.example.com/a", false));
    BOOST_REQUIRE(!unsigned_.verification);

    auto tampered = response("https://api.example.com/a");
    tampered.body = string("{\"ok\":false}");
    auto bad = rv.process(tampered);
    BOOST_REQUIRE(bad.verification);
    BOOST_REQUIRE(!bad.verification->is_valid());
}

BOOST_FIXTURE_TEST_CASE(test_response_failure_handling, MiddlewareFixture) {
    ResponseVerifierConfig c;
    c.throw_on_failure = true;
    c.skip_patterns = {"/health$"};

    unsigned failures = 0;
    c.on_failure = [&] (const VerificationResult& r, const VerifiableResponse&) {
        BOOST_REQUIRE(!r.is_valid());
        ++failures;
    };

    ResponseVerifier rv(verifier, c);

    auto tampered = response("https://api.example.com/a");
    tampered.body = string("{}");

    try {
        rv.process(tampered);
        BOOST_FAIL("expected a VerificationError");
    } catch (const VerificationError& e) {
        BOOST_REQUIRE_EQUAL(e.name(), "RESPONSE_VERIFICATION_FAILED");
    }
    BOOST_REQUIRE_EQUAL(failures, 1u);

    auto skipped = response("https://api.example.com/health");
    skipped.body = string("{}");
    BOOST_REQUIRE(!rv.process(skipped).verification);

    ResponseVerifierConfig bad;
    bad.skip_patterns = {"(unclosed"};
    BOOST_REQUIRE_THROW(ResponseVerifier(verifier, bad), ConfigError);
}

BOOST_FIXTURE_TEST_CASE(test_client_chain, MiddlewareFixture) {
    ResponseVerifierConfig rc;
    rc.throw_on_failure = true;
    ResponseVerifier rv(verifier, rc);

    bool tamper = false;

    SigningClientConfig cc;
    cc.mode = SigningMode::disabled;
    cc.response_interceptors.push_back(rv.interceptor());

    SigningClient client([&] (const SignableMessage& rq) {
            auto r = response(rq.url());
            if (tamper) r.body = string("{}");
            return r;
        }, cc);

    BOOST_REQUIRE_EQUAL(client.send(SignableMessage(http::verb::get, "https://api.example.com/a")).status, 200u);

    tamper = true;
    BOOST_REQUIRE_THROW( client.send(SignableMessage(http::verb::get, "https://api.example.com/a"))
                       , VerificationError);
}

BOOST_FIXTURE_TEST_CASE(test_request_verification, MiddlewareFixture) {
    RequestVerifierConfig c;
    c.reject_invalid = true;
    RequestVerifier rqv(verifier, c);

    SignableMessage rq( http::verb::post, "https://api.example.com/orders"
                      , HeaderList{{"content-type", "application/json"}}
                      , string("{\"qty\":1}"));

    auto signed_rq = server_signer.sign(rq).apply(rq);
    BOOST_REQUIRE(rqv.process(signed_rq).is_valid());

    try {
        rqv.process(rq);
        BOOST_FAIL("expected a VerificationError");
    } catch (const VerificationError& e) {
        BOOST_REQUIRE(e.code() == make_error_code(verification_error::request_verification_failed));
    }

    RequestVerifier lax(verifier, RequestVerifierConfig());
    auto r = lax.process(rq);
    BOOST_REQUIRE(r.status == VerificationStatus::error);
}

BOOST_AUTO_TEST_SUITE_END()
