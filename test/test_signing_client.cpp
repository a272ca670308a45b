#define BOOST_TEST_MODULE signing_client
#include <boost/test/included/unit_test.hpp>

#include <string>
#include <vector>

#include <error.h>
#include <signing_client.h>

#include <namespaces.h>
#include "util/test_keys.h"

BOOST_AUTO_TEST_SUITE(httpsig_signing_client)

using namespace std;
using namespace httpsig;

using test::CryptoFixture;
BOOST_GLOBAL_FIXTURE(CryptoFixture);

// Records what would have gone over the wire.
struct RecordingTransport {
    vector<SignableMessage> sent;

    Transport transport() {
        return [this] (const SignableMessage& rq) {
            sent.push_back(rq);
            http::fields f;
            f.set("content-type", "text/plain");
            return VerifiableResponse(200, f, string("ok"), rq.url(), rq.method());
        };
    }
};

static SigningClientConfig client_config(SigningMode mode = SigningMode::automatic) {
    SigningClientConfig c;
    c.mode = mode;
    c.signing = SigningConfigBuilder()
        .profile(SecurityProfile::minimal)
        .key_id("client-key-1")
        .private_key(test::private_key())
        .build();
    return c;
}

static SignableMessage get(const string& path) {
    return SignableMessage(http::verb::get, "https://api.example.com" + path);
}

static bool is_signed(const SignableMessage& m) {
    return m.header("signature") && m.header("signature-input");
}

BOOST_AUTO_TEST_CASE(test_automatic) {
    RecordingTransport t;
    SigningClient client(t.transport(), client_config());

    auto response = client.send(get("/orders"));

    BOOST_REQUIRE_EQUAL(response.status, 200u);
    BOOST_REQUIRE_EQUAL(t.sent.size(), 1u);
    BOOST_REQUIRE(is_signed(t.sent[0]));
    BOOST_REQUIRE_EQUAL(client.metrics().requests_signed, 1u);
}

BOOST_AUTO_TEST_CASE(test_modes_and_endpoints) {
    RecordingTransport t;

    auto c = client_config(SigningMode::manual);
    c.endpoints["/api/"].enabled = true;
    c.endpoints["/api/public/"].enabled = false;

    SigningClient manual(t.transport(), c);

    BOOST_REQUIRE(is_signed(manual.prepare(get("/api/orders"))));
    // The longest prefix wins.
    BOOST_REQUIRE(!is_signed(manual.prepare(get("/api/public/status"))));
    // Not configured.
    BOOST_REQUIRE(!is_signed(manual.prepare(get("/health"))));

    SigningClientConfig off;
    off.mode = SigningMode::disabled;
    SigningClient disabled(t.transport(), off);
    BOOST_REQUIRE(!is_signed(disabled.prepare(get("/api/orders"))));

    SigningClientConfig incomplete;
    BOOST_REQUIRE_THROW(SigningClient(t.transport(), incomplete), SigningError);

    BOOST_REQUIRE(parse_signing_mode("manual") == SigningMode::manual);
    BOOST_REQUIRE(!parse_signing_mode("sometimes"));
}

BOOST_AUTO_TEST_CASE(test_cache) {
    RecordingTransport t;
    SigningClient client(t.transport(), client_config());

    auto first = client.prepare(get("/orders"));
    auto second = client.prepare(get("/orders"));
    client.prepare(get("/other"));

    BOOST_REQUIRE_EQUAL(*first.header("signature"), *second.header("signature"));

    auto m = client.metrics();
    BOOST_REQUIRE_EQUAL(m.cache_hits, 1u);
    BOOST_REQUIRE_EQUAL(m.cache_misses, 2u);
    BOOST_REQUIRE_EQUAL(m.requests_signed, 2u);

    client.clear_cache();
    client.reset_metrics();

    auto third = client.prepare(get("/orders"));
    BOOST_REQUIRE_NE(*first.header("signature"), *third.header("signature"));
    BOOST_REQUIRE_EQUAL(client.metrics().cache_hits, 0u);
}

BOOST_AUTO_TEST_CASE(test_deterministic_options_bypass_cache) {
    RecordingTransport t;

    auto c = client_config();
    auto& e = c.endpoints["/"];
    e.options.nonce = test::fixed_nonce;
    e.options.created = int64_t(1700000000);

    SigningClient client(t.transport(), c);

    auto a = client.prepare(get("/x"));
    auto b = client.prepare(get("/x"));

    BOOST_REQUIRE_EQUAL(*a.header("signature"), *b.header("signature"));
    BOOST_REQUIRE_EQUAL(client.metrics().cache_hits + client.metrics().cache_misses, 0u);
    BOOST_REQUIRE_EQUAL(client.metrics().requests_signed, 2u);
}

BOOST_AUTO_TEST_CASE(test_signing_failure) {
    RecordingTransport t;

    auto c = client_config();
    c.endpoints["/lax/"].options.nonce = string("bad");
    c.endpoints["/strict/"].options.nonce = string("bad");
    c.endpoints["/strict/"].required = true;

    SigningClient client(t.transport(), c);

    // Sent unsigned.
    client.send(get("/lax/a"));
    BOOST_REQUIRE_EQUAL(t.sent.size(), 1u);
    BOOST_REQUIRE(!is_signed(t.sent[0]));

    BOOST_REQUIRE_THROW(client.send(get("/strict/a")), SigningError);
    BOOST_REQUIRE_EQUAL(t.sent.size(), 1u);
    BOOST_REQUIRE_EQUAL(client.metrics().signing_failures, 2u);
}

BOOST_AUTO_TEST_CASE(test_interceptor_chain) {
    RecordingTransport t;
    vector<string> order;

    auto c = client_config();
    c.request_interceptors.push_back([&] (const SignableMessage& m) {
        order.push_back("request");
        return m.with_header("x-request-id", "42");
    });
    c.response_interceptors.push_back([&] (const VerifiableResponse& r) {
        order.push_back("response");
        // The request went out signed, after the request interceptor.
        BOOST_REQUIRE(is_signed(t.sent.back()));
        auto copy = r;
        copy.headers.set("x-seen", "1");
        return copy;
    });

    SigningClient client(t.transport(), c);
    auto response = client.send(get("/orders"));

    BOOST_REQUIRE_EQUAL(*t.sent[0].header("x-request-id"), "42");
    BOOST_REQUIRE(response.headers.find("x-seen") != response.headers.end());

    vector<string> expected{"request", "response"};
    BOOST_REQUIRE_EQUAL_COLLECTIONS(order.begin(), order.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_SUITE_END()
