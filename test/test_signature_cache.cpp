#define BOOST_TEST_MODULE signature_cache
#include <boost/test/included/unit_test.hpp>

#include <chrono>
#include <string>
#include <thread>

#include <signature_cache.h>

#include <namespaces.h>
#include "util/test_keys.h"

BOOST_AUTO_TEST_SUITE(httpsig_signature_cache)

using namespace std;
using namespace std::chrono;
using namespace httpsig;

using test::CryptoFixture;
BOOST_GLOBAL_FIXTURE(CryptoFixture);

static SignableMessage request(const string& path) {
    return SignableMessage( http::verb::get, "https://example.com" + path
                          , HeaderList{{"accept", "*/*"}});
}

static http::fields signature_headers(const string& tag) {
    http::fields f;
    f.set("signature", "sig1=:" + tag + ":");
    return f;
}

BOOST_AUTO_TEST_CASE(test_hit_and_miss) {
    SignatureCache cache;

    BOOST_REQUIRE(!cache.get(request("/a")));

    cache.put(request("/a"), signature_headers("aa"));

    auto hit = cache.get(request("/a"));
    BOOST_REQUIRE(hit);
    BOOST_REQUIRE_EQUAL((*hit)["signature"], "sig1=:aa:");

    BOOST_REQUIRE(!cache.get(request("/b")));
    BOOST_REQUIRE_EQUAL(cache.size(), 1u);

    cache.clear();
    BOOST_REQUIRE(!cache.get(request("/a")));
}

BOOST_AUTO_TEST_CASE(test_fingerprint) {
    auto a = SignableMessage( http::verb::post, "https://example.com/x"
                            , HeaderList{{"X-One", "1"}, {"x-two", "2"}}
                            , string("body"));
    auto b = SignableMessage( http::verb::post, "https://example.com/x"
                            , HeaderList{{"x-two", "2"}, {"x-one", "1"}}
                            , string("body"));

    // Header order and name case do not matter.
    BOOST_REQUIRE_EQUAL(SignatureCache::fingerprint(a), SignatureCache::fingerprint(b));
    BOOST_REQUIRE_EQUAL(SignatureCache::fingerprint(a).size(), 64u);

    BOOST_REQUIRE_NE( SignatureCache::fingerprint(a)
                    , SignatureCache::fingerprint(a.with_body(string("other"))));
    BOOST_REQUIRE_NE( SignatureCache::fingerprint(a)
                    , SignatureCache::fingerprint(a.with_header("x-one", "3")));
}

BOOST_AUTO_TEST_CASE(test_capacity) {
    SignatureCache cache(2);

    cache.put(request("/1"), signature_headers("1"));
    cache.put(request("/2"), signature_headers("2"));
    cache.put(request("/3"), signature_headers("3"));

    BOOST_REQUIRE_EQUAL(cache.size(), 2u);
    BOOST_REQUIRE_EQUAL(cache.max_size(), 2u);
    BOOST_REQUIRE(!cache.get(request("/1")));
    BOOST_REQUIRE(cache.get(request("/2")));
    BOOST_REQUIRE(cache.get(request("/3")));

    // Reading "/2" made "/3" the least recently used entry.
    cache.get(request("/2"));
    cache.put(request("/4"), signature_headers("4"));
    BOOST_REQUIRE(cache.get(request("/2")));
    BOOST_REQUIRE(!cache.get(request("/3")));
}

BOOST_AUTO_TEST_CASE(test_expiry) {
    SignatureCache cache(10, milliseconds(50));

    cache.put(request("/short"), signature_headers("s"));
    cache.put(request("/long"), signature_headers("l"), SignatureCache::Clock::duration(minutes(5)));
    cache.put(request("/gone"), signature_headers("g"));

    BOOST_REQUIRE(cache.get(request("/short")));

    this_thread::sleep_for(milliseconds(100));

    BOOST_REQUIRE(!cache.get(request("/short")));
    BOOST_REQUIRE(cache.get(request("/long")));

    // "/short" was dropped on read, "/gone" is dropped here.
    BOOST_REQUIRE_EQUAL(cache.cleanup_expired(), 1u);
    BOOST_REQUIRE_EQUAL(cache.size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
