#define BOOST_TEST_MODULE utility
#include <boost/test/included/unit_test.hpp>

#include <chrono>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>

#include <async_sleep.h>
#include <parse/number.h>
#include <signature_params.h>
#include <split_string.h>
#include <util/base64.h>
#include <util/bytes.h>
#include <util/hash.h>
#include <util/lru_cache.h>
#include <util/random.h>
#include <util/str.h>
#include <util/timeout.h>
#include <util/url.h>

#include <namespaces.h>
#include "util/test_keys.h"

BOOST_AUTO_TEST_SUITE(httpsig_util)

using namespace std;
using namespace httpsig;
using namespace chrono;
using Clock = chrono::steady_clock;

using test::CryptoFixture;
BOOST_GLOBAL_FIXTURE(CryptoFixture);

static int millis_since(Clock::time_point start) {
    return duration_cast<milliseconds>(Clock::now() - start).count();
}

BOOST_AUTO_TEST_CASE(test_base64) {
    BOOST_REQUIRE_EQUAL(util::base64_encode(string("{\"a\":1}")), "eyJhIjoxfQ==");
    BOOST_REQUIRE_EQUAL(util::base64_encode(string()), "");

    BOOST_REQUIRE_EQUAL(*util::base64_decode("eyJhIjoxfQ=="), "{\"a\":1}");
    BOOST_REQUIRE(!util::base64_decode("eyJhIjoxfQ"));
    BOOST_REQUIRE(!util::base64_decode("ey$hIjoxfQ=="));
}

BOOST_AUTO_TEST_CASE(test_hex) {
    BOOST_REQUIRE_EQUAL(util::bytes::to_hex(string("\x01\xab\xff", 3)), "01abff");
    BOOST_REQUIRE_EQUAL(*util::bytes::from_hex("01ABff"), string("\x01\xab\xff", 3));
    BOOST_REQUIRE(!util::bytes::from_hex("abc"));
    BOOST_REQUIRE(!util::bytes::from_hex("zz"));
    BOOST_REQUIRE(util::bytes::is_hex("0123456789abcdefABCDEF"));
}

BOOST_AUTO_TEST_CASE(test_hash) {
    BOOST_REQUIRE_EQUAL(
        util::bytes::to_hex(util::sha256_digest("abc")),
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    BOOST_REQUIRE_EQUAL(util::digest_size(util::hash_algorithm::sha512), 64u);
    BOOST_REQUIRE_EQUAL(
        util::digest(util::hash_algorithm::sha256, "abc"),
        util::bytes::to_string(util::sha256_digest("a", "b", "c")));
}

BOOST_AUTO_TEST_CASE(test_ed25519) {
    auto key = test::private_key();

    BOOST_REQUIRE_EQUAL( util::bytes::to_hex(key.public_key().serialize())
                       , test::public_key_hex);

    // RFC 8032, section 7.1, test 1: the empty message.
    BOOST_REQUIRE_EQUAL(util::bytes::to_hex(key.sign("")),
        "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
        "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");

    auto sig = key.sign("message");
    BOOST_REQUIRE(test::public_key().verify("message", sig));
    BOOST_REQUIRE(!test::public_key().verify("massage", sig));

    auto other = util::Ed25519PrivateKey::generate();
    BOOST_REQUIRE(!other.public_key().verify("message", sig));

    BOOST_REQUIRE(!util::Ed25519PublicKey::from_hex("abcd"));
    BOOST_REQUIRE(!util::Ed25519PrivateKey::from_bytes(string(31, 'x')));
}

BOOST_AUTO_TEST_CASE(test_url) {
    auto u = util::Url::from("https://user@api.example.com:8443/a/b?x=1&y=2#frag");
    BOOST_REQUIRE(u);
    BOOST_REQUIRE_EQUAL(u->scheme, "https");
    BOOST_REQUIRE_EQUAL(u->host, "api.example.com");
    BOOST_REQUIRE_EQUAL(u->port, "8443");
    BOOST_REQUIRE_EQUAL(u->target(), "/a/b?x=1&y=2");

    BOOST_REQUIRE_EQUAL(util::Url::from("http://example.com")->target(), "/");
    BOOST_REQUIRE(!util::Url::from("ftp://example.com/"));
    BOOST_REQUIRE(!util::Url::from("/relative/path"));
}

BOOST_AUTO_TEST_CASE(test_split_string) {
    vector<string> items;
    for (auto v : SplitString("a=1; b ;;c", ';')) items.emplace_back(v);

    vector<string> expected{"a=1", "b", "", "c"};
    BOOST_REQUIRE_EQUAL_COLLECTIONS(items.begin(), items.end(), expected.begin(), expected.end());

    auto kv = split_string_pair(" keyid = \"k1\" ", '=');
    BOOST_REQUIRE_EQUAL(kv.first, "keyid");
    BOOST_REQUIRE(unquote(kv.second));
    BOOST_REQUIRE_EQUAL(kv.second, "k1");
}

BOOST_AUTO_TEST_CASE(test_parse_number) {
    BOOST_REQUIRE_EQUAL(*parse::whole_number<int64_t>("1700000000"), 1700000000);
    BOOST_REQUIRE(!parse::whole_number<int64_t>("17x"));
    BOOST_REQUIRE(!parse::whole_number<int64_t>(""));
}

BOOST_AUTO_TEST_CASE(test_str) {
    BOOST_REQUIRE_EQUAL(util::str("age: ", 5, "s"), "age: 5s");
    BOOST_REQUIRE_EQUAL(util::str(boost::optional<int>()), "none");
    BOOST_REQUIRE_EQUAL(util::join({"a", "b", "c"}, ", "), "a, b, c");
}

BOOST_AUTO_TEST_CASE(test_signature_params) {
    auto uuid = util::random::uuid_v4();
    BOOST_REQUIRE(is_valid_nonce(uuid));
    BOOST_REQUIRE_EQUAL(uuid[14], '4');
    BOOST_REQUIRE_NE(uuid, util::random::uuid_v4());

    BOOST_REQUIRE(is_valid_nonce("4B0F2A3E-1C5D-4E6F-8A7B-9C0D1E2F3A4B"));
    BOOST_REQUIRE(!is_valid_nonce("4b0f2a3e-1c5d-1e6f-8a7b-9c0d1e2f3a4b"));
    BOOST_REQUIRE(!is_valid_nonce("not-a-uuid"));

    BOOST_REQUIRE(is_valid_timestamp(current_timestamp()));
    BOOST_REQUIRE(!is_valid_timestamp(min_signature_timestamp - 1));
    BOOST_REQUIRE(!is_valid_timestamp(max_signature_timestamp + 1));

    BOOST_REQUIRE(!is_valid_key_id(string(max_key_id_length + 1, 'k')));
    BOOST_REQUIRE(is_valid_header_name("x-custom_header"));
    BOOST_REQUIRE(!is_valid_header_name("bad:name"));
    BOOST_REQUIRE_EQUAL(normalize_header_name("Content-Type"), "content-type");

    SignatureComponents c;
    BOOST_REQUIRE(c.empty());
    c.add_header("Authorization");
    c.add_header("authorization");
    BOOST_REQUIRE_EQUAL(c.headers().size(), 1u);
    BOOST_REQUIRE(c.covers_header("AUTHORIZATION"));
}

BOOST_AUTO_TEST_CASE(test_lru_cache) {
    vector<string> evicted;
    util::LruCache<string, int> cache(2, [&] (const string& k, const int&) {
            evicted.push_back(k);
        });

    cache.put("a", 1);
    cache.put("b", 2);
    BOOST_REQUIRE_EQUAL(*cache.get("a"), 1);
    cache.put("c", 3);

    BOOST_REQUIRE_EQUAL(evicted.size(), 1u);
    BOOST_REQUIRE_EQUAL(evicted[0], "b");
    BOOST_REQUIRE(!cache.exists("b"));
    BOOST_REQUIRE(cache.peek("a"));
}

BOOST_AUTO_TEST_CASE(test_cancel) {
    asio::io_context ctx;
    auto ex = ctx.get_executor();

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel cancel;
        auto start = Clock::now();

        asio::spawn(ctx, [&] (asio::yield_context yield) {
            asio::post(ctx, yield);
            cancel();
        });

        BOOST_REQUIRE(!cancel);
        BOOST_REQUIRE(!async_sleep(ex, seconds(1), cancel, yield));
        BOOST_REQUIRE(millis_since(start) < 100);
    });

    ctx.run();
}

BOOST_AUTO_TEST_CASE(test_with_timeout) {
    asio::io_context ctx;
    auto ex = ctx.get_executor();

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel cancel;
        sys::error_code ec;
        auto start = Clock::now();

        auto slept = util::with_timeout(ex, cancel, milliseconds(20),
                [&] (Cancel& c, asio::yield_context y) {
                    return async_sleep(ex, seconds(1), c, y);
                },
                yield[ec]);

        BOOST_REQUIRE(!slept);
        BOOST_REQUIRE(ec == asio::error::timed_out);
        BOOST_REQUIRE(millis_since(start) < 500);

        ec = {};
        auto quick = util::with_timeout(ex, cancel, seconds(1),
                [&] (Cancel& c, asio::yield_context y) {
                    return async_sleep(ex, milliseconds(1), c, y);
                },
                yield[ec]);

        BOOST_REQUIRE(!ec);
        BOOST_REQUIRE(quick);
    });

    ctx.run();
}

BOOST_AUTO_TEST_SUITE_END()
