#define BOOST_TEST_MODULE key_source
#include <boost/test/included/unit_test.hpp>

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include <async_sleep.h>
#include <error.h>
#include <key_source.h>

#include <namespaces.h>
#include "util/test_keys.h"

BOOST_AUTO_TEST_SUITE(httpsig_key_source)

using namespace std;
using namespace std::chrono;
using namespace httpsig;

using Key = util::Ed25519PublicKey;

using test::CryptoFixture;
BOOST_GLOBAL_FIXTURE(CryptoFixture);

static shared_ptr<KeySource> slow_source(const util::AsioExecutor& ex, milliseconds delay) {
    return make_shared<CallbackKeySource>("slow",
            [ex, delay] (const string&, Cancel& cancel, asio::yield_context yield)
            -> boost::optional<Key> {
                if (!async_sleep(ex, delay, cancel, yield)) return boost::none;
                return test::public_key();
            });
}

static shared_ptr<KeySource> failing_source() {
    return make_shared<CallbackKeySource>("failing",
            [] (const string&, Cancel&, asio::yield_context yield)
            -> boost::optional<Key> {
                return or_throw( yield, asio::error::connection_refused
                               , boost::optional<Key>());
            });
}

static shared_ptr<KeySource> throwing_source() {
    return make_shared<CallbackKeySource>("throwing",
            [] (const string&, Cancel&, asio::yield_context) -> boost::optional<Key> {
                throw std::runtime_error("key server unreachable");
            });
}

BOOST_AUTO_TEST_CASE(test_static_source) {
    asio::io_context ctx;
    auto source = make_shared<StaticKeySource>("static");
    source->add("k1", test::public_key());

    KeyResolver resolver({source});

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel cancel;
        sys::error_code ec;

        auto key = resolver.resolve(ctx.get_executor(), "k1", cancel, yield[ec]);
        BOOST_REQUIRE(!ec);
        BOOST_REQUIRE(key.serialize() == test::public_key().serialize());

        resolver.resolve(ctx.get_executor(), "k2", cancel, yield[ec]);
        BOOST_REQUIRE(ec == make_error_code(verification_error::public_key_not_found));

        BOOST_REQUIRE(source->remove("k1"));
        BOOST_REQUIRE_THROW( resolver.resolve(ctx.get_executor(), "k1", cancel, yield)
                           , sys::system_error);
    });

    ctx.run();
}

BOOST_AUTO_TEST_CASE(test_skip_failing_sources) {
    asio::io_context ctx;
    auto good = make_shared<StaticKeySource>("static");
    good->add("k1", test::public_key());

    KeyResolver resolver({failing_source(), throwing_source()});
    resolver.add_source(good);

    BOOST_REQUIRE_EQUAL(resolver.sources().size(), 3u);

    bool done = false;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel cancel;
        sys::error_code ec;
        resolver.resolve(ctx.get_executor(), "k1", cancel, yield[ec]);
        BOOST_REQUIRE(!ec);
        done = true;
    });

    ctx.run();
    BOOST_REQUIRE(done);
}

BOOST_AUTO_TEST_CASE(test_source_timeout) {
    asio::io_context ctx;
    auto ex = ctx.get_executor();

    auto fallback = make_shared<StaticKeySource>("static");
    fallback->add("k1", test::public_key());

    KeyResolver resolver({slow_source(ex, seconds(10)), fallback}, milliseconds(50));

    auto start = steady_clock::now();
    bool done = false;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel cancel;
        sys::error_code ec;
        resolver.resolve(ex, "k1", cancel, yield[ec]);
        BOOST_REQUIRE(!ec);
        done = true;
    });

    ctx.run();

    BOOST_REQUIRE(done);
    BOOST_REQUIRE(steady_clock::now() - start < seconds(5));
}

BOOST_AUTO_TEST_CASE(test_slow_source_in_time) {
    asio::io_context ctx;
    auto ex = ctx.get_executor();

    KeyResolver resolver({slow_source(ex, milliseconds(10))}, seconds(5));
    bool done = false;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel cancel;
        sys::error_code ec;
        resolver.resolve(ex, "any", cancel, yield[ec]);
        BOOST_REQUIRE(!ec);
        done = true;
    });

    ctx.run();
    BOOST_REQUIRE(done);
}

BOOST_AUTO_TEST_CASE(test_cancel) {
    asio::io_context ctx;
    auto ex = ctx.get_executor();

    KeyResolver resolver({slow_source(ex, seconds(10))}, seconds(20));
    Cancel cancel;
    sys::error_code ec;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        resolver.resolve(ex, "k1", cancel, yield[ec]);
    });

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel c;
        async_sleep(ex, milliseconds(20), c, yield);
        cancel();
    });

    ctx.run();
    BOOST_REQUIRE(ec == asio::error::operation_aborted);
}

BOOST_AUTO_TEST_CASE(test_async_sleep) {
    asio::io_context ctx;
    auto ex = ctx.get_executor();

    bool slept = false, aborted = false;
    Cancel cancel;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel c;
        slept = async_sleep(ex, milliseconds(5), c, yield);
    });

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        aborted = !async_sleep(ex, seconds(10), cancel, yield);
    });

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        Cancel c;
        async_sleep(ex, milliseconds(10), c, yield);
        cancel();
    });

    ctx.run();

    BOOST_REQUIRE(slept);
    BOOST_REQUIRE(aborted);
}

BOOST_AUTO_TEST_SUITE_END()
