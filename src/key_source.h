#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/spawn.hpp>
#include <boost/optional.hpp>

#include "namespaces.h"
#include "util/crypto.h"
#include "util/executor.h"
#include "util/signal.h"

namespace httpsig {

// A place public keys can be fetched from by key id.
//
// `retrieve` returns `none` if the source does not know the key, and
// reports failures through `yield` (`yield[ec]` or an exception).
class KeySource {
public:
    virtual ~KeySource() = default;

    virtual std::string name() const = 0;

    virtual boost::optional<util::Ed25519PublicKey>
    retrieve(const std::string& key_id, Cancel&, asio::yield_context) = 0;
};

// Keys kept in memory.
class StaticKeySource : public KeySource {
public:
    explicit StaticKeySource( std::string name
                            , std::map<std::string, util::Ed25519PublicKey> keys = {});

    std::string name() const override { return _name; }

    boost::optional<util::Ed25519PublicKey>
    retrieve(const std::string& key_id, Cancel&, asio::yield_context) override;

    void add(const std::string& key_id, util::Ed25519PublicKey);
    bool remove(const std::string& key_id);

private:
    std::string _name;
    mutable std::mutex _mutex;
    std::map<std::string, util::Ed25519PublicKey> _keys;
};

// A source backed by a caller-provided asynchronous function,
// e.g. a lookup in a key server.
class CallbackKeySource : public KeySource {
public:
    using Retrieve = std::function<
        boost::optional<util::Ed25519PublicKey>
            (const std::string&, Cancel&, asio::yield_context)>;

    CallbackKeySource(std::string name, Retrieve);

    std::string name() const override { return _name; }

    boost::optional<util::Ed25519PublicKey>
    retrieve(const std::string& key_id, Cancel&, asio::yield_context) override;

private:
    std::string _name;
    Retrieve _retrieve;
};

// Tries key sources in order until one has the key.
//
// Each source gets at most `timeout`; a source which fails or times out
// is logged and skipped.
class KeyResolver {
public:
    using Duration = std::chrono::steady_clock::duration;

    explicit KeyResolver( std::vector<std::shared_ptr<KeySource>> sources = {}
                        , Duration timeout = std::chrono::seconds(5));

    // Reports `verification_error::public_key_not_found` when every
    // source was tried, and `asio::error::operation_aborted` if `cancel`
    // fires.
    util::Ed25519PublicKey resolve( const util::AsioExecutor&
                                  , const std::string& key_id
                                  , Cancel& cancel
                                  , asio::yield_context);

    void add_source(std::shared_ptr<KeySource>);
    const std::vector<std::shared_ptr<KeySource>>& sources() const { return _sources; }

    Duration timeout() const { return _timeout; }

private:
    std::vector<std::shared_ptr<KeySource>> _sources;
    Duration _timeout;
};

} // httpsig namespace
