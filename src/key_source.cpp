#include "key_source.h"
#include "error.h"
#include "logger.h"
#include "util/timeout.h"

namespace httpsig {

StaticKeySource::StaticKeySource( std::string name
                                , std::map<std::string, util::Ed25519PublicKey> keys)
    : _name(std::move(name))
    , _keys(std::move(keys))
{}

boost::optional<util::Ed25519PublicKey>
StaticKeySource::retrieve(const std::string& key_id, Cancel&, asio::yield_context)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto i = _keys.find(key_id);
    if (i == _keys.end()) return boost::none;
    return i->second;
}

void StaticKeySource::add(const std::string& key_id, util::Ed25519PublicKey key)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _keys[key_id] = std::move(key);
}

bool StaticKeySource::remove(const std::string& key_id)
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _keys.erase(key_id) != 0;
}

CallbackKeySource::CallbackKeySource(std::string name, Retrieve retrieve)
    : _name(std::move(name))
    , _retrieve(std::move(retrieve))
{}

boost::optional<util::Ed25519PublicKey>
CallbackKeySource::retrieve(const std::string& key_id, Cancel& cancel, asio::yield_context yield)
{
    return _retrieve(key_id, cancel, yield);
}

KeyResolver::KeyResolver( std::vector<std::shared_ptr<KeySource>> sources
                        , Duration timeout)
    : _sources(std::move(sources))
    , _timeout(timeout)
{}

void KeyResolver::add_source(std::shared_ptr<KeySource> source)
{
    _sources.push_back(std::move(source));
}

util::Ed25519PublicKey KeyResolver::resolve( const util::AsioExecutor& ex
                                           , const std::string& key_id
                                           , Cancel& cancel
                                           , asio::yield_context yield)
{
    using Key = util::Ed25519PublicKey;

    for (const auto& source : _sources) {
        if (cancel) {
            return or_throw<Key>(yield, asio::error::operation_aborted);
        }

        sys::error_code ec;
        boost::optional<Key> key;

        try {
            key = util::with_timeout(ex, cancel, _timeout,
                    [&] (Cancel& c, asio::yield_context y) {
                        return source->retrieve(key_id, c, y);
                    },
                    yield[ec]);
        }
        catch (const std::exception& e) {
            LOG_WARN("Key source ", source->name(), " failed for key ", key_id, ": ", e.what());
            continue;
        }

        if (cancel) {
            return or_throw<Key>(yield, asio::error::operation_aborted);
        }

        if (ec) {
            LOG_WARN("Key source ", source->name(), " failed for key ", key_id, ": ", ec);
            continue;
        }

        if (key) {
            LOG_DEBUG("Key ", key_id, " found in source ", source->name());
            return *key;
        }
    }

    return or_throw<Key>(yield, verification_error::public_key_not_found);
}

} // httpsig namespace
