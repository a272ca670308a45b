#include "signature_cache.h"
#include "logger.h"
#include "util/bytes.h"
#include "util/hash.h"

#include <algorithm>

namespace httpsig {

SignatureCache::SignatureCache(size_t max_entries, Clock::duration default_ttl)
    : _max_entries(max_entries)
    , _default_ttl(default_ttl)
    , _entries(max_entries, [] (const std::string& key, const Entry&) {
            LOG_DEBUG("Signature cache: evicted ", key);
        })
{}

std::string SignatureCache::fingerprint(const SignableMessage& m)
{
    auto headers = header_list(m.headers());
    std::stable_sort(headers.begin(), headers.end());

    util::SHA256 hash;
    hash.update(m.method_string());
    hash.update("|");
    hash.update(m.url());
    hash.update("|");
    for (const auto& h : headers) {
        hash.update(h.first);
        hash.update(":");
        hash.update(h.second);
        hash.update("\n");
    }
    hash.update("|");
    if (m.body()) hash.update(*m.body());

    return util::bytes::to_hex(hash.close());
}

boost::optional<http::fields> SignatureCache::get(const SignableMessage& m)
{
    auto key = fingerprint(m);

    std::lock_guard<std::mutex> lock(_mutex);

    auto e = _entries.get(key);

    if (!e) {
        LOG_DEBUG("Signature cache miss: ", key);
        return boost::none;
    }

    if (e->expired(Clock::now())) {
        LOG_DEBUG("Signature cache entry expired: ", key);
        _entries.erase(key);
        return boost::none;
    }

    LOG_DEBUG("Signature cache hit: ", key);
    return e->headers;
}

void SignatureCache::put( const SignableMessage& m
                        , http::fields headers
                        , boost::optional<Clock::duration> ttl)
{
    auto key = fingerprint(m);

    Entry e{ std::move(headers)
           , Clock::now()
           , ttl ? *ttl : _default_ttl
           , key };

    std::lock_guard<std::mutex> lock(_mutex);
    _entries.put(key, std::move(e));
}

void SignatureCache::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _entries.clear();
}

size_t SignatureCache::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _entries.size();
}

size_t SignatureCache::cleanup_expired()
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto now = Clock::now();
    size_t dropped = 0;

    for (auto i = _entries.begin(); i != _entries.end();) {
        if (i->second.expired(now)) {
            i = _entries.erase(i);
            ++dropped;
        } else {
            ++i;
        }
    }

    return dropped;
}

} // httpsig namespace
