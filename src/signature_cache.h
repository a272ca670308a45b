#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include <boost/optional.hpp>

#include "message.h"
#include "namespaces.h"
#include "util/lru_cache.h"

namespace httpsig {

/*
 * Signature headers of recently signed requests.
 *
 * Entries are keyed by a fingerprint of method, URL, sorted headers and
 * body.  An entry read after its TTL is treated as absent and dropped;
 * inserting beyond capacity evicts the least recently used entry.
 * All members are safe to call from several threads.
 */
class SignatureCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        http::fields headers;
        Clock::time_point created_at;
        Clock::duration ttl;
        std::string fingerprint;

        bool expired(Clock::time_point now) const { return now > created_at + ttl; }
    };

    static const size_t default_max_entries = 1000;

    explicit SignatureCache( size_t max_entries = default_max_entries
                           , Clock::duration default_ttl = std::chrono::seconds(300));

    boost::optional<http::fields> get(const SignableMessage&);

    // `ttl` defaults to the cache's default TTL.
    void put( const SignableMessage&
            , http::fields headers
            , boost::optional<Clock::duration> ttl = boost::none);

    void clear();
    size_t size() const;
    size_t max_size() const { return _max_entries; }

    // Drop every expired entry, returning how many were dropped.
    size_t cleanup_expired();

    // Hex SHA-256 over method, URL, lowercased and sorted headers and body.
    static std::string fingerprint(const SignableMessage&);

private:
    mutable std::mutex _mutex;
    size_t _max_entries;
    Clock::duration _default_ttl;
    util::LruCache<std::string, Entry> _entries;
};

} // httpsig namespace
