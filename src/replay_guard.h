#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <boost/utility/string_view.hpp>

#include "util/lru_cache.h"

namespace httpsig {

// Remembers signature nonces to detect replays.
class ReplayGuard {
public:
    virtual ~ReplayGuard() = default;

    // Record `nonce` and return true, or return false if it was
    // already recorded.
    virtual bool check_and_record(boost::string_view nonce, int64_t created) = 0;

    virtual void clear() = 0;
};

// Nonces of this process only, kept in a bounded LRU set.
//
// Replays across processes, across instances of a service or after a
// restart are NOT detected.  Deployments with more than one instance
// need a `ReplayGuard` over a shared store.
class InMemoryReplayGuard : public ReplayGuard {
public:
    using Clock = std::chrono::steady_clock;

    static const size_t default_max_entries = 10000;

    InMemoryReplayGuard( size_t max_entries = default_max_entries
                       , Clock::duration retention = std::chrono::hours(1));

    bool check_and_record(boost::string_view nonce, int64_t created) override;
    void clear() override;

    size_t size() const;

private:
    mutable std::mutex _mutex;
    util::LruCache<std::string, Clock::time_point> _seen;
    Clock::duration _retention;
};

} // httpsig namespace
