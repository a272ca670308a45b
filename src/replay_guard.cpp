#include "replay_guard.h"
#include "logger.h"

namespace httpsig {

InMemoryReplayGuard::InMemoryReplayGuard( size_t max_entries
                                        , Clock::duration retention)
    : _seen(max_entries)
    , _retention(retention)
{}

bool InMemoryReplayGuard::check_and_record(boost::string_view nonce, int64_t created)
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto now = Clock::now();
    std::string key(nonce);

    if (auto seen = _seen.get(key)) {
        if (now - *seen <= _retention) {
            LOG_WARN("Replayed nonce: ", nonce, " created: ", created);
            return false;
        }
    }

    _seen.put(key, now);
    return true;
}

void InMemoryReplayGuard::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _seen.clear();
}

size_t InMemoryReplayGuard::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _seen.size();
}

} // httpsig namespace
