#pragma once

#include <memory>

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>

#include "executor.h"
#include "signal.h"

namespace httpsig { namespace util {

// Fires `abort_signal()` when either `duration` elapses
// or the outer `signal` fires, whichever happens first.
class Timeout {
    struct State {
        asio::steady_timer timer;
        Signal<void()> local_abort_signal;
        bool finished = false;
        bool expired = false;

        State(const AsioExecutor& ex)
            : timer(ex)
        {}
    };

public:
    template<class Duration>
    Timeout( const AsioExecutor& ex
           , Signal<void()>& signal
           , Duration duration)
        : _state(std::make_shared<State>(ex))
    {
        _signal_connection = signal.connect([s = _state] {
                if (s->local_abort_signal.call_count() == 0) {
                    s->local_abort_signal();
                }
            });

        asio::spawn(ex, [s = _state, duration] (asio::yield_context yield) {
                if (s->finished) return;

                sys::error_code ec;

                s->timer.expires_after(duration);
                s->timer.async_wait(yield[ec]);

                if (s->finished) return;

                if (s->local_abort_signal.call_count() == 0) {
                    s->expired = true;
                    s->local_abort_signal();
                }
            });
    }

    Timeout(const Timeout&) = delete;
    Timeout& operator=(const Timeout&) = delete;

    Signal<void()>& abort_signal()
    {
        return _state->local_abort_signal;
    }

    // True only if the timer (not the outer signal) fired.
    bool timed_out() const
    {
        return _state->expired;
    }

    ~Timeout()
    {
        _state->finished = true;
        _state->timer.cancel();
    }

private:
    std::shared_ptr<State> _state;
    Signal<void()>::Connection _signal_connection;
};

// Run `f(cancel, yield[ec])` and abort it after `duration`.
// A timeout is reported as `asio::error::timed_out`,
// an abort through `abort_signal` as `asio::error::operation_aborted`.
template<class Duration, class F>
auto with_timeout( const AsioExecutor& ex
                 , Signal<void()>& abort_signal
                 , Duration duration
                 , const F& f
                 , asio::yield_context yield)
{
    Timeout timeout(ex, abort_signal, duration);

    sys::error_code ec;

    auto ret = f(timeout.abort_signal(), yield[ec]);

    if (timeout.timed_out()) {
        ec = asio::error::timed_out;
    } else if (abort_signal) {
        ec = asio::error::operation_aborted;
    }

    return or_throw(yield, ec, std::move(ret));
}

}} // namespaces
