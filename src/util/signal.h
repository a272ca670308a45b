#pragma once

#include <functional>

#include <boost/asio/error.hpp>
#include <boost/intrusive/list.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"

#include "../or_throw.h"

namespace httpsig {

// One-shot broadcast of a call to every connected slot.
// A connection detaches itself when destroyed.
template<typename T>
class Signal {
private:
    template<class K>
    using List = boost::intrusive::list<K, boost::intrusive::constant_time_size<false>>;
    using Hook = boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>;

public:
    class Connection : public Hook
    {
    public:
        Connection() = default;

        Connection(Connection&& other)
            : _slot(std::move(other._slot))
            , _call_count(other._call_count)
        {
            other._call_count = 0;
            other.swap_nodes(*this);
        }

        Connection& operator=(Connection&& other) {
            _slot = std::move(other._slot);
            _call_count = other._call_count;
            other._call_count = 0;
            other.swap_nodes(*this);
            return *this;
        }

        size_t call_count() const { return _call_count; }

        operator bool() const { return call_count() != 0; }

    private:
        friend class Signal;
        std::function<T> _slot;
        size_t _call_count = 0;
    };

public:
    Signal()                    = default;

    Signal(const Signal&)            = delete;
    Signal& operator=(const Signal&) = delete;

    // A child signal fires whenever `parent` does,
    // but can also be fired on its own.
    Signal(Signal& parent)
        : _parent_connection(parent.connect(call_to_self()))
    {}

    template<typename... Args>
    void operator()(Args&&... args)
    {
        ++_call_count;

        auto connections = std::move(_connections);
        for (auto& connection : connections) {
            ++connection._call_count;
            connection._slot(std::forward<Args>(args)...);
        }
    }

    size_t call_count() const { return _call_count; }

    operator bool() const { return call_count() != 0; }

    Connection connect(std::function<T> slot)
    {
        Connection connection;
        connection._slot = std::move(slot);
        _connections.push_back(connection);
        return connection;
    }

    size_t size() const { return _connections.size(); }

private:
    auto call_to_self() {
        return [&] (auto&&... args) {
                    (*this)(std::forward<decltype(args)>(args)...);
               };
    }

private:
    List<Connection> _connections;
    size_t _call_count = 0;
    Connection _parent_connection;
};

using Cancel = Signal<void()>;

// The error to report after an async call which may have been cancelled,
// regardless of whether the call itself knows about `cancel`.
inline
sys::error_code
compute_error_code( const sys::error_code& ec
                  , const Cancel& cancel)
{
    if (cancel) return asio::error::operation_aborted;
    return ec;
}

// Usage:
//
// int foo(Cancel& cancel, yield_context yield) {
//     sys::error_code ec;
//     int ret = my_async_operation(cancel, yield[ec]);
//     return_or_throw_on_error(yield, cancel, ec, int(0));
//     ...
// }
#define return_or_throw_on_error(yield, cancel, ec, ...) { \
    sys::error_code ec_ = compute_error_code(ec, cancel); \
    if (ec_) return or_throw(yield, ec_, ##__VA_ARGS__); \
}

} // httpsig namespace
