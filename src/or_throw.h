#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/system/system_error.hpp>
#include "namespaces.h"

namespace httpsig {

/*
 * Coroutine functions in this library take an `asio::yield_context` and
 * may be called either as
 *
 *     auto key = resolver.resolve(ex, id, cancel, yield);      // throws
 *
 * or as
 *
 *     sys::error_code ec;
 *     auto key = resolver.resolve(ex, id, cancel, yield[ec]);  // sets `ec`
 *
 * The callee does not know which of the two forms was used, so it reports
 * errors with
 *
 *     return or_throw(yield, ec, value);
 *
 * which sets the caller's error code when there is one and throws a
 * `sys::system_error` otherwise.
 */

template<class Ret>
inline
Ret or_throw( asio::yield_context yield
            , const sys::error_code& ec
            , Ret&& ret = {})
{
    if (!ec) return std::forward<Ret>(ret);
    if (yield.ec_) { *yield.ec_ = ec; }
    else { throw sys::system_error(ec); }
    return std::forward<Ret>(ret);
}

inline
void or_throw(asio::yield_context yield, const sys::error_code& ec)
{
    if (!ec) return;
    if (yield.ec_) { *yield.ec_ = ec; }
    else { throw sys::system_error(ec); }
}

} // httpsig namespace
