#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include "namespaces.h"

#include "util/executor.h"
#include "util/signal.h"

namespace httpsig {

// Returns false if `cancel` fired before `duration` elapsed.
bool async_sleep( const util::AsioExecutor& exec
                , asio::steady_timer::duration duration
                , Cancel& cancel
                , asio::yield_context yield);

} // httpsig namespace
