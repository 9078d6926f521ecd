#pragma once

/**
 * @defgroup async Async
 * @ingroup courier
 */

#include "async/asio-execution-context.hpp"
#include "async/execution-broker.hpp"
#include "async/extended-futures.hpp"
