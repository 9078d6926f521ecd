#pragma once

/**
 * @defgroup courier Courier
 */

/**
 * @defgroup courier-utils Utilities
 * @ingroup courier
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/serialize.hpp"
