#pragma once

#include <string>

/**
 * @defgroup cli Command Line Utils
 * @ingroup courier-utils
 *
 * The `courier` method for parsing command-line arguments.
 */

namespace courier::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);

} // namespace courier::cli
