#include "cli-utils.hpp"

#include "base-include.hpp"

#include <stdexcept>

namespace courier::cli
{
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`.
 *
 * ~~~~~~~~~~~~~{.cpp}
 * // courier -s binary
 * if(arg == "-s") serializer = cli::safe_arg_str(argc, argv, i);
 * ~~~~~~~~~~~~~
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   const string arg = argv[i];
   ++i;
   if(i >= argc) throw std::runtime_error(format("expected string after argument '{}'", arg));
   return std::string(argv[i]);
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i` from command line
 *        arguments `argc` and `argv`. `i` must be in the range `[0..argc)`.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an integer.
 */
int safe_arg_int(int argc, char** argv, int& i)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   auto arg = argv[i];
   ++i;
   auto badness = (i >= argc);
   auto ret     = 0;

   if(!badness) {
      char* end     = nullptr;
      auto long_ret = strtol(argv[i], &end, 10);
      if(*argv[i] == '\0' or *end != '\0' or long_ret > std::numeric_limits<int>::max()
         or long_ret < std::numeric_limits<int>::lowest())
         badness = true;
      else
         ret = static_cast<int>(long_ret);
   }

   if(badness) throw std::runtime_error(format("expected integer after argument '{}'", arg));

   return ret;
}

} // namespace courier::cli
