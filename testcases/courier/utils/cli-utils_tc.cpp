#include "courier/utils/cli-utils.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace courier::cli::tests
{
CATCH_TEST_CASE("CliUtils", "[cli-utils]")
{
   std::vector<std::string> args = {"exec-name", "-n", "12", "-s", "binary", "-n", "twelve"};
   std::vector<char*> argv_s;
   const int argc = int(args.size());
   for(auto i = 0; i < argc; ++i) argv_s.push_back(args[std::size_t(i)].data());
   char** argv = argv_s.data();

   CATCH_SECTION("arguments are consumed in order")
   {
      int i = 1;
      CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 12);
      CATCH_REQUIRE(i == 2);
      i = 3;
      CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "binary");
      CATCH_REQUIRE(i == 4);
   }

   CATCH_SECTION("bad integers throw")
   {
      int i = 5;
      CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error);
   }

   CATCH_SECTION("a missing argument throws")
   {
      int i = argc - 1;
      CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
   }
}
} // namespace courier::cli::tests
