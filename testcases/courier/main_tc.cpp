#include "stdinc.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>
#include <vector>

namespace courier {
int main(int argc, char** argv);
}

namespace courier::tests {

namespace {
  int run_demo(std::vector<std::string> args) {
    args.insert(args.begin(), "courier");
    std::vector<char*> argv;
    for (auto& arg : args)
      argv.push_back(arg.data());
    argv.push_back(nullptr);
    return ::courier::main(int(args.size()), argv.data());
  }
} // namespace

CATCH_TEST_CASE("Demo", "[main]") {
  CATCH_SECTION("the grid size is bounded") {
    CATCH_REQUIRE(run_demo({"-n", "0"}) == EXIT_FAILURE);
    CATCH_REQUIRE(run_demo({"-n", "-3"}) == EXIT_FAILURE);
    CATCH_REQUIRE(run_demo({"-n", "1001"}) == EXIT_FAILURE);
    CATCH_REQUIRE(run_demo({"-n", "100000"}) == EXIT_FAILURE);
  }

  CATCH_SECTION("bad arguments fail") {
    CATCH_REQUIRE(run_demo({"--frobnicate"}) == EXIT_FAILURE);
    CATCH_REQUIRE(run_demo({"-n"}) == EXIT_FAILURE);
    CATCH_REQUIRE(run_demo({"-s", "xml"}) == EXIT_FAILURE);
    CATCH_REQUIRE(run_demo({"-D", "no-equals-sign"}) == EXIT_FAILURE);
  }

  CATCH_SECTION("a small grid runs to completion") {
    CATCH_REQUIRE(run_demo({"-n", "2"}) == EXIT_SUCCESS);
    CATCH_REQUIRE(run_demo({"-n", "2", "-s", "binary"}) == EXIT_SUCCESS);
  }
}

} // namespace courier::tests
