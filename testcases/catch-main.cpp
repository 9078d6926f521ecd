// The testcase runner's `main`; everything else in the testcases build is in `*_tc.cpp`.
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
