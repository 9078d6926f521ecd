#include "courier/utils/serialize.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <sstream>

namespace courier::tests
{
CATCH_TEST_CASE("Serialize", "[serialize]")
{
   CATCH_SECTION("primitives are little-endian, and read back")
   {
      std::stringstream ss;
      CATCH_REQUIRE(!write_bool(ss, true));
      CATCH_REQUIRE(!write_i64(ss, -2));
      CATCH_REQUIRE(!write_u32(ss, 0x01020304u));
      CATCH_REQUIRE(!write_u64(ss, std::numeric_limits<uint64_t>::max()));
      CATCH_REQUIRE(!write_f64(ss, 0.25));
      CATCH_REQUIRE(!write(ss, std::string_view{"hello"}));

      const auto data = ss.str();
      CATCH_REQUIRE(data.size() == 1 + 8 + 4 + 8 + 8 + 4 + 5);
      CATCH_REQUIRE(data[9] == 0x04); // low byte of the u32 first
      CATCH_REQUIRE(data[12] == 0x01);

      bool b        = false;
      int64_t i     = 0;
      uint32_t u    = 0;
      uint64_t v    = 0;
      double d      = 0.0;
      std::string s = {};
      CATCH_REQUIRE(!read_bool(ss, b));
      CATCH_REQUIRE(!read_i64(ss, i));
      CATCH_REQUIRE(!read_u32(ss, u));
      CATCH_REQUIRE(!read_u64(ss, v));
      CATCH_REQUIRE(!read_f64(ss, d));
      CATCH_REQUIRE(!read(ss, s));

      CATCH_REQUIRE(b == true);
      CATCH_REQUIRE(i == -2);
      CATCH_REQUIRE(u == 0x01020304u);
      CATCH_REQUIRE(v == std::numeric_limits<uint64_t>::max());
      CATCH_REQUIRE(d == 0.25);
      CATCH_REQUIRE(s == "hello");
   }

   CATCH_SECTION("a bool must be 0 or 1")
   {
      std::stringstream ss{std::string{"\x02", 1}};
      bool b = false;
      CATCH_REQUIRE(read_bool(ss, b) == make_error_code(ecode::invalid_data));
   }

   CATCH_SECTION("short input is a premature eof")
   {
      std::stringstream ss{std::string{"\x01\x02\x03", 3}};
      uint64_t v = 0;
      CATCH_REQUIRE(read_u64(ss, v) == make_error_code(ecode::premature_eof));
   }

   CATCH_SECTION("oversized string lengths are rejected before allocating")
   {
      std::stringstream ss;
      CATCH_REQUIRE(!write_u32(ss, k_max_string_read + 1));
      std::string s;
      CATCH_REQUIRE(read(ss, s) == make_error_code(ecode::object_too_large));
   }
}

} // namespace courier::tests
