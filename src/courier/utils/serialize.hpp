#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include "error-codes.hpp"

/**
 * @defgroup courier-io Input/Output
 * @ingroup courier-utils
 *
 * Little-endian binary primitives. Strings are written as a `u32` length
 * followed by the raw bytes. Doubles are written as their IEEE-754 bit pattern.
 * These back the `binary` message serializer.
 */

namespace courier
{
// ----------------------------------------------------------- Fundamental Types

error_code write_bool(std::ostream& out, bool x);
error_code write_i64(std::ostream& out, int64_t x);
error_code write_u32(std::ostream& out, uint32_t x);
error_code write_u64(std::ostream& out, uint64_t x);
error_code write_f64(std::ostream& out, double x);

error_code read_bool(std::istream& in, bool& x);
error_code read_i64(std::istream& in, int64_t& x);
error_code read_u32(std::istream& in, uint32_t& x);
error_code read_u64(std::istream& in, uint64_t& x);
error_code read_f64(std::istream& in, double& x);

// ----------------------------------------------------------- String/raw buffer

error_code write(std::ostream& out, std::string_view x);
error_code read(std::istream& in, std::string& x);

/**
 * @ingroup courier-io
 * @brief Upper bound on a single string read, guarding against corrupt lengths.
 */
constexpr uint32_t k_max_string_read = 64u * 1024u * 1024u;

} // namespace courier
