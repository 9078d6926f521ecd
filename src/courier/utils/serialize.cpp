
#include "serialize.hpp"

#include "base-include.hpp"

#include <boost/endian/conversion.hpp>

#include <bit>
#include <type_traits>

namespace courier
{
// --------------------------------------------------------------------- Helpers

/// @private
template<typename T> static error_code check_ios_ready(T& ios)
{
   Expects(uint32_t(ios.exceptions()) == 0);
   if(ios.rdstate() != std::ios_base::goodbit)
      return make_error_code(ecode::stream_not_ready);
   return error_code();
}

/// @private
template<typename T> static error_code check_ios(T& ios)
{
   Expects(uint32_t(ios.exceptions()) == 0);
   const auto state = ios.rdstate();
   if(state == std::ios_base::goodbit) return error_code();

   if(state & std::ios_base::badbit) return make_error_code(ecode::bad);

   if((state & std::ios_base::eofbit) and (state & std::ios_base::failbit))
      return make_error_code(ecode::premature_eof);

   return make_error_code(ecode::fail);
}

// -------------------------------------------------------------------- integers
/// @private
template<typename T> error_code write_intT(std::ostream& out, T x)
{
   try {
      auto ec = check_ios_ready(out);
      if(ec) return ec;

      // to little endian
      boost::endian::native_to_little_inplace(x);
      out.write(reinterpret_cast<char*>(&x), sizeof(x));
      return check_ios(out);
   } catch(...) {
      return make_error_code(ecode::exception_occurred);
   }
}

/// @private
template<typename T> error_code read_intT(std::istream& in, T& x)
{
   try {
      auto ec = check_ios_ready(in);
      if(ec) return ec;

      std::array<char, 8> buffer;
      static_assert(sizeof(x) <= buffer.size());

      in.read(&buffer[0], sizeof(x));
      ec = check_ios(in);
      if(ec) return ec;
      std::memcpy(&x, &buffer[0], sizeof(x)); // gracefully handle alignment
      boost::endian::little_to_native_inplace(x);
      return error_code();
   } catch(...) {
      return make_error_code(ecode::exception_occurred);
   }
}

/// @ingroup courier-io
error_code write_bool(std::ostream& out, bool x) { return write_intT(out, int8_t(x)); }

/// @ingroup courier-io
error_code write_i64(std::ostream& out, int64_t x) { return write_intT(out, x); }

/// @ingroup courier-io
error_code write_u32(std::ostream& out, uint32_t x) { return write_intT(out, x); }

/// @ingroup courier-io
error_code write_u64(std::ostream& out, uint64_t x) { return write_intT(out, x); }

/// @ingroup courier-io
error_code write_f64(std::ostream& out, double x)
{
   static_assert(std::numeric_limits<double>::is_iec559);
   return write_u64(out, std::bit_cast<uint64_t>(x));
}

/// @ingroup courier-io
error_code read_bool(std::istream& in, bool& x)
{
   int8_t y      = 0;
   const auto ec = read_intT(in, y);
   if(ec) return ec;
   if(y != 0 && y != 1) return make_error_code(ecode::invalid_data);
   x = (y == 1);
   return ec;
}

/// @ingroup courier-io
error_code read_i64(std::istream& in, int64_t& x) { return read_intT(in, x); }

/// @ingroup courier-io
error_code read_u32(std::istream& in, uint32_t& x) { return read_intT(in, x); }

/// @ingroup courier-io
error_code read_u64(std::istream& in, uint64_t& x) { return read_intT(in, x); }

/// @ingroup courier-io
error_code read_f64(std::istream& in, double& x)
{
   uint64_t i = 0;
   auto ec    = read_u64(in, i);
   if(!ec) x = std::bit_cast<double>(i);
   return ec;
}

// --------------------------------------------------------------------- strings
/// @ingroup courier-io
error_code write(std::ostream& out, std::string_view x)
{
   if(x.size() > std::numeric_limits<uint32_t>::max())
      return make_error_code(ecode::object_too_large);
   auto ec = write_u32(out, uint32_t(x.size()));
   if(ec) return ec;
   try {
      out.write(x.data(), std::streamsize(x.size()));
      return check_ios(out);
   } catch(...) {
      return make_error_code(ecode::exception_occurred);
   }
}

/// @ingroup courier-io
error_code read(std::istream& in, std::string& x)
{
   uint32_t sz = 0;
   auto ec     = read_u32(in, sz);
   if(ec) return ec;
   if(sz > k_max_string_read) return make_error_code(ecode::object_too_large);
   try {
      x.resize(sz);
      in.read(x.data(), std::streamsize(sz));
      return check_ios(in);
   } catch(...) {
      return make_error_code(ecode::exception_occurred);
   }
}

} // namespace courier
