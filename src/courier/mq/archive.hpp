#pragma once

#include "message.hpp"

#include "courier/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <boost/core/demangle.hpp>

#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

/**
 * Application messages describe their fields with a static `fields` template,
 * which works for reading and writing alike:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * struct AddRequest {
 *   int32_t x = 0;
 *   int32_t y = 0;
 *   template <typename Archive, typename Self> static void fields(Archive& ar, Self& self) {
 *     ar("x", self.x)("y", self.y);
 *   }
 * };
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace courier::mq {

// ----------------------------------------------------------------------------------- OutputArchive

/**
 * @brief Serializer-specific sink for named fields.
 */
class OutputArchive {
public:
  virtual ~OutputArchive() = default;

  virtual void write_bool(std::string_view name, bool value) = 0;
  virtual void write_int(std::string_view name, int64_t value) = 0;
  virtual void write_uint(std::string_view name, uint64_t value) = 0;
  virtual void write_double(std::string_view name, double value) = 0;
  virtual void write_string(std::string_view name, std::string_view value) = 0;

  /**
   * @brief Produce the encoded body; reports the first error of any `write_*` call.
   */
  virtual tl::expected<BufferType, std::error_code> finish() = 0;
};

// ------------------------------------------------------------------------------------ InputArchive

/**
 * @brief Serializer-specific source of named fields.
 */
class InputArchive {
public:
  virtual ~InputArchive() = default;

  virtual std::error_code read_bool(std::string_view name, bool& value) = 0;
  virtual std::error_code read_int(std::string_view name, int64_t& value) = 0;
  virtual std::error_code read_uint(std::string_view name, uint64_t& value) = 0;
  virtual std::error_code read_double(std::string_view name, double& value) = 0;
  virtual std::error_code read_string(std::string_view name, std::string& value) = 0;

  /**
   * @brief Called after the last field; an error if input remains unconsumed.
   */
  virtual std::error_code finish() = 0;
};

namespace detail {
template <typename T> inline constexpr bool always_false_v = false;

template <typename T>
inline constexpr bool is_string_field_v =
    std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>;
} // namespace detail

// ------------------------------------------------------------------------------------- FieldWriter

class FieldWriter {
private:
  OutputArchive& archive_;

public:
  explicit FieldWriter(OutputArchive& archive) : archive_{archive} {}

  template <typename T> FieldWriter& operator()(std::string_view name, const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
      archive_.write_bool(name, value);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
      archive_.write_int(name, int64_t(value));
    } else if constexpr (std::is_integral_v<T>) {
      archive_.write_uint(name, uint64_t(value));
    } else if constexpr (std::is_floating_point_v<T>) {
      archive_.write_double(name, double(value));
    } else if constexpr (detail::is_string_field_v<T>) {
      archive_.write_string(name, value);
    } else {
      static_assert(detail::always_false_v<T>, "unsupported message field type");
    }
    return *this;
  }
};

// ------------------------------------------------------------------------------------- FieldReader

/**
 * @brief Reads fields until the first error, which is then sticky.
 */
class FieldReader {
private:
  InputArchive& archive_;
  std::error_code ec_{};

  template <typename T, typename U> void narrow_(U wide, T& value) {
    if (wide < U(std::numeric_limits<T>::min()) || wide > U(std::numeric_limits<T>::max())) {
      ec_ = make_error_code(ecode::invalid_data);
      return;
    }
    value = T(wide);
  }

public:
  explicit FieldReader(InputArchive& archive) : archive_{archive} {}

  std::error_code error() const { return ec_; }

  template <typename T> FieldReader& operator()(std::string_view name, T& value) {
    if (ec_)
      return *this;
    if constexpr (std::is_same_v<T, bool>) {
      ec_ = archive_.read_bool(name, value);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
      int64_t wide = 0;
      ec_ = archive_.read_int(name, wide);
      if (!ec_)
        narrow_(wide, value);
    } else if constexpr (std::is_integral_v<T>) {
      uint64_t wide = 0;
      ec_ = archive_.read_uint(name, wide);
      if (!ec_)
        narrow_(wide, value);
    } else if constexpr (std::is_floating_point_v<T>) {
      double wide = 0.0;
      ec_ = archive_.read_double(name, wide);
      if (!ec_)
        value = T(wide);
    } else if constexpr (std::is_same_v<T, std::string>) {
      ec_ = archive_.read_string(name, value);
    } else {
      static_assert(detail::always_false_v<T>, "unsupported message field type");
    }
    return *this;
  }
};

// ----------------------------------------------------------------------------------------- Message

/**
 * @brief A default-constructible type that describes its fields to archives.
 */
template <typename T>
concept Message = std::default_initializable<T> && requires(FieldWriter& w, FieldReader& r,
                                                            const T& in, T& out) {
  T::fields(w, in);
  T::fields(r, out);
};

/**
 * @brief The runtime type name of `T`, as carried in `content_type`.
 */
template <typename T> std::string type_name() { return boost::core::demangle(typeid(T).name()); }

} // namespace courier::mq
