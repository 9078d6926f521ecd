#pragma once

#include "archive.hpp"
#include "message.hpp"

#include <tl/expected.hpp>

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::mq {

// -------------------------------------------------------------------------------------- Serializer

/**
 * @brief A wire format for message bodies.
 *
 * A serializer creates one archive per message. Archives report errors rather than
 * throwing, but the codec still guards against a serializer that throws.
 */
class Serializer {
public:
  virtual ~Serializer() = default;

  virtual std::unique_ptr<OutputArchive> make_output_archive() const = 0;

  /**
   * @brief Prepare to read the fields of `body`. Fails if `body` is not well-formed
   *        for this format (e.g., not a json object).
   */
  virtual tl::expected<std::unique_ptr<InputArchive>, std::error_code>
  make_input_archive(std::span<const std::byte> body) const = 0;
};

/**
 * @brief Fields as a json object, keyed by field name.
 */
class JsonSerializer final : public Serializer {
public:
  std::unique_ptr<OutputArchive> make_output_archive() const override;
  tl::expected<std::unique_ptr<InputArchive>, std::error_code>
  make_input_archive(std::span<const std::byte> body) const override;
};

/**
 * @brief Fields in declaration order, little-endian, without names.
 */
class BinarySerializer final : public Serializer {
public:
  std::unique_ptr<OutputArchive> make_output_archive() const override;
  tl::expected<std::unique_ptr<InputArchive>, std::error_code>
  make_input_archive(std::span<const std::byte> body) const override;
};

// ------------------------------------------------------------------------------ SerializerRegistry

/**
 * @brief Serializers by name, with a default used whenever a name is absent or unknown.
 *
 * Populate the registry before handing it to an `EnvelopeCodec`; lookups are not
 * synchronized against registration.
 */
class SerializerRegistry {
private:
  std::map<std::string, std::shared_ptr<const Serializer>, std::less<>> serializers_{};
  std::string default_name_{};

public:
  static constexpr std::string_view k_json = "json";
  static constexpr std::string_view k_binary = "binary";

  /**
   * @brief A registry with `json` (the default) and `binary`.
   */
  static std::shared_ptr<SerializerRegistry> make_default();

  /**
   * @brief Register (or replace) `serializer` under `name`. The first serializer
   *        registered becomes the default.
   */
  void register_serializer(std::string name, std::shared_ptr<const Serializer> serializer);

  /**
   * @brief Make the serializer registered as `name` the default.
   * @return `ecode::argument_error` if nothing is registered under `name`.
   */
  std::error_code set_default(std::string_view name);

  /** @brief The serializer registered under `name`, or nullptr */
  std::shared_ptr<const Serializer> find(std::string_view name) const;

  /** @brief The serializer registered under `name`, or else the default */
  std::shared_ptr<const Serializer> lookup(std::string_view name) const;

  /** @brief The name `serializer` is registered under, if it is registered */
  std::optional<std::string> name_of(const Serializer& serializer) const;

  std::shared_ptr<const Serializer> default_serializer() const { return find(default_name_); }
  const std::string& default_name() const noexcept { return default_name_; }
};

} // namespace courier::mq
