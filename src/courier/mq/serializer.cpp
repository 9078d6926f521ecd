#include "serializer.hpp"

#include "courier/utils/base-include.hpp"
#include "courier/utils/serialize.hpp"

#include <cmath>

#include <nlohmann/json.hpp>

#include <sstream>

namespace courier::mq {

namespace {

  // ---------------------------------------------------------------------------------------- json

  class JsonOutputArchive final : public OutputArchive {
  private:
    nlohmann::json object_ = nlohmann::json::object();
    std::error_code ec_{};

  public:
    void write_bool(std::string_view name, bool value) override {
      object_[std::string{name}] = value;
    }
    void write_int(std::string_view name, int64_t value) override {
      object_[std::string{name}] = value;
    }
    void write_uint(std::string_view name, uint64_t value) override {
      object_[std::string{name}] = value;
    }
    void write_double(std::string_view name, double value) override {
      // json has no NaN or infinity; nlohmann would write `null`
      if (!std::isfinite(value)) {
        WARN("cannot encode non-finite double '{}' as json", name);
        ec_ = make_error_code(ecode::serialization_error);
        return;
      }
      object_[std::string{name}] = value;
    }
    void write_string(std::string_view name, std::string_view value) override {
      object_[std::string{name}] = std::string{value};
    }

    tl::expected<BufferType, std::error_code> finish() override {
      if (ec_)
        return tl::make_unexpected(ec_);
      try {
        return make_send_buffer(object_.dump());
      } catch (const nlohmann::json::exception& e) {
        WARN("failed to encode json: {}", e.what());
        return tl::make_unexpected(make_error_code(ecode::serialization_error));
      }
    }
  };

  class JsonInputArchive final : public InputArchive {
  private:
    nlohmann::json object_;

    const nlohmann::json* field_(std::string_view name) const {
      auto ii = object_.find(std::string{name});
      return (ii == object_.end()) ? nullptr : &*ii;
    }

    static std::error_code invalid_() { return make_error_code(ecode::invalid_data); }

  public:
    explicit JsonInputArchive(nlohmann::json object) : object_{std::move(object)} {}

    std::error_code read_bool(std::string_view name, bool& value) override {
      const auto* field = field_(name);
      if (field == nullptr || !field->is_boolean())
        return invalid_();
      value = field->get<bool>();
      return {};
    }

    std::error_code read_int(std::string_view name, int64_t& value) override {
      const auto* field = field_(name);
      if (field == nullptr || !field->is_number_integer())
        return invalid_();
      if (field->is_number_unsigned()) {
        const auto wide = field->get<uint64_t>();
        if (wide > uint64_t(std::numeric_limits<int64_t>::max()))
          return invalid_();
        value = int64_t(wide);
      } else {
        value = field->get<int64_t>();
      }
      return {};
    }

    std::error_code read_uint(std::string_view name, uint64_t& value) override {
      const auto* field = field_(name);
      if (field == nullptr || !field->is_number_unsigned())
        return invalid_();
      value = field->get<uint64_t>();
      return {};
    }

    std::error_code read_double(std::string_view name, double& value) override {
      const auto* field = field_(name);
      if (field == nullptr || !field->is_number())
        return invalid_();
      value = field->get<double>();
      return {};
    }

    std::error_code read_string(std::string_view name, std::string& value) override {
      const auto* field = field_(name);
      if (field == nullptr || !field->is_string())
        return invalid_();
      value = field->get<std::string>();
      return {};
    }

    std::error_code finish() override { return {}; }
  };

  // -------------------------------------------------------------------------------------- binary

  class BinaryOutputArchive final : public OutputArchive {
  private:
    std::ostringstream out_{};
    std::error_code ec_{};

  public:
    void write_bool(std::string_view, bool value) override {
      if (!ec_)
        ec_ = ::courier::write_bool(out_, value);
    }
    void write_int(std::string_view, int64_t value) override {
      if (!ec_)
        ec_ = ::courier::write_i64(out_, value);
    }
    void write_uint(std::string_view, uint64_t value) override {
      if (!ec_)
        ec_ = ::courier::write_u64(out_, value);
    }
    void write_double(std::string_view, double value) override {
      if (!ec_)
        ec_ = ::courier::write_f64(out_, value);
    }
    void write_string(std::string_view, std::string_view value) override {
      if (!ec_)
        ec_ = ::courier::write(out_, value);
    }

    tl::expected<BufferType, std::error_code> finish() override {
      if (ec_)
        return tl::make_unexpected(ec_);
      return make_send_buffer(std::string_view{out_.str()});
    }
  };

  class BinaryInputArchive final : public InputArchive {
  private:
    std::istringstream in_;

  public:
    explicit BinaryInputArchive(std::string data) : in_{std::move(data)} {}

    std::error_code read_bool(std::string_view, bool& value) override {
      return ::courier::read_bool(in_, value);
    }
    std::error_code read_int(std::string_view, int64_t& value) override {
      return ::courier::read_i64(in_, value);
    }
    std::error_code read_uint(std::string_view, uint64_t& value) override {
      return ::courier::read_u64(in_, value);
    }
    std::error_code read_double(std::string_view, double& value) override {
      return ::courier::read_f64(in_, value);
    }
    std::error_code read_string(std::string_view, std::string& value) override {
      return ::courier::read(in_, value);
    }

    // Trailing bytes mean the body was written for a different type
    std::error_code finish() override {
      if (in_.peek() != std::istringstream::traits_type::eof())
        return make_error_code(ecode::invalid_data);
      return {};
    }
  };

} // namespace

// ------------------------------------------------------------------------------------- serializers

std::unique_ptr<OutputArchive> JsonSerializer::make_output_archive() const {
  return std::make_unique<JsonOutputArchive>();
}

tl::expected<std::unique_ptr<InputArchive>, std::error_code>
JsonSerializer::make_input_archive(std::span<const std::byte> body) const {
  const auto text = str(body);
  auto object = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (object.is_discarded() || !object.is_object())
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  return std::make_unique<JsonInputArchive>(std::move(object));
}

std::unique_ptr<OutputArchive> BinarySerializer::make_output_archive() const {
  return std::make_unique<BinaryOutputArchive>();
}

tl::expected<std::unique_ptr<InputArchive>, std::error_code>
BinarySerializer::make_input_archive(std::span<const std::byte> body) const {
  return std::make_unique<BinaryInputArchive>(std::string{str(body)});
}

// ------------------------------------------------------------------------------ SerializerRegistry

std::shared_ptr<SerializerRegistry> SerializerRegistry::make_default() {
  auto registry = std::make_shared<SerializerRegistry>();
  registry->register_serializer(std::string{k_json}, std::make_shared<JsonSerializer>());
  registry->register_serializer(std::string{k_binary}, std::make_shared<BinarySerializer>());
  return registry;
}

void SerializerRegistry::register_serializer(std::string name,
                                             std::shared_ptr<const Serializer> serializer) {
  Expects(serializer != nullptr);
  if (default_name_.empty())
    default_name_ = name;
  serializers_.insert_or_assign(std::move(name), std::move(serializer));
}

std::error_code SerializerRegistry::set_default(std::string_view name) {
  if (serializers_.find(name) == serializers_.end())
    return make_error_code(ecode::argument_error);
  default_name_ = std::string{name};
  return {};
}

std::shared_ptr<const Serializer> SerializerRegistry::find(std::string_view name) const {
  auto ii = serializers_.find(name);
  return (ii == serializers_.end()) ? nullptr : ii->second;
}

std::shared_ptr<const Serializer> SerializerRegistry::lookup(std::string_view name) const {
  auto serializer = find(name);
  if (serializer == nullptr) {
    TRACE("no serializer named '{}', using default '{}'", name, default_name_);
    return default_serializer();
  }
  return serializer;
}

std::optional<std::string> SerializerRegistry::name_of(const Serializer& serializer) const {
  for (const auto& [name, registered] : serializers_)
    if (registered.get() == &serializer)
      return name;
  return std::nullopt;
}

} // namespace courier::mq
