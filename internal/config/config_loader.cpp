#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace lnbridge::config {

namespace {

// Longest accepted timeout or interval: one day.
constexpr uint64_t kMaxDurationMs = 24ULL * 60 * 60 * 1000;

void RequireAtMost(const std::string& field, uint64_t value, uint64_t max) {
  if (value > max) {
    throw std::runtime_error("Invalid configuration: " + field + " must be at most " + std::to_string(max) + ", got " + std::to_string(value));
  }
}

bool IsPlainScalar(const YAML::Node& node) {
  // yaml-cpp tags quoted scalars "!" and plain ones "?"
  return node.Tag() != "!";
}

bool IsInteger(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end   = begin + text.size();
  if (text.front() == '-') {
    int64_t value  = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    return ec == std::errc() && ptr == end;
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

/*
  Integers are passed on as their decimal text: the JSON parser accepts
  quoted integers for every integer width, so uint64 values keep full
  precision and numeric text still fits string fields.
*/
void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (!IsPlainScalar(node)) {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  if (IsInteger(text)) {
    value->set_string_value(text);
    return;
  }

  char*        endptr = nullptr;
  const double number = std::strtod(text.c_str(), &endptr);
  if (!text.empty() && endptr && *endptr == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void YamlToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: mapping keys must be scalars");
        }
        YamlToValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

lnbridge::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }

  lnbridge::runtime::config::RuntimeConfig config;

  // an empty file is an empty mapping
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level of " + path + " must be a mapping");
    }

    google::protobuf::Value document;
    YamlToValue(yaml, &document);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(document, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(lnbridge::runtime::config::RuntimeConfig* config) {
  auto* node = config->mutable_node();
  if (node->host().empty()) {
    node->set_host("localhost:10009");
  }
  if (node->payment_timeout_seconds() == 0) {
    node->set_payment_timeout_seconds(60);
  }

  auto* payments = config->mutable_payments();
  if (payments->poll_interval_ms() == 0) {
    payments->set_poll_interval_ms(3000);
  }
  if (!payments->has_track_in_flight()) {
    payments->set_track_in_flight(true);
  }
}

void ConfigLoader::Validate(const lnbridge::runtime::config::RuntimeConfig& config) {
  if (config.node().tls_cert_path().empty()) {
    throw std::runtime_error("Invalid configuration: node.tls_cert_path is required");
  }
  if (config.node().macaroon_path().empty()) {
    throw std::runtime_error("Invalid configuration: node.macaroon_path is required");
  }

  RequireAtMost("node.rpc_timeout_ms", config.node().rpc_timeout_ms(), kMaxDurationMs);
  RequireAtMost("node.connect_timeout_ms", config.node().connect_timeout_ms(), kMaxDurationMs);
  RequireAtMost("node.payment_timeout_seconds", config.node().payment_timeout_seconds(), kMaxDurationMs / 1000);
  RequireAtMost("payments.poll_interval_ms", config.payments().poll_interval_ms(), kMaxDurationMs);
}

} // namespace lnbridge::config
