#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstddef>
#include <format>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "logger.hpp"
#include "transparent_hash.hpp"

namespace inference_gateway {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

void
parse_verbosity(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["verbose"]) {
    cfg.verbosity = parse_verbosity_level(root["verbose"].as<std::string>());
  } else if (root["verbosity"]) {
    cfg.verbosity = parse_verbosity_level(root["verbosity"].as<std::string>());
  }
}

auto
validate_required_keys(const YAML::Node& root, RuntimeConfig& cfg) -> bool
{
  const std::vector<std::string> required_keys{"address"};
  for (const auto& key : required_keys) {
    if (!root[key]) {
      log_error(std::string("Missing required key: ") + key);
      cfg.valid = false;
    }
  }
  return cfg.valid;
}

auto
validate_allowed_keys(const YAML::Node& root, RuntimeConfig& cfg) -> bool
{
  static const StringSet kAllowedKeys{
      "verbose",
      "verbosity",
      "address",
      "metrics_port",
      "max_message_bytes",
      "batching_enabled",
      "batch_timeout_ms",
      "min_batch_size",
      "dispatch_tick_ms",
      "no_runner_timeout_ms",
      "heartbeat_timeout_ms",
      "liveness_sweep_ms",
      "execution_timeout_ms",
      "fast_models",
      "big_models"};

  for (const auto& kvalue : root) {
    if (!kvalue.first.IsScalar()) {
      log_error("Configuration keys must be scalar strings");
      cfg.valid = false;
      continue;
    }
    const auto key = kvalue.first.as<std::string>();
    if (!kAllowedKeys.contains(key)) {
      log_error(std::string("Unknown configuration option: ") + key);
      cfg.valid = false;
    }
  }
  return cfg.valid;
}

auto
parse_positive_ms(const YAML::Node& root, const char* key)
    -> std::chrono::milliseconds
{
  const auto value = root[key].as<long long>();
  if (value <= 0) {
    throw std::invalid_argument(std::format("{} must be > 0", key));
  }
  return std::chrono::milliseconds(value);
}

void
parse_network_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["address"]) {
    cfg.server_address = root["address"].as<std::string>();
    if (cfg.server_address.empty()) {
      log_error("address must not be empty");
      cfg.valid = false;
    }
  }
  if (root["metrics_port"]) {
    cfg.metrics_port = root["metrics_port"].as<int>();
    if (cfg.metrics_port < kMinPort || cfg.metrics_port > kMaxPort) {
      log_error("metrics_port must be between 1 and 65535");
      cfg.valid = false;
    }
  }
  if (root["max_message_bytes"]) {
    const auto tmp = root["max_message_bytes"].as<long long>();
    if (tmp <= 0 || static_cast<unsigned long long>(tmp) >
                        static_cast<unsigned long long>(
                            std::numeric_limits<int>::max())) {
      throw std::invalid_argument(
          "max_message_bytes must be > 0 and fit in a gRPC message limit");
    }
    cfg.max_message_bytes = static_cast<std::size_t>(tmp);
  }
}

void
parse_batching_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["batching_enabled"]) {
    cfg.batching.enabled = root["batching_enabled"].as<bool>();
  }
  if (root["batch_timeout_ms"]) {
    cfg.batching.queue.batch_timeout =
        parse_positive_ms(root, "batch_timeout_ms");
  }
  if (root["min_batch_size"]) {
    const auto tmp = root["min_batch_size"].as<long long>();
    if (tmp < 1) {
      throw std::invalid_argument("min_batch_size must be >= 1");
    }
    cfg.batching.queue.min_batch_size = static_cast<std::size_t>(tmp);
  }
  if (root["dispatch_tick_ms"]) {
    cfg.batching.dispatch_tick = parse_positive_ms(root, "dispatch_tick_ms");
  }
  if (root["no_runner_timeout_ms"]) {
    cfg.batching.no_runner_timeout =
        parse_positive_ms(root, "no_runner_timeout_ms");
  }
  if (cfg.batching.no_runner_timeout < cfg.batching.queue.batch_timeout) {
    log_error("no_runner_timeout_ms must be >= batch_timeout_ms");
    cfg.valid = false;
  }
}

void
parse_runner_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["heartbeat_timeout_ms"]) {
    cfg.runners.heartbeat_timeout =
        parse_positive_ms(root, "heartbeat_timeout_ms");
  }
  if (root["liveness_sweep_ms"]) {
    cfg.runners.liveness_sweep = parse_positive_ms(root, "liveness_sweep_ms");
  }
  if (root["execution_timeout_ms"]) {
    cfg.runners.execution_timeout =
        parse_positive_ms(root, "execution_timeout_ms");
  }
}

auto
parse_model_list(const YAML::Node& node, const char* key)
    -> std::vector<std::string>
{
  if (!node.IsSequence()) {
    throw std::invalid_argument(std::format("{} must be a sequence", key));
  }
  auto models = node.as<std::vector<std::string>>();
  for (const auto& model : models) {
    if (model.empty()) {
      throw std::invalid_argument(
          std::format("{} entries must not be empty", key));
    }
  }
  return models;
}

void
parse_model_class_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["fast_models"]) {
    cfg.model_classes.fast =
        parse_model_list(root["fast_models"], "fast_models");
  }
  if (root["big_models"]) {
    cfg.model_classes.big = parse_model_list(root["big_models"], "big_models");
  }
}

}  // namespace

auto
parse_config(const YAML::Node& root) -> RuntimeConfig
{
  RuntimeConfig cfg;
  if (!root || !root.IsMap()) {
    log_error("Config root must be a mapping");
    cfg.valid = false;
    return cfg;
  }
  try {
    parse_verbosity(root, cfg);
    if (!validate_allowed_keys(root, cfg)) {
      return cfg;
    }
    if (!validate_required_keys(root, cfg)) {
      return cfg;
    }
    parse_network_nodes(root, cfg);
    parse_batching_nodes(root, cfg);
    parse_runner_nodes(root, cfg);
    parse_model_class_nodes(root, cfg);
  }
  catch (const YAML::Exception& exception) {
    log_error(std::string("Failed to load config: ") + exception.what());
    cfg.valid = false;
  }
  catch (const std::invalid_argument& exception) {
    log_error(std::string("Failed to load config: ") + exception.what());
    cfg.valid = false;
  }
  return cfg;
}

auto
load_config(const std::string& path) -> RuntimeConfig
{
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  }
  catch (const YAML::Exception& exception) {
    log_error(std::string("Failed to load config: ") + exception.what());
    RuntimeConfig cfg;
    cfg.config_path = path;
    cfg.valid = false;
    return cfg;
  }
  auto cfg = parse_config(root);
  cfg.config_path = path;
  return cfg;
}

}  // namespace inference_gateway
