#pragma once
#include <yaml-cpp/yaml.h>

#include <string>

#include "runtime_config.hpp"

namespace inference_gateway {

auto load_config(const std::string& path) -> RuntimeConfig;

/// Same validation as load_config, on an already loaded document.
auto parse_config(const YAML::Node& root) -> RuntimeConfig;

}  // namespace inference_gateway
