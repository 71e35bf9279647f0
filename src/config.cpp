/// NowTechnologies Zrt. All rights reserved.
/// YAML configuration of additional search paths and variables.
/// Author: nilseuropa <marton@nowtech.hu>
/// Created: 2026.10.19

#include "robotics_uri/resolver.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace robotics_uri {

namespace {

// Accepts either a sequence of strings or a single separator-joined scalar.
static std::vector<std::string> readStringList(const YAML::Node& node, const std::string& key, const std::string& path) {
  std::vector<std::string> out;
  if (!node || node.IsNull()) {
    return out;
  }
  try {
    if (node.IsScalar()) {
      return split_path_list(node.as<std::string>());
    }
    if (node.IsSequence()) {
      out.reserve(node.size());
      for (const auto& item : node) {
        if (!item.IsScalar()) {
          throw ConfigError("'" + key + "' entries must be strings in " + path);
        }
        auto value = item.as<std::string>();
        if (!value.empty()) {
          out.push_back(value);
        }
      }
      return out;
    }
  } catch (const YAML::Exception& e) {
    throw ConfigError("Invalid '" + key + "' in " + path + ": " + e.what());
  }
  throw ConfigError("'" + key + "' must be a list of strings in " + path);
}

} // namespace

Config load_config(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw ConfigError("Cannot open config file " + path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("Failed to parse config file " + path + ": " + e.what());
  }

  Config config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("Config file " + path + " must contain a mapping");
  }

  std::error_code ec;
  fs::path base = fs::absolute(fs::path(path), ec).parent_path();
  if (ec) {
    base = fs::path(path).parent_path();
  }
  for (const auto& dir : readStringList(root["search_paths"], "search_paths", path)) {
    fs::path p(dir);
    config.search_paths.push_back(p.is_absolute() ? p.string() : (base / p).lexically_normal().string());
  }
  config.env_vars = readStringList(root["env_vars"], "env_vars", path);
  return config;
}

} // namespace robotics_uri
