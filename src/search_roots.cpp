/// NowTechnologies Zrt. All rights reserved.
/// Search root collection from caller directories and environment variables.
/// Author: nilseuropa <marton@nowtech.hu>
/// Created: 2026.10.19

#include "robotics_uri/resolver.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#include "resolver_internal.hpp"

namespace robotics_uri {

// Tried per root, in this order, before moving to the next root.
static const std::vector<LayoutRule> kLayouts = {
  {"direct", ""},
  {"share", "share"},
};

// Each scheme consults its own ecosystem first and the other one as aliases.
// ROS_PACKAGE_PATH: ROS 1, AMENT_PREFIX_PATH: ROS 2,
// GAZEBO_MODEL_PATH: Gazebo Classic, SDF_PATH: sdformat,
// IGN_GAZEBO_RESOURCE_PATH: Ignition Gazebo <= 7, GZ_SIM_RESOURCE_PATH: Gazebo Sim >= 7.
static const std::vector<SchemeRules> kSchemeRules = {
  {Scheme::Package,
   "package://",
   {"ROS_PACKAGE_PATH", "AMENT_PREFIX_PATH"},
   {"GZ_SIM_RESOURCE_PATH", "IGN_GAZEBO_RESOURCE_PATH", "GAZEBO_MODEL_PATH", "SDF_PATH"},
   kLayouts},
  {Scheme::Model,
   "model://",
   {"GZ_SIM_RESOURCE_PATH", "IGN_GAZEBO_RESOURCE_PATH", "GAZEBO_MODEL_PATH", "SDF_PATH"},
   {"ROS_PACKAGE_PATH", "AMENT_PREFIX_PATH"},
   kLayouts},
};

const char* const kGenericEnvVar = "ROBOTICS_URI_PATH";

const std::vector<SchemeRules>& all_scheme_rules() {
  return kSchemeRules;
}

const SchemeRules& rules_for(Scheme scheme) {
  for (const auto& rules : kSchemeRules) {
    if (rules.scheme == scheme) {
      return rules;
    }
  }
  return kSchemeRules.front();
}

const char* to_string(Provenance provenance) {
  switch (provenance) {
    case Provenance::Caller:     return "caller";
    case Provenance::Config:     return "config";
    case Provenance::EnvCustom:  return "custom env";
    case Provenance::EnvPrimary: return "primary env";
    case Provenance::EnvAlias:   return "alias env";
    case Provenance::EnvGeneric: return "generic env";
    case Provenance::FileUri:    return "file uri";
  }
  return "unknown";
}

std::vector<std::string> split_path_list(const std::string& value, char separator) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(separator, start);
    std::string item = (end == std::string::npos) ? value.substr(start) : value.substr(start, end - start);
    if (!item.empty()) {
      out.push_back(item);
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return out;
}

std::vector<std::string> primary_env_vars(Scheme scheme) {
  const auto& names = rules_for(scheme).primary_env;
  return std::vector<std::string>(names.begin(), names.end());
}

std::vector<std::string> alias_env_vars(Scheme scheme) {
  const auto& names = rules_for(scheme).alias_env;
  return std::vector<std::string>(names.begin(), names.end());
}

Environment process_environment(const std::vector<std::string>& extra_names) {
  Environment env;
  auto capture = [&env](const std::string& name) {
    if (env.count(name)) {
      return;
    }
    const char* v = std::getenv(name.c_str());
    if (v) {
      env[name] = v;
    }
  };
  for (const auto& rules : kSchemeRules) {
    for (const char* name : rules.primary_env)
      capture(name);
    for (const char* name : rules.alias_env)
      capture(name);
  }
  capture(kGenericEnvVar);
  for (const auto& name : extra_names)
    capture(name);
  return env;
}

namespace {

void append_from_env(const Environment& env,
                     const std::string& name,
                     Provenance provenance,
                     std::vector<SearchRoot>* out) {
  auto it = env.find(name);
  if (it == env.end() || it->second.empty()) {
    return;
  }
  for (auto& dir : split_path_list(it->second)) {
    out->push_back(SearchRoot{dir, provenance, name});
  }
}

} // namespace

std::vector<SearchRoot> collect_roots(Scheme scheme,
                                      const std::vector<std::string>& caller_dirs,
                                      const Environment& env,
                                      const std::vector<std::string>& extra_env_vars) {
  const SchemeRules& rules = rules_for(scheme);
  std::vector<SearchRoot> roots;

  for (const auto& dir : caller_dirs) {
    if (!dir.empty()) {
      roots.push_back(SearchRoot{dir, Provenance::Caller, std::string()});
    }
  }
  for (const auto& name : extra_env_vars)
    append_from_env(env, name, Provenance::EnvCustom, &roots);
  for (const char* name : rules.primary_env)
    append_from_env(env, name, Provenance::EnvPrimary, &roots);
  for (const char* name : rules.alias_env)
    append_from_env(env, name, Provenance::EnvAlias, &roots);
  append_from_env(env, kGenericEnvVar, Provenance::EnvGeneric, &roots);

  return roots;
}

} // namespace robotics_uri
