#pragma once

#include <string>
#include <vector>

#include "robotics_uri/resolver.hpp"

namespace robotics_uri {

// How a root, a package name and a sub-path are joined into a candidate.
struct LayoutRule {
  const char* name;
  const char* prefix; // inserted between root and package name, may be empty
};

struct SchemeRules {
  Scheme scheme;
  const char* uri_prefix; // "package://"
  std::vector<const char*> primary_env;
  std::vector<const char*> alias_env;
  std::vector<LayoutRule> layouts;
};

const SchemeRules& rules_for(Scheme scheme);
const std::vector<SchemeRules>& all_scheme_rules();

std::string join_candidate(const std::string& root, const LayoutRule& layout, const RoboticsUri& uri);

// resolve() with each candidate logged through log_line() when `verbose`.
std::string resolve_logged(const RoboticsUri& uri, const std::vector<SearchRoot>& roots, bool verbose);

std::string format_probe_list(const std::vector<Probe>& probes);

void log_line(const std::string& message);

} // namespace robotics_uri
