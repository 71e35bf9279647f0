/// NowTechnologies Zrt. All rights reserved.
/// Parsing of package:// and model:// resource identifiers.
/// Author: nilseuropa <marton@nowtech.hu>
/// Created: 2026.10.19

#include "robotics_uri/resolver.hpp"

#include <string>
#include <vector>

#include "resolver_internal.hpp"

namespace robotics_uri {

namespace {

static bool starts_with(const std::string& s, const char* prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Splits on '/', dropping empty segments produced by "//" or a trailing '/'.
static std::vector<std::string> split_segments(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('/', start);
    std::string seg = (end == std::string::npos) ? text.substr(start) : text.substr(start, end - start);
    if (!seg.empty()) {
      out.push_back(seg);
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return out;
}

} // namespace

const char* to_string(Scheme scheme) {
  switch (scheme) {
    case Scheme::Package: return "package";
    case Scheme::Model:   return "model";
  }
  return "unknown";
}

bool scheme_from_string(const std::string& name, Scheme* out) {
  for (const auto& rules : all_scheme_rules()) {
    if (name == to_string(rules.scheme)) {
      if (out) {
        *out = rules.scheme;
      }
      return true;
    }
  }
  return false;
}

std::string RoboticsUri::relative_path() const {
  std::string result = package_name;
  for (const auto& seg : sub_path) {
    result += "/" + seg;
  }
  return result;
}

std::string RoboticsUri::to_string() const {
  return std::string(robotics_uri::to_string(scheme)) + "://" + relative_path();
}

RoboticsUri parse_uri(const std::string& uri) {
  const SchemeRules* matched = nullptr;
  for (const auto& rules : all_scheme_rules()) {
    if (starts_with(uri, rules.uri_prefix)) {
      matched = &rules;
      break;
    }
  }
  if (!matched) {
    auto pos = uri.find("://");
    std::string scheme = (pos == std::string::npos) ? std::string() : uri.substr(0, pos);
    std::string msg = scheme.empty() ? "URI has no scheme, expected package:// or model://"
                                     : "Unsupported URI scheme '" + scheme + "'";
    throw ResolutionError(ErrorKind::UnsupportedScheme, uri, msg);
  }

  std::string rest = uri.substr(std::char_traits<char>::length(matched->uri_prefix));
  auto slash = rest.find('/');
  std::string name = rest.substr(0, slash);
  if (name.empty()) {
    throw ResolutionError(ErrorKind::MissingPackageName, uri, "URI does not name a package or model");
  }

  RoboticsUri out;
  out.scheme = matched->scheme;
  out.package_name = name;
  if (slash != std::string::npos) {
    out.sub_path = split_segments(rest.substr(slash + 1));
  }
  return out;
}

} // namespace robotics_uri
