/// NowTechnologies Zrt. All rights reserved.
/// Candidate probing, failure reporting and the resolve_uri entry point.
/// Author: nilseuropa <marton@nowtech.hu>
/// Created: 2026.10.19

#include "robotics_uri/resolver.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "resolver_internal.hpp"

namespace fs = std::filesystem;

namespace robotics_uri {

namespace {

static constexpr const char* kFilePrefixAuthority = "file://";
static constexpr const char* kFilePrefix = "file:";

static bool starts_with(const std::string& s, const char* prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

static std::string describe_root(const SearchRoot& root) {
  std::string out = to_string(root.provenance);
  if (!root.source.empty()) {
    out += " " + root.source;
  }
  return out;
}

static std::string not_found_message(const std::string& uri, const std::vector<Probe>& probes) {
  std::ostringstream oss;
  oss << "No file corresponding to URI '" << uri << "' found";
  if (probes.empty()) {
    oss << ", no search paths were given (use --search-paths or set " << kGenericEnvVar << ")";
    return oss.str();
  }
  std::string list = format_probe_list(probes);
  list.pop_back(); // trailing newline
  oss << ", probed " << probes.size() << " location" << (probes.size() == 1 ? "" : "s") << ":\n" << list;
  return oss.str();
}

static std::string absolute_form(const fs::path& p) {
  std::error_code ec;
  fs::path canonical = fs::canonical(p, ec);
  if (!ec) {
    return canonical.string();
  }
  fs::path abs = fs::absolute(p, ec);
  return ec ? p.lexically_normal().string() : abs.lexically_normal().string();
}

static bool path_exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}

// file:///abs, file://localhost/abs and file:/abs. Any other authority and
// relative paths are rejected.
static std::string resolve_file_uri(const std::string& uri) {
  std::string path;
  if (starts_with(uri, kFilePrefixAuthority)) {
    std::string rest = uri.substr(std::char_traits<char>::length(kFilePrefixAuthority));
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (authority.empty() || authority == "localhost") {
      path = (slash == std::string::npos) ? std::string() : rest.substr(slash);
    } else {
      path = rest;
    }
  } else {
    path = uri.substr(std::char_traits<char>::length(kFilePrefix));
  }
  std::error_code ec;
  if (path.empty() || !fs::path(path).is_absolute() || !fs::is_regular_file(path, ec)) {
    throw ResolutionError(uri, {Probe{path, SearchRoot{std::string(), Provenance::FileUri, std::string()}, std::string()}});
  }
  return absolute_form(path);
}

} // namespace

const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UnsupportedScheme:  return "UnsupportedScheme";
    case ErrorKind::MissingPackageName: return "MissingPackageName";
    case ErrorKind::NotFound:           return "NotFound";
  }
  return "Unknown";
}

ResolutionError::ResolutionError(ErrorKind kind, const std::string& uri, const std::string& message)
    : std::runtime_error(message + " (uri: " + uri + ")"), kind_(kind), uri_(uri) {}

ResolutionError::ResolutionError(const std::string& uri, std::vector<Probe> probes)
    : std::runtime_error(not_found_message(uri, probes)),
      kind_(ErrorKind::NotFound),
      uri_(uri),
      probes_(std::move(probes)) {}

std::vector<SearchRoot> ResolutionError::searched_roots() const {
  std::vector<SearchRoot> roots;
  if (probes_.empty()) {
    return roots;
  }
  // Each root starts over at the first layout.
  const std::string& first_layout = probes_.front().layout;
  for (size_t i = 0; i < probes_.size(); ++i) {
    if (i == 0 || probes_[i].layout == first_layout) {
      roots.push_back(probes_[i].root);
    }
  }
  return roots;
}

std::string format_probe_list(const std::vector<Probe>& probes) {
  std::string out;
  for (const auto& probe : probes) {
    out += "  " + probe.path + "  [" + describe_root(probe.root);
    if (!probe.layout.empty()) {
      out += ", " + probe.layout + " layout";
    }
    out += "]\n";
  }
  return out;
}

void log_line(const std::string& message) {
  std::cerr << "[resolve_robotics_uri] " << message << "\n";
}

std::string join_candidate(const std::string& root, const LayoutRule& layout, const RoboticsUri& uri) {
  fs::path p(root);
  if (layout.prefix && *layout.prefix) {
    p /= layout.prefix;
  }
  p /= uri.package_name;
  for (const auto& seg : uri.sub_path) {
    p /= seg;
  }
  return p.string();
}

std::string resolve_logged(const RoboticsUri& uri, const std::vector<SearchRoot>& roots, bool verbose) {
  const SchemeRules& rules = rules_for(uri.scheme);
  std::vector<Probe> probes;
  probes.reserve(roots.size() * rules.layouts.size());

  for (const auto& root : roots) {
    for (const auto& layout : rules.layouts) {
      std::string candidate = join_candidate(root.path, layout, uri);
      bool found = path_exists(candidate);
      if (verbose) {
        log_line(std::string(found ? "  found   " : "  missing ") + candidate + "  [" + describe_root(root) + ", " +
                 layout.name + " layout]");
      }
      if (found) {
        return absolute_form(candidate);
      }
      probes.push_back(Probe{candidate, root, layout.name});
    }
  }
  throw ResolutionError(uri.to_string(), std::move(probes));
}

std::string resolve(const RoboticsUri& uri, const std::vector<SearchRoot>& roots) {
  return resolve_logged(uri, roots, false);
}

std::string resolve_uri(const std::string& uri, const Options& opts) {
  if (starts_with(uri, kFilePrefix)) {
    return resolve_file_uri(uri);
  }

  RoboticsUri parsed = parse_uri(uri);

  Config config;
  if (!opts.config_path.empty()) {
    config = load_config(opts.config_path);
  }
  std::vector<std::string> extra_vars = opts.extra_env_vars;
  extra_vars.insert(extra_vars.end(), config.env_vars.begin(), config.env_vars.end());

  // Read on every call: the process environment may change between calls.
  Environment snapshot;
  if (!opts.environment) {
    snapshot = process_environment(extra_vars);
  }
  const Environment& env = opts.environment ? *opts.environment : snapshot;

  std::vector<SearchRoot> roots = collect_roots(parsed.scheme, opts.search_dirs, env, extra_vars);

  // Config directories rank right after the caller's own.
  auto pos = roots.begin();
  while (pos != roots.end() && pos->provenance == Provenance::Caller)
    ++pos;
  std::vector<SearchRoot> from_config;
  for (const auto& dir : config.search_paths) {
    from_config.push_back(SearchRoot{dir, Provenance::Config, opts.config_path});
  }
  roots.insert(pos, from_config.begin(), from_config.end());

  if (opts.verbose) {
    log_line("resolving " + parsed.to_string() + " against " + std::to_string(roots.size()) + " search roots");
    for (const auto& root : roots) {
      log_line("  " + root.path + "  [" + describe_root(root) + "]");
    }
  }

  std::string result;
  try {
    result = resolve_logged(parsed, roots, opts.verbose);
  } catch (const ResolutionError& e) {
    // Report the URI as the caller wrote it.
    throw ResolutionError(uri, e.probes());
  }
  if (opts.verbose) {
    log_line("resolved to " + result);
  }
  return result;
}

bool try_resolve_uri(const std::string& uri,
                     const Options& opts,
                     std::string* path,
                     std::string* error_msg,
                     ErrorKind* kind) {
  try {
    std::string resolved = resolve_uri(uri, opts);
    if (path) {
      *path = std::move(resolved);
    }
    return true;
  } catch (const ResolutionError& e) {
    if (error_msg) {
      *error_msg = e.what();
    }
    if (kind) {
      *kind = e.kind();
    }
  }
  return false;
}

} // namespace robotics_uri
