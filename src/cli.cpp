/// NowTechnologies Zrt. All rights reserved.
/// Argument handling of the resolve_robotics_uri tool.
/// Author: nilseuropa <marton@nowtech.hu>
/// Created: 2026.10.19

#include "robotics_uri/cli.hpp"

#include <exception>
#include <string>

#include "robotics_uri/resolver.hpp"

namespace robotics_uri {

static void print_usage(std::ostream& err) {
  err << "Usage: resolve_robotics_uri <uri> [-p|--search-paths DIRS] [-e|--env-var NAME]...\n"
         "                            [-c|--config FILE] [-v|--verbose]\n"
         "\n"
         "Resolves package://, model:// and file:// URIs to an absolute path.\n"
         "DIRS is a '" << kPathListSeparator << "'-separated list searched before the environment.\n";
}

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
  if (argc < 2) { print_usage(err); return 1; }

  Options opts;
  std::string uri;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { print_usage(err); return 0; }
    if (a == "-v" || a == "--verbose") { opts.verbose = true; continue; }
    if ((a == "-p" || a == "--search-paths") && i + 1 < argc) {
      for (auto& dir : split_path_list(argv[++i]))
        opts.search_dirs.push_back(dir);
      continue;
    }
    if ((a == "-e" || a == "--env-var") && i + 1 < argc) { opts.extra_env_vars.push_back(argv[++i]); continue; }
    if ((a == "-c" || a == "--config") && i + 1 < argc) { opts.config_path = argv[++i]; continue; }
    if (!a.empty() && a[0] == '-') {
      err << "resolve_robotics_uri error: unknown or incomplete option '" << a << "'\n";
      print_usage(err);
      return 1;
    }
    if (!uri.empty()) {
      err << "resolve_robotics_uri error: more than one URI given\n";
      return 1;
    }
    uri = a;
  }
  if (uri.empty()) { print_usage(err); return 1; }

  try {
    out << resolve_uri(uri, opts) << "\n";
    return 0;
  } catch (const ResolutionError& e) {
    err << "resolve_robotics_uri error: [" << error_kind_to_string(e.kind()) << "] " << e.what() << "\n";
  } catch (const ConfigError& e) {
    err << "resolve_robotics_uri error: [config] " << e.what() << "\n";
  } catch (const std::exception& e) {
    err << "resolve_robotics_uri error: " << e.what() << "\n";
  }
  return 2;
}

} // namespace robotics_uri
