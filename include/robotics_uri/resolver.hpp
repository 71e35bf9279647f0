#pragma once

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace robotics_uri {

#ifdef _WIN32
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

// Variable name -> value. Only the names the collector asks for are looked up.
using Environment = std::unordered_map<std::string, std::string>;

enum class Scheme { Package, Model };

const char* to_string(Scheme scheme);
// Returns false when `name` is not a supported scheme.
bool scheme_from_string(const std::string& name, Scheme* out);

struct RoboticsUri {
  Scheme scheme = Scheme::Package;
  std::string package_name;
  std::vector<std::string> sub_path; // empty segments are collapsed

  // "name/seg/seg"
  std::string relative_path() const;
  // "package://name/seg/seg"
  std::string to_string() const;
};

enum class Provenance { Caller, Config, EnvCustom, EnvPrimary, EnvAlias, EnvGeneric, FileUri };

const char* to_string(Provenance provenance);

struct SearchRoot {
  std::string path;
  Provenance provenance = Provenance::Caller;
  std::string source; // variable name or config file, empty for caller dirs
};

// One candidate path checked for existence.
struct Probe {
  std::string path;
  SearchRoot root;
  std::string layout; // "direct" or "share", empty for file:// paths
};

enum class ErrorKind { UnsupportedScheme, MissingPackageName, NotFound };

const char* error_kind_to_string(ErrorKind kind);

class ResolutionError : public std::runtime_error {
public:
  ResolutionError(ErrorKind kind, const std::string& uri, const std::string& message);
  ResolutionError(const std::string& uri, std::vector<Probe> probes);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& uri() const noexcept { return uri_; }
  // Every path probed, in probe order. Empty unless kind() == NotFound.
  const std::vector<Probe>& probes() const noexcept { return probes_; }
  // One entry per searched root, in search order. Duplicate roots stay duplicated.
  std::vector<SearchRoot> searched_roots() const;

private:
  ErrorKind kind_;
  std::string uri_;
  std::vector<Probe> probes_;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Config {
  std::vector<std::string> search_paths; // absolute after load_config()
  std::vector<std::string> env_vars;
};

// Reads a YAML file with optional `search_paths` and `env_vars` sequences.
// Relative search paths are anchored at the file's directory.
Config load_config(const std::string& path);

std::vector<std::string> split_path_list(const std::string& value, char separator = kPathListSeparator);

// Snapshot of every variable known to the collector plus `extra_names`,
// read from the process environment at the time of the call.
Environment process_environment(const std::vector<std::string>& extra_names = {});

// Environment variables consulted for `scheme`, in precedence order.
std::vector<std::string> primary_env_vars(Scheme scheme);
std::vector<std::string> alias_env_vars(Scheme scheme);
extern const char* const kGenericEnvVar;

RoboticsUri parse_uri(const std::string& uri);

std::vector<SearchRoot> collect_roots(Scheme scheme,
                                      const std::vector<std::string>& caller_dirs,
                                      const Environment& env,
                                      const std::vector<std::string>& extra_env_vars = {});

// Returns the absolute path of the first existing candidate.
// Throws ResolutionError(NotFound) carrying every probe otherwise.
std::string resolve(const RoboticsUri& uri, const std::vector<SearchRoot>& roots);

struct Options {
  std::vector<std::string> search_dirs; // highest precedence
  std::vector<std::string> extra_env_vars;
  std::string config_path; // empty -> no config file
  const Environment* environment = nullptr; // nullptr -> process environment
  bool verbose = false; // log roots and probes to stderr
};

// package://, model:// and file:// entry point.
std::string resolve_uri(const std::string& uri, const Options& opts = Options());

// Non-throwing variant. Returns true on success and fills *path; on failure
// fills *error_msg (and *kind when given) and returns false.
// ConfigError is not caught.
bool try_resolve_uri(const std::string& uri,
                     const Options& opts,
                     std::string* path,
                     std::string* error_msg,
                     ErrorKind* kind = nullptr);

} // namespace robotics_uri
