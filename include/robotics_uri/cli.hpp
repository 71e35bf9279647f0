#pragma once

#include <ostream>

namespace robotics_uri {

// Command-line front end. Prints only the resolved path to `out`; usage and
// errors go to `err`. Returns 0 on success, 1 on usage errors and 2 when the
// URI or the config cannot be resolved.
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace robotics_uri
