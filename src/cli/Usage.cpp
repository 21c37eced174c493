#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pymarshal::cli {

namespace {
constexpr std::string_view kUsageText = R"(pymarshal [options] file...

Decode, inspect and re-encode CPython marshal streams and .pyc files.

Options:
  -h, --help           Print this help and exit
  -o <file>            Re-encode the (possibly rewritten) object into <file>
  --py-version=<M.m>   Interpreter version for raw marshal input (3.10 - 3.13)
  --pyc                Treat inputs as .pyc files (implied by a .pyc extension)
  --dump               Print the decoded object tree and reference table
  --verify             Re-encode and check the round trip
  --prune-refs         Drop reference slots that are never loaded
  --resolve-refs       Inline every non-recursive back-reference
  --max-depth=<N>      Container nesting limit (default: 2000, env PYMARSHAL_MAX_DEPTH)
  --allow-trailing     Accept bytes after the top-level object
  --metrics            Print decode metrics summary
  --metrics-json       Print decode metrics in JSON
  --log-path=<dir>     Directory where logs are written (decode/refs/metrics)
  --log-decode         Write the object tree log (requires --log-path)
  --log-refs           Write the reference table log (requires --log-path)
  --color=<mode>       Color diagnostics: always|never|auto (default: auto)
  --                   End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pymarshal::cli
