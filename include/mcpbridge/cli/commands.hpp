#pragma once

#include "mcpbridge/config/schema.hpp"

#include <string>
#include <vector>

namespace mcpbridge::cli {

/// Consumes `proxy` subcommand flags from `args` into `config`. Fails on a
/// flag without a value or an unparsable number; leaves unknown tokens in place.
[[nodiscard]] bool apply_proxy_flags(std::vector<std::string> &args, config::Config &config,
                                     std::string &error);

int run_cli(int argc, char **argv);

} // namespace mcpbridge::cli
