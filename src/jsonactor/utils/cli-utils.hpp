#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup cli Command Line Utils
 * @ingroup jsonactor-utils
 *
 * Helpers for walking `argv` one switch at a time.
 */

namespace jsonactor::cli {
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);

// ------------------------------------------------------------------ parse args

std::vector<std::string> parse_cmd_args(const std::string_view line);

} // namespace jsonactor::cli
