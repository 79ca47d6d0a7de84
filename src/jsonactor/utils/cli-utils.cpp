#include "cli-utils.hpp"

#include <cerrno>
#include <regex>
#include <stdexcept>

#include "base-include.hpp"

namespace jsonactor::cli {
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Returns the argument after `argv[i]`, and advances `i` onto it.
 *
 * Preconditions:
 * + `argc` and `argv` describe an array of `char *` "c" strings.
 * + `i >= 0` and `i < argc`
 *
 * Exceptions
 * + `std::runtime_error` if `argv[i]` is the last argument.
 */
std::string safe_arg_str(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  const std::string_view arg = argv[i++];
  if (i >= argc)
    throw std::runtime_error(format("expected string after argument '{}'", arg));
  return std::string{argv[i]};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Like `safe_arg_str`, but the argument must parse as a (possibly negative)
 *        base-10 integer that fits in an `int`.
 *
 * Exceptions
 * + `std::runtime_error` if there is no next argument, or it is not an integer.
 */
int safe_arg_int(int argc, char** argv, int& i) {
  Expects(argc >= 0);
  Expects(i >= 0 && i < argc);
  const std::string_view arg = argv[i++];

  if (i < argc && *argv[i] != '\0') {
    char* end = nullptr;
    errno = 0;
    const auto value = std::strtol(argv[i], &end, 10);
    if (*end == '\0' && errno == 0 && value <= std::numeric_limits<int>::max()
        && value >= std::numeric_limits<int>::lowest())
      return static_cast<int>(value);
  }

  throw std::runtime_error(format("expected integer after argument '{}'", arg));
}

// ------------------------------------------------------------------ parse args
/**
 * @ingroup cli
 * @brief Splits `ss` into arguments the way a shell would, honouring single and
 *        double quotes, and backslash escapes within quotes.
 */
std::vector<std::string> parse_cmd_args(const std::string_view ss) {
  const std::string line{ss};
  std::vector<std::string> args;

  auto unquote = [](const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 1; i + 1 < s.size(); ++i) {
      if (s[i] == '\\' && i + 2 < s.size()) {
        switch (const char ch = s[++i]) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        default: out += ch;
        }
      } else {
        out += s[i];
      }
    }
    return out;
  };

  static const std::regex expr{"('(\\\\.|[^'\\\\])*')|(\"(\\\\.|[^\"\\\\])*\")|([\\S]+)"};
  for (auto ii = std::sregex_iterator(cbegin(line), cend(line), expr); ii != std::sregex_iterator();
       ++ii) {
    auto s = ii->str();
    const bool is_quoted = s.size() >= 2 && (s.front() == '\'' || s.front() == '"')
                           && s.back() == s.front();
    args.push_back(is_quoted ? unquote(s) : std::move(s));
  }

  return args;
}

} // namespace jsonactor::cli
