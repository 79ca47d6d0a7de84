#include "file-system.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

namespace jsonactor {

/**
 * @brief Reads the entire contents of `fname` into `out`.
 * On failure, `out` is unchanged, and the (errno based) reason is returned.
 */
error_code file_get_contents(const std::string_view fname, std::string& out) {
  if (!is_regular_file(fname))
    return std::make_error_code(errno != 0 ? std::errc(errno) : std::errc::invalid_argument);

  errno = 0;
  std::ifstream in{std::string{fname}, std::ios::in | std::ios::binary};
  if (!in.is_open())
    return std::make_error_code(errno != 0 ? std::errc(errno) : std::errc::io_error);

  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad())
    return std::make_error_code(std::errc::io_error);

  out = ss.str();
  return {};
}

bool is_regular_file(const std::string_view filename) {
  errno = 0;
  struct stat st;
  if (::stat(std::string{filename}.c_str(), &st) != 0)
    return false;
  if (!S_ISREG(st.st_mode)) {
    errno = EISDIR;
    return false;
  }
  return true;
}

} // namespace jsonactor
