#pragma once

#include "error-codes.hpp"

#include <string>
#include <string_view>

namespace jsonactor {
// ------------------------------------------------------------ file-get-contents

error_code file_get_contents(const std::string_view fname, std::string& out);

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename);

} // namespace jsonactor
