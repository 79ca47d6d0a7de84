#pragma once

/**
 * @defgroup jsonactor JsonActor
 */

/**
 * @defgroup jsonactor-utils Utilities
 * @ingroup jsonactor
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/file-system.hpp"
#include "utils/string-utils.hpp"
