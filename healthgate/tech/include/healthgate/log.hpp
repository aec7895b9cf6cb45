#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace healthgate {

namespace log = spdlog;

}  // namespace healthgate
