#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/logger.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <memory>

namespace anvil {

namespace log = spdlog;

// Logger handle injected in the server objects. It is expected to be created once at process start
// (or to be the spdlog default logger) and to outlive every server using it.
using Logger = std::shared_ptr<spdlog::logger>;

}  // namespace anvil
