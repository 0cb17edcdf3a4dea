#pragma once

// Convenience umbrella header.

#include "anvil/handler-error.hpp"     // IWYU pragma: export
#include "anvil/handler.hpp"           // IWYU pragma: export
#include "anvil/http-constants.hpp"    // IWYU pragma: export
#include "anvil/http-method.hpp"       // IWYU pragma: export
#include "anvil/http-request.hpp"      // IWYU pragma: export
#include "anvil/http-response.hpp"     // IWYU pragma: export
#include "anvil/http-status-code.hpp"  // IWYU pragma: export
#include "anvil/log.hpp"               // IWYU pragma: export
#include "anvil/server-config.hpp"     // IWYU pragma: export
#include "anvil/server.hpp"            // IWYU pragma: export
#include "anvil/signal-handler.hpp"    // IWYU pragma: export
