#pragma once

#include "common/cancellation.hpp"

namespace das_integrity {

/**
 * Route SIGINT and SIGTERM to the token. Running categories finish their current
 * request and stop; the final report is still printed.
 *
 * The token must outlive the process's signal handling.
 */
void install_signal_handlers(CancellationToken& token);

} // namespace das_integrity
