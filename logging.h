#pragma once

namespace fileman {

// Installs the `fileman` logger on stderr as the spdlog default and applies
// levels from SPDLOG_LEVEL.
void InitLogging();

} // namespace fileman
