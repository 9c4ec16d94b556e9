#pragma once
#include "settings.hpp"

namespace campus_rag {

// Installs the process-wide spdlog default logger: console + <log_dir>/campus_rag.log.
void init_logging(const Settings& settings);

} // namespace campus_rag
