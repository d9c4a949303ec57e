#pragma once

#include <spdlog/spdlog.h>

namespace feedlink {

    /// @brief Set the level of spdlog's default logger, which all feedlink
    /// components log through. SPDLOG_ACTIVE_LEVEL still bounds what is
    /// compiled in.
    inline void set_log_level(spdlog::level::level_enum level) {
        spdlog::set_level(level);
    }

}  // namespace feedlink
