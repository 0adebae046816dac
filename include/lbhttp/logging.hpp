#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace lbhttp {

    inline constexpr const char* kLoggerName = "lbhttp";

    /// @brief The library logger. Created on first use and registered with
    /// spdlog so applications can reconfigure it by name.
    inline std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        std::call_once(once, [] {
            if (!spdlog::get(kLoggerName)) {
                auto l = spdlog::stderr_color_mt(kLoggerName);
                l->set_level(spdlog::level::warn);
            }
        });
        return spdlog::get(kLoggerName);
    }

    inline void set_log_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

}  // namespace lbhttp
