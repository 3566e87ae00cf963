#include "httpool/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace httpool::log {

    namespace {
        constexpr const char* kLoggerName = "httpool";
    }

    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> instance;

        std::call_once(once, [] {
            instance = spdlog::get(kLoggerName);
            if (instance) return;

            instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_level(spdlog::level::warn);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        });
        return instance;
    }

    void set_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

}  // namespace httpool::log
