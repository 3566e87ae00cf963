#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace httpool::log {

    /// @brief The library's named logger ("httpool").
    /// @note Created on first use with a stderr sink at warn level. A logger
    /// registered under the same name beforehand is used instead.
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Adjust the level of the library logger.
    void set_level(spdlog::level::level_enum level);

}  // namespace httpool::log
