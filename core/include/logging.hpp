#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    struct LoggingConfig {
        std::string base_log_filename = "wfv";
        std::string log_dir = "logs";
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        bool log_to_file = true;
    };

    // Call this once at the beginning of your application (e.g., in main())
    void initialize(const LoggingConfig& config = LoggingConfig{});

    // Get the globally configured logger
    std::shared_ptr<spdlog::logger>& getLogger();

    bool isInitialized();

    // Helper function to set log level from string (useful for env vars/args)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
