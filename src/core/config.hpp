/**
 * @file config.hpp
 * @brief Runtime configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

namespace railway {

/// Defaults for retry(); see to_retry_policy().
struct RetryConfig {
    uint32_t max_retries = 3;
    Milliseconds initial_delay{100};
    double backoff_multiplier = 2.0;
};

struct ExecutorConfig {
    uint32_t thread_count = 0;          ///< 0 = hardware_concurrency
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::filesystem::path log_dir;      ///< empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level runtime configuration.
 */
struct Config {
    RetryConfig retry;
    ExecutorConfig executor;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Failures:
 * - file absent: NotFound, code "config.not_found";
 * - TOML syntax error: BadRequest, code "config.parse_error";
 * - bad values: one Validation error naming every offending key
 *   ("retry.max_retries", "logging.level", ...).
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace railway
