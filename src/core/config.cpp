/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 *
 * Each key is read and range-checked on its own, then every field result is
 * combined so a bad file reports all of its problems at once.
 */

#include "core/config.hpp"

#include "combinators/parallel.hpp"
#include "combinators/sequential.hpp"

#include <limits>

#include <toml++/toml.hpp>

namespace railway {

namespace {

template <typename View>
Result<int64_t> read_integer(View table, std::string_view key, int64_t fallback,
                             const std::string& field) {
    auto node = table[key];
    if (!node) return fallback;
    if (auto value = node.template value<int64_t>()) return *value;
    return Error::validation("expected an integer", field);
}

template <typename View>
Result<double> read_float(View table, std::string_view key, double fallback,
                          const std::string& field) {
    auto node = table[key];
    if (!node) return fallback;
    if (auto value = node.template value<double>()) return *value;
    return Error::validation("expected a number", field);
}

template <typename View>
Result<std::string> read_string(View table, std::string_view key, std::string fallback,
                                const std::string& field) {
    auto node = table[key];
    if (!node) return fallback;
    if (auto value = node.template value<std::string>()) return *value;
    return Error::validation("expected a string", field);
}

Result<uint32_t> to_uint32(Result<int64_t> raw, int64_t min, const std::string& field) {
    constexpr int64_t max = std::numeric_limits<uint32_t>::max();
    auto checked = ensure(
        std::move(raw),
        [min](int64_t v) { return v >= min && v <= max; },
        [min, &field](int64_t v) {
            return Error::validation("must be between " + std::to_string(min) + " and " +
                                         std::to_string(max) + ", got " + std::to_string(v),
                                     field);
        });
    return railway::map(std::move(checked), [](int64_t v) { return static_cast<uint32_t>(v); });
}

template <typename View>
Result<uint32_t> read_uint32(View table, std::string_view key, int64_t fallback, int64_t min,
                             const std::string& field) {
    return to_uint32(read_integer(table, key, fallback, field), min, field);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error::not_found("Configuration file not found: " + path.string(),
                                "config.not_found");
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        return Error::bad_request(std::string{"TOML parse error: "} + std::string{err.description()},
                                  "config.parse_error");
    }

    const Config defaults = default_config();

    // [retry]
    auto retry = tbl["retry"];
    auto max_retries = read_uint32(retry, "max_retries", defaults.retry.max_retries, 0,
                                   "retry.max_retries");
    auto initial_delay_ms = read_uint32(retry, "initial_delay_ms",
                                        defaults.retry.initial_delay.count(), 0,
                                        "retry.initial_delay_ms");
    auto multiplier = ensure(
        read_float(retry, "backoff_multiplier", defaults.retry.backoff_multiplier,
                   "retry.backoff_multiplier"),
        [](double m) { return m > 0.0; },
        Error::validation("must be greater than 0", "retry.backoff_multiplier"));

    // [executor]
    auto thread_count = read_uint32(tbl["executor"], "thread_count",
                                    defaults.executor.thread_count, 0, "executor.thread_count");

    // [logging]
    auto logging = tbl["logging"];
    auto level = railway::bind(
        read_string(logging, "level", std::string{to_string(defaults.logging.level)},
                    "logging.level"),
        [](const std::string& name) { return parse_log_level(name); });
    auto log_dir = read_string(logging, "log_dir", defaults.logging.log_dir.string(),
                               "logging.log_dir");
    auto max_file_size_mb = read_uint32(logging, "max_file_size_mb",
                                        defaults.logging.max_file_size_mb, 1,
                                        "logging.max_file_size_mb");
    auto rotate_count = read_uint32(logging, "rotate_count", defaults.logging.rotate_count, 1,
                                    "logging.rotate_count");

    return railway::map(
        combine(std::move(max_retries), std::move(initial_delay_ms), std::move(multiplier),
                std::move(thread_count), std::move(level), std::move(log_dir),
                std::move(max_file_size_mb), std::move(rotate_count)),
        [](uint32_t retries, uint32_t delay_ms, double mult, uint32_t threads, LogLevel lvl,
           std::string dir, uint32_t file_mb, uint32_t rotate) {
            Config config;
            config.retry.max_retries = retries;
            config.retry.initial_delay = Milliseconds{delay_ms};
            config.retry.backoff_multiplier = mult;
            config.executor.thread_count = threads;
            config.logging.level = lvl;
            config.logging.log_dir = std::move(dir);
            config.logging.max_file_size_mb = file_mb;
            config.logging.rotate_count = rotate;
            return config;
        });
}

Config default_config() {
    return Config{};
}

}  // namespace railway
