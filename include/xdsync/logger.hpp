#pragma once

#include <concepts>
#include <string_view>
#include <vector>
#include <utility>
#include <cstdint>

namespace xdsync {

// Log severity levels
enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

// Diagnostic logger concept for structured logging
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    log_fields key_value_pairs
) {
    // Basic logging with level and message
    { logger.log(level, message) } -> std::same_as<void>;
    
    // Structured logging with key-value pairs
    { logger.log(level, message, key_value_pairs) } -> std::same_as<void>;
    
    // Convenience methods for each log level
    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;
    
    { logger.debug(message, key_value_pairs) } -> std::same_as<void>;
    { logger.info(message, key_value_pairs) } -> std::same_as<void>;
    { logger.warning(message, key_value_pairs) } -> std::same_as<void>;
    { logger.error(message, key_value_pairs) } -> std::same_as<void>;
};

[[nodiscard]] inline auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARNING";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace xdsync
