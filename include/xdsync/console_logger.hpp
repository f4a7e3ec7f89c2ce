#pragma once

#include "logger.hpp"
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace xdsync {

// Console logger for development and the example programs.
// Thread-safe; every line carries a timestamp, the level and the component tag.
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::info, std::string component = "xdsync")
        : _min_level(min_level)
        , _component(std::move(component)) {}
    
    console_logger(console_logger&& other) noexcept
        : _min_level(other._min_level)
        , _component(std::move(other._component)) {}
    
    console_logger& operator=(console_logger&& other) noexcept {
        if (this != &other) {
            _min_level = other._min_level;
            _component = std::move(other._component);
        }
        return *this;
    }
    
    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;
    
    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }
    
    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        if (level < _min_level) {
            return;
        }
        
        std::lock_guard<std::mutex> lock(_mutex);
        auto& stream = get_stream(level);
        stream << format_timestamp() << " "
               << log_level_to_string(level) << " "
               << "[" << _component << "] "
               << message;
        
        for (const auto& [key, value] : key_value_pairs) {
            stream << " " << key << "=" << value;
        }
        
        stream << "\n";
        stream.flush();
    }
    
    auto trace(std::string_view message) -> void { log(log_level::trace, message); }
    auto trace(std::string_view message, const log_fields& fields) -> void { log(log_level::trace, message, fields); }
    auto debug(std::string_view message) -> void { log(log_level::debug, message); }
    auto debug(std::string_view message, const log_fields& fields) -> void { log(log_level::debug, message, fields); }
    auto info(std::string_view message) -> void { log(log_level::info, message); }
    auto info(std::string_view message, const log_fields& fields) -> void { log(log_level::info, message, fields); }
    auto warning(std::string_view message) -> void { log(log_level::warning, message); }
    auto warning(std::string_view message, const log_fields& fields) -> void { log(log_level::warning, message, fields); }
    auto error(std::string_view message) -> void { log(log_level::error, message); }
    auto error(std::string_view message, const log_fields& fields) -> void { log(log_level::error, message, fields); }
    auto critical(std::string_view message) -> void { log(log_level::critical, message); }
    auto critical(std::string_view message, const log_fields& fields) -> void { log(log_level::critical, message, fields); }
    
    auto set_min_level(log_level level) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }
    
    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level;
    }

private:
    log_level _min_level;
    std::string _component;
    mutable std::mutex _mutex;
    
    // Error and critical go to stderr, everything else to stdout
    [[nodiscard]] auto get_stream(log_level level) const -> std::ostream& {
        if (level >= log_level::error) {
            return std::cerr;
        }
        return std::cout;
    }
    
    [[nodiscard]] auto format_timestamp() const -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;
        
        std::ostringstream oss;
        oss << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace xdsync
