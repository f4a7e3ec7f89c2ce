#pragma once

#include "logger.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xdsync {

// A single captured log line with owned copies of its fields
struct log_record {
    log_level level;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
    
    auto field(std::string_view key) const -> std::string {
        for (const auto& [k, v] : fields) {
            if (k == key) {
                return v;
            }
        }
        return {};
    }
};

// In-memory logger for tests.
// Copies share one record buffer, so a test can keep a handle after moving
// the logger into the component under test.
class recording_logger {
public:
    recording_logger()
        : _state(std::make_shared<state>()) {}
    
    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }
    
    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        log_record record{level, std::string{message}, {}};
        record.fields.reserve(key_value_pairs.size());
        for (const auto& [key, value] : key_value_pairs) {
            record.fields.emplace_back(std::string{key}, std::string{value});
        }
        
        std::lock_guard<std::mutex> lock(_state->mutex);
        _state->records.push_back(std::move(record));
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
    
    [[nodiscard]] auto records() const -> std::vector<log_record> {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->records;
    }
    
    [[nodiscard]] auto count(log_level level) const -> std::size_t {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return static_cast<std::size_t>(std::count_if(
            _state->records.begin(), _state->records.end(),
            [level](const log_record& r) { return r.level == level; }));
    }
    
    [[nodiscard]] auto contains(std::string_view message) const -> bool {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return std::any_of(_state->records.begin(), _state->records.end(),
            [message](const log_record& r) { return r.message.find(message) != std::string::npos; });
    }

private:
    struct state {
        std::mutex mutex;
        std::vector<log_record> records;
    };
    
    std::shared_ptr<state> _state;
};

static_assert(diagnostic_logger<recording_logger>,
    "recording_logger must satisfy diagnostic_logger concept");

} // namespace xdsync
