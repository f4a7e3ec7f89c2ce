#pragma once

#include "exceptions.hpp"
#include <chrono>
#include <string>

namespace xdsync {

// Base exception for failures reported through an acknowledgment barrier.
// Every barrier failure causes the batch to be rolled back before it is rethrown.
class barrier_exception : public xdsync_exception {
public:
    explicit barrier_exception(const std::string& message)
        : xdsync_exception(message) {}
};

// The data plane declined a pushed resource (NACK)
class push_rejected_exception : public barrier_exception {
public:
    push_rejected_exception(
        const std::string& type_url,
        const std::string& name,
        const std::string& detail
    )
        : barrier_exception(
            "Push rejected for " + type_url + " \"" + name + "\": " + detail
        )
        , _type_url(type_url)
        , _name(name)
        , _detail(detail) {}

    auto get_type_url() const -> const std::string& { return _type_url; }
    auto get_name() const -> const std::string& { return _name; }
    auto get_detail() const -> const std::string& { return _detail; }

private:
    std::string _type_url;
    std::string _name;
    std::string _detail;
};

// No acknowledgment arrived before the batch deadline
class push_timeout_exception : public barrier_exception {
public:
    push_timeout_exception(std::size_t pending_count, std::chrono::milliseconds waited)
        : barrier_exception(
            "Timed out waiting for " + std::to_string(pending_count) +
            " acknowledgment(s) after " + std::to_string(waited.count()) + "ms"
        )
        , _pending_count(pending_count)
        , _waited(waited) {}

    auto get_pending_count() const -> std::size_t { return _pending_count; }
    auto get_waited() const -> std::chrono::milliseconds { return _waited; }

private:
    std::size_t _pending_count;
    std::chrono::milliseconds _waited;
};

// The governing batch context was cancelled
class cancelled_exception : public barrier_exception {
public:
    explicit cancelled_exception(const std::string& reason)
        : barrier_exception("Batch cancelled: " + reason) {}
};

} // namespace xdsync
