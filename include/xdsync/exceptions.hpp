#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace xdsync {

// Base exception for all xdsync errors
class xdsync_exception : public std::runtime_error {
public:
    explicit xdsync_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Exception for invalid or unloadable reconciler configuration
class configuration_exception : public xdsync_exception {
public:
    explicit configuration_exception(const std::string& message)
        : xdsync_exception("Invalid configuration: " + message) {}
};

// Base for errors detected while building a resource set.
// These abort the batch before any mutation is issued, so no rollback is needed.
class resource_exception : public xdsync_exception {
public:
    resource_exception(std::string type_url, const std::string& message)
        : xdsync_exception(message)
        , _type_url(std::move(type_url)) {}

    auto get_type_url() const -> const std::string& { return _type_url; }

private:
    std::string _type_url;
};

// Decoded shape disagrees with the declared type tag
class type_mismatch_exception : public resource_exception {
public:
    type_mismatch_exception(const std::string& declared_type_url, const std::string& detail)
        : resource_exception(
            declared_type_url,
            "Invalid type for " + declared_type_url + ": " + detail
        )
        , _detail(detail) {}

    auto get_detail() const -> const std::string& { return _detail; }

private:
    std::string _detail;
};

class missing_name_exception : public resource_exception {
public:
    explicit missing_name_exception(const std::string& type_url)
        : resource_exception(type_url, "Resource name not provided for " + type_url) {}
};

class duplicate_name_exception : public resource_exception {
public:
    duplicate_name_exception(const std::string& type_url, const std::string& name)
        : resource_exception(type_url, "Duplicate name \"" + name + "\" for " + type_url)
        , _name(name) {}

    auto get_name() const -> const std::string& { return _name; }

private:
    std::string _name;
};

class unsupported_type_exception : public resource_exception {
public:
    explicit unsupported_type_exception(const std::string& type_url)
        : resource_exception(type_url, "Unsupported type: " + type_url) {}
};

// Raised when the resource validator rejects a resource.
// Carries the resource identity and its JSON content for diagnosis.
class validation_exception : public resource_exception {
public:
    validation_exception(
        const std::string& type_url,
        const std::string& name,
        const std::string& reason,
        const std::string& content
    )
        : resource_exception(
            type_url,
            "Could not validate " + type_url + " \"" + name + "\" (" + reason + "): " + content
        )
        , _name(name)
        , _reason(reason)
        , _content(content) {}

    auto get_name() const -> const std::string& { return _name; }
    auto get_reason() const -> const std::string& { return _reason; }
    auto get_content() const -> const std::string& { return _content; }

private:
    std::string _name;
    std::string _reason;
    std::string _content;
};

class port_allocation_exception : public resource_exception {
public:
    port_allocation_exception(const std::string& listener_name, const std::string& reason)
        : resource_exception(
            "type.googleapis.com/envoy.config.listener.v3.Listener",
            "Listener port allocation for \"" + listener_name + "\" failed: " + reason
        )
        , _listener_name(listener_name)
        , _reason(reason) {}

    auto get_listener_name() const -> const std::string& { return _listener_name; }
    auto get_reason() const -> const std::string& { return _reason; }

private:
    std::string _listener_name;
    std::string _reason;
};

} // namespace xdsync
