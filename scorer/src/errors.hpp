#pragma once

#include <stdexcept>
#include <string>

// Unknown category id; raised before any scoring work
class InvalidCategory : public std::runtime_error {
public:
    explicit InvalidCategory(const std::string& id)
        : std::runtime_error("Unknown category: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// Inconsistent profile table; fatal at registry load
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

enum class ProviderErrorKind {
    NotFound,
    AuthError,
    RateLimited,
    TransientError
};

std::string provider_error_kind_to_string(ProviderErrorKind kind);

class ProviderError : public std::runtime_error {
public:
    ProviderError(ProviderErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ProviderErrorKind kind() const { return kind_; }

private:
    ProviderErrorKind kind_;
};
