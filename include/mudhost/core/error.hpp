#pragma once

/// @file error.hpp
/// @brief Error handling types for mudhost_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace mudhost_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    PermissionDenied,
    NotSupported,
    LoadFailed,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotSupported: return "NotSupported";
        case ErrorCode::LoadFailed: return "LoadFailed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Identity transition errors (uid, gid)
struct IdentityError {
    enum class Kind : std::uint8_t {
        ResolutionFailed,   // Name not present in the user/group database
        ApplyFailed,        // OS refused the identity change
        RootDenied,         // Still root without an explicit uid 0
    };

    Kind kind;
    std::string message;
    std::string subject;    // Requested user/group, as given
    std::string reason;     // OS error text for ApplyFailed

    [[nodiscard]] static IdentityError no_such_user(const std::string& name) {
        return IdentityError{Kind::ResolutionFailed, "No such user '" + name + "'", name, {}};
    }

    [[nodiscard]] static IdentityError no_such_group(const std::string& name) {
        return IdentityError{Kind::ResolutionFailed, "No such group '" + name + "'", name, {}};
    }

    [[nodiscard]] static IdentityError apply_failed(const std::string& what, const std::string& os_reason) {
        return IdentityError{Kind::ApplyFailed, "Unable to assume the " + what + ": " + os_reason, what, os_reason};
    }

    [[nodiscard]] static IdentityError root_denied() {
        return IdentityError{Kind::RootDenied,
            "Refusing to run as root without an explicit UID of 0", "root", {}};
    }
};

/// Extension module errors
struct ModuleError {
    enum class Kind : std::uint8_t {
        MissingDirectory,   // Module directory does not exist
        ImportFailed,       // First import failure, loading stopped
        InvalidState,       // Loader used out of order
    };

    Kind kind;
    std::string message;
    std::string module_name;
    std::string path;

    [[nodiscard]] static ModuleError missing_directory(const std::string& dir) {
        return ModuleError{Kind::MissingDirectory, "Cannot find the module directory at: " + dir, {}, dir};
    }

    [[nodiscard]] static ModuleError import_failed(const std::string& name, const std::string& file,
                                                   const std::string& reason) {
        return ModuleError{Kind::ImportFailed,
            "Failed to import module '" + name + "' (" + file + "): " + reason, name, file};
    }

    [[nodiscard]] static ModuleError invalid_state(const std::string& reason) {
        return ModuleError{Kind::InvalidState, "Module loader invalid state: " + reason, {}, {}};
    }
};

/// Bootstrap precondition errors
struct BootError {
    enum class Kind : std::uint8_t {
        MissingLibrary,     // Library root missing or unrecognized
        ConfigInvalid,      // Configuration file could not be parsed
        NetworkFailed,      // Listener could not be set up
        InvalidState,       // Phase run out of order
    };

    Kind kind;
    std::string message;
    std::string detail;

    [[nodiscard]] static BootError missing_library(const std::string& path) {
        return BootError{Kind::MissingLibrary, "Cannot find the MUD library at: " + path, path};
    }

    [[nodiscard]] static BootError config_invalid(const std::string& source, const std::string& reason) {
        return BootError{Kind::ConfigInvalid, "Invalid configuration in " + source + ": " + reason, source};
    }

    [[nodiscard]] static BootError network_failed(const std::string& address, const std::string& reason) {
        return BootError{Kind::NetworkFailed, "Unable to listen on " + address + ": " + reason, address};
    }

    [[nodiscard]] static BootError invalid_state(const std::string& reason) {
        return BootError{Kind::InvalidState, "Invalid state: " + reason, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        IdentityError,
        ModuleError,
        BootError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(IdentityError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ModuleError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(BootError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(IdentityError::Kind kind) {
        switch (kind) {
            case IdentityError::Kind::ResolutionFailed: return ErrorCode::NotFound;
            case IdentityError::Kind::ApplyFailed: return ErrorCode::PermissionDenied;
            case IdentityError::Kind::RootDenied: return ErrorCode::PermissionDenied;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ModuleError::Kind kind) {
        switch (kind) {
            case ModuleError::Kind::MissingDirectory: return ErrorCode::NotFound;
            case ModuleError::Kind::ImportFailed: return ErrorCode::LoadFailed;
            case ModuleError::Kind::InvalidState: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(BootError::Kind kind) {
        switch (kind) {
            case BootError::Kind::MissingLibrary: return ErrorCode::NotFound;
            case BootError::Kind::ConfigInvalid: return ErrorCode::ParseError;
            case BootError::Kind::NetworkFailed: return ErrorCode::IOError;
            case BootError::Kind::InvalidState: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
        return *m_value;
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error: " + m_error.message());
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

template<typename T = void>
Result<T> Err(const char* message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message including kind tag and context
std::string build_error_chain(const Error& error);

} // namespace mudhost_core
