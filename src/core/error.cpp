/// @file error.cpp
/// @brief Error formatting for mudhost_core

#include <mudhost/core/error.hpp>
#include <sstream>

namespace mudhost_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_identity_error(const IdentityError& err) {
    std::ostringstream oss;
    oss << "[IdentityError] " << err.message;
    if (!err.reason.empty() && err.message.find(err.reason) == std::string::npos) {
        oss << " (" << err.reason << ")";
    }
    return oss.str();
}

std::string format_module_error(const ModuleError& err) {
    std::ostringstream oss;
    oss << "[ModuleError] " << err.message;
    if (!err.module_name.empty()) {
        oss << " (module: " << err.module_name << ")";
    }
    return oss.str();
}

std::string format_boot_error(const BootError& err) {
    std::ostringstream oss;
    oss << "[BootError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    if (const auto* e = error.as<IdentityError>()) {
        oss << detail::format_identity_error(*e);
    } else if (const auto* e = error.as<ModuleError>()) {
        oss << detail::format_module_error(*e);
    } else if (const auto* e = error.as<BootError>()) {
        oss << detail::format_boot_error(*e);
    } else {
        oss << "[" << error_code_name(error.code()) << "] " << error.message();
    }

    if (!error.context().empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

} // namespace mudhost_core
