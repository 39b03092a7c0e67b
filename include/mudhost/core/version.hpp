#pragma once

/// @file version.hpp
/// @brief Semantic versioning for mudhost

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <compare>

namespace mudhost_core {

// =============================================================================
// Version
// =============================================================================

/// Semantic version (major.minor.patch)
struct Version {
    std::uint16_t major = 0;
    std::uint16_t minor = 0;
    std::uint16_t patch = 0;

    constexpr Version() noexcept = default;

    constexpr Version(std::uint16_t maj, std::uint16_t min, std::uint16_t pat) noexcept
        : major(maj), minor(min), patch(pat) {}

    [[nodiscard]] std::string to_string() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    constexpr auto operator<=>(const Version&) const noexcept = default;
    constexpr bool operator==(const Version&) const noexcept = default;
};

/// Server version, shown in the startup banner and by --version
Version server_version();

/// ABI version a module's entry point must declare
inline constexpr std::uint32_t MODULE_API_VERSION = 1;

} // namespace mudhost_core
