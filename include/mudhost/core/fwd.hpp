#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for mudhost_core

#include <cstdint>

namespace mudhost_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct IdentityError;
struct ModuleError;
struct BootError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Version
// =============================================================================

struct Version;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace mudhost_core
