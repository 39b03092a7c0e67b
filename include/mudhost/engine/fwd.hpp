#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for mudhost_engine

#include <cstdint>

namespace mudhost_engine {

// Configuration
enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigStore;

// Command line
struct CommandLine;

// Event engine
class IEventEngine;
class EventLoop;
struct TimerId;

// Shutdown and other named hooks
enum class HookPriority : std::int32_t;
class HookRegistry;

// Network
struct ListenAddress;
class Listener;
class INetwork;
class NetworkService;

} // namespace mudhost_engine
