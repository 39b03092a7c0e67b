/// @file types.cpp
/// @brief Core type implementations for mudhost_kernel

#include <mudhost/kernel/types.hpp>

#include <algorithm>
#include <charconv>

namespace mudhost_kernel {

// =============================================================================
// IdentityValue
// =============================================================================

IdentityValue identity_value(const std::string& text) {
    if (!text.empty() && std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        std::int64_t number = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return number;
        }
    }
    return text;
}

std::string to_string(const IdentityValue& value) {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(value);
}

// =============================================================================
// ModuleStatus
// =============================================================================

const char* to_string(ModuleStatus status) {
    switch (status) {
        case ModuleStatus::Pending: return "Pending";
        case ModuleStatus::Loaded: return "Loaded";
        case ModuleStatus::Failed: return "Failed";
    }
    return "Unknown";
}

// =============================================================================
// ModuleManifest
// =============================================================================

const ModuleRecord* ModuleManifest::find(const std::string& name) const {
    for (const auto& record : records) {
        if (record.name == name) return &record;
    }
    return nullptr;
}

std::vector<std::string> ModuleManifest::names() const {
    std::vector<std::string> result;
    result.reserve(records.size());
    for (const auto& record : records) {
        result.push_back(record.name);
    }
    return result;
}

std::size_t ModuleManifest::count(ModuleStatus status) const {
    return static_cast<std::size_t>(std::count_if(records.begin(), records.end(),
        [status](const ModuleRecord& r) { return r.status == status; }));
}

// =============================================================================
// ControlEvent / BootPhase
// =============================================================================

const char* to_string(ControlEvent event) {
    switch (event) {
        case ControlEvent::Normal: return "Normal";
        case ControlEvent::CopyoverRequested: return "CopyoverRequested";
        case ControlEvent::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

const char* to_string(BootPhase phase) {
    switch (phase) {
        case BootPhase::ConfigLoad: return "ConfigLoad";
        case BootPhase::NetworkInit: return "NetworkInit";
        case BootPhase::EarlyIdentity: return "EarlyIdentity";
        case BootPhase::CompatibilityShim: return "CompatibilityShim";
        case BootPhase::ModuleLoad: return "ModuleLoad";
        case BootPhase::LateIdentity: return "LateIdentity";
        case BootPhase::SignalRegister: return "SignalRegister";
        case BootPhase::RunLoop: return "RunLoop";
        case BootPhase::ShutdownHooks: return "ShutdownHooks";
        case BootPhase::Terminate: return "Terminate";
    }
    return "Unknown";
}

} // namespace mudhost_kernel
