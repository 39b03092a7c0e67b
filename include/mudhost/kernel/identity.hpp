/// @file identity.hpp
/// @brief Process identity transition (uid, gid, umask)
///
/// The transition runs once per process, in a fixed order:
/// uid, the anti-root guard, gid, then umask. Every change only ever
/// moves the process toward lower privilege; nothing here reverts one.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <mudhost/core/error.hpp>

#include <optional>
#include <string>

#include <sys/types.h>

namespace mudhost_engine {
class ConfigStore;
}

namespace mudhost_kernel {

// =============================================================================
// Identity System
// =============================================================================

/// OS identity primitives used by PrivilegeTransition
class IdentitySystem {
public:
    virtual ~IdentitySystem() = default;

    [[nodiscard]] virtual uid_t current_uid() const = 0;
    [[nodiscard]] virtual uid_t effective_uid() const = 0;
    [[nodiscard]] virtual gid_t current_gid() const = 0;

    /// Look up a user or group by name
    [[nodiscard]] virtual std::optional<uid_t> lookup_user(const std::string& name) const = 0;
    [[nodiscard]] virtual std::optional<gid_t> lookup_group(const std::string& name) const = 0;

    /// Reverse lookups, for log messages
    [[nodiscard]] virtual std::optional<std::string> user_name(uid_t uid) const = 0;
    [[nodiscard]] virtual std::optional<std::string> group_name(gid_t gid) const = 0;

    [[nodiscard]] virtual mudhost_core::Result<void> set_uid(uid_t uid) = 0;
    [[nodiscard]] virtual mudhost_core::Result<void> set_gid(gid_t gid) = 0;

    /// Set the umask, returning the previous one
    virtual mode_t set_umask(mode_t mask) = 0;
};

/// IdentitySystem backed by <unistd.h>, <pwd.h> and <grp.h>
class PosixIdentitySystem final : public IdentitySystem {
public:
    [[nodiscard]] uid_t current_uid() const override;
    [[nodiscard]] uid_t effective_uid() const override;
    [[nodiscard]] gid_t current_gid() const override;

    [[nodiscard]] std::optional<uid_t> lookup_user(const std::string& name) const override;
    [[nodiscard]] std::optional<gid_t> lookup_group(const std::string& name) const override;

    [[nodiscard]] std::optional<std::string> user_name(uid_t uid) const override;
    [[nodiscard]] std::optional<std::string> group_name(gid_t gid) const override;

    [[nodiscard]] mudhost_core::Result<void> set_uid(uid_t uid) override;
    [[nodiscard]] mudhost_core::Result<void> set_gid(gid_t gid) override;

    mode_t set_umask(mode_t mask) override;
};

// =============================================================================
// Umask Parsing
// =============================================================================

/// Interpret a umask value. Strings are octal with an optional "0" or
/// "0o" prefix; numbers are taken as the mode. Returns nullopt when the
/// value is not a mask in 0..0777.
[[nodiscard]] std::optional<mode_t> parse_umask(const IdentityValue& value);

// =============================================================================
// Privilege Transition
// =============================================================================

/// Resolves an IdentitySpec against the user/group databases and applies it
class PrivilegeTransition {
public:
    /// Configuration keys consulted for absent spec fields
    static constexpr const char* UID_KEY = "uid";
    static constexpr const char* GID_KEY = "gid";
    static constexpr const char* UMASK_KEY = "umask";

    PrivilegeTransition(IdentitySystem& system, const mudhost_engine::ConfigStore& config);

    /// Apply the identity. Logs at the point of failure and returns the
    /// error; an unusable umask only warns.
    [[nodiscard]] mudhost_core::Result<ResolvedIdentity> apply(const IdentitySpec& spec);

    [[nodiscard]] bool applied() const { return m_applied; }

private:
    [[nodiscard]] std::optional<IdentityValue> from_config(const char* key, bool numeric_text) const;
    [[nodiscard]] std::string describe_user(uid_t uid) const;
    [[nodiscard]] std::string describe_group(gid_t gid) const;

    [[nodiscard]] mudhost_core::Result<void> apply_uid(const std::optional<IdentityValue>& value,
                                                        ResolvedIdentity& out);
    [[nodiscard]] mudhost_core::Result<void> check_root(const ResolvedIdentity& resolved);
    [[nodiscard]] mudhost_core::Result<void> apply_gid(const std::optional<IdentityValue>& value,
                                                        ResolvedIdentity& out);
    void apply_umask(const std::optional<IdentityValue>& value, ResolvedIdentity& out);

    IdentitySystem& m_system;
    const mudhost_engine::ConfigStore& m_config;
    bool m_applied = false;
};

} // namespace mudhost_kernel
