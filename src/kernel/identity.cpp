/// @file identity.cpp
/// @brief Process identity transition implementation

#include <mudhost/kernel/identity.hpp>
#include <mudhost/engine/config.hpp>
#include <mudhost/core/log.hpp>

#include <cerrno>
#include <cstring>
#include <limits>

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mudhost_kernel {

// =============================================================================
// PosixIdentitySystem
// =============================================================================

uid_t PosixIdentitySystem::current_uid() const {
    return ::getuid();
}

uid_t PosixIdentitySystem::effective_uid() const {
    return ::geteuid();
}

gid_t PosixIdentitySystem::current_gid() const {
    return ::getgid();
}

std::optional<uid_t> PosixIdentitySystem::lookup_user(const std::string& name) const {
    const passwd* entry = ::getpwnam(name.c_str());
    if (!entry) return std::nullopt;
    return entry->pw_uid;
}

std::optional<gid_t> PosixIdentitySystem::lookup_group(const std::string& name) const {
    const group* entry = ::getgrnam(name.c_str());
    if (!entry) return std::nullopt;
    return entry->gr_gid;
}

std::optional<std::string> PosixIdentitySystem::user_name(uid_t uid) const {
    const passwd* entry = ::getpwuid(uid);
    if (!entry || !entry->pw_name) return std::nullopt;
    return std::string(entry->pw_name);
}

std::optional<std::string> PosixIdentitySystem::group_name(gid_t gid) const {
    const group* entry = ::getgrgid(gid);
    if (!entry || !entry->gr_name) return std::nullopt;
    return std::string(entry->gr_name);
}

mudhost_core::Result<void> PosixIdentitySystem::set_uid(uid_t uid) {
    if (::setuid(uid) != 0) {
        return mudhost_core::Err(mudhost_core::Error(mudhost_core::ErrorCode::PermissionDenied,
                                                     std::strerror(errno)));
    }
    return mudhost_core::Ok();
}

mudhost_core::Result<void> PosixIdentitySystem::set_gid(gid_t gid) {
    if (::setgid(gid) != 0) {
        return mudhost_core::Err(mudhost_core::Error(mudhost_core::ErrorCode::PermissionDenied,
                                                     std::strerror(errno)));
    }
    return mudhost_core::Ok();
}

mode_t PosixIdentitySystem::set_umask(mode_t mask) {
    return ::umask(mask);
}

// =============================================================================
// Umask Parsing
// =============================================================================

std::optional<mode_t> parse_umask(const IdentityValue& value) {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        if (*number < 0 || *number > 0777) return std::nullopt;
        return static_cast<mode_t>(*number);
    }

    std::string text = std::get<std::string>(value);
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'o' || text[1] == 'O')) {
        text = text.substr(2);
    }
    if (text.empty() || text.size() > 12) {
        return std::nullopt;
    }

    unsigned long mask = 0;
    for (char c : text) {
        if (c < '0' || c > '7') return std::nullopt;
        mask = mask * 8 + static_cast<unsigned long>(c - '0');
    }
    if (mask > 0777) return std::nullopt;
    return static_cast<mode_t>(mask);
}

// =============================================================================
// PrivilegeTransition
// =============================================================================

PrivilegeTransition::PrivilegeTransition(IdentitySystem& system, const mudhost_engine::ConfigStore& config)
    : m_system(system), m_config(config) {
}

mudhost_core::Result<ResolvedIdentity> PrivilegeTransition::apply(const IdentitySpec& spec) {
    if (m_applied) {
        return mudhost_core::Err<ResolvedIdentity>(
            mudhost_core::Error(mudhost_core::ErrorCode::InvalidState, "Identity already applied"));
    }
    m_applied = true;

    // Empty strings count as absent
    auto pick = [this](const std::optional<IdentityValue>& given, const char* key, bool numeric_text) {
        if (given) {
            const auto* text = std::get_if<std::string>(&*given);
            if (!text || !text->empty()) {
                return given;
            }
        }
        return from_config(key, numeric_text);
    };

    ResolvedIdentity resolved;

    auto uid_result = apply_uid(pick(spec.uid, UID_KEY, true), resolved);
    if (!uid_result) {
        return mudhost_core::Err<ResolvedIdentity>(uid_result.error());
    }

    auto root_result = check_root(resolved);
    if (!root_result) {
        return mudhost_core::Err<ResolvedIdentity>(root_result.error());
    }

    auto gid_result = apply_gid(pick(spec.gid, GID_KEY, true), resolved);
    if (!gid_result) {
        return mudhost_core::Err<ResolvedIdentity>(gid_result.error());
    }

    apply_umask(pick(spec.umask, UMASK_KEY, false), resolved);

    return resolved;
}

std::optional<IdentityValue> PrivilegeTransition::from_config(const char* key, bool numeric_text) const {
    auto value = m_config.get(key);
    if (!value) {
        return std::nullopt;
    }

    if (const auto* number = std::get_if<std::int64_t>(&*value)) {
        return IdentityValue{*number};
    }
    if (const auto* text = std::get_if<std::string>(&*value)) {
        if (text->empty()) return std::nullopt;
        return numeric_text ? identity_value(*text) : IdentityValue{*text};
    }
    // Booleans and floats are not identities; surface them as text so they
    // fail resolution with a readable message
    return IdentityValue{mudhost_engine::to_string(*value)};
}

std::string PrivilegeTransition::describe_user(uid_t uid) const {
    auto name = m_system.user_name(uid);
    return name ? std::to_string(uid) + " (" + *name + ")" : std::to_string(uid);
}

std::string PrivilegeTransition::describe_group(gid_t gid) const {
    auto name = m_system.group_name(gid);
    return name ? std::to_string(gid) + " (" + *name + ")" : std::to_string(gid);
}

mudhost_core::Result<void> PrivilegeTransition::apply_uid(const std::optional<IdentityValue>& value,
                                                          ResolvedIdentity& out) {
    if (!value) {
        return mudhost_core::Ok();
    }

    auto log = mudhost_core::kernel_logger();
    uid_t uid = 0;

    if (const auto* number = std::get_if<std::int64_t>(&*value)) {
        // ((uid_t)-1) is reserved and never names a user
        if (*number < 0 || *number >= static_cast<std::int64_t>(std::numeric_limits<uid_t>::max())) {
            log->critical("No such user '{}'.", *number);
            return mudhost_core::Err(mudhost_core::IdentityError::no_such_user(std::to_string(*number)));
        }
        uid = static_cast<uid_t>(*number);
    } else {
        const auto& name = std::get<std::string>(*value);
        auto found = m_system.lookup_user(name);
        if (!found) {
            log->critical("No such user '{}'.", name);
            return mudhost_core::Err(mudhost_core::IdentityError::no_such_user(name));
        }
        uid = *found;
    }

    out.uid = uid;
    out.explicit_root = (uid == 0);

    if (m_system.current_uid() == uid) {
        return mudhost_core::Ok();
    }

    auto set = m_system.set_uid(uid);
    if (!set) {
        log->critical("Unable to assume the UID {}: {}", describe_user(uid), set.error().message());
        return mudhost_core::Err(
            mudhost_core::IdentityError::apply_failed("UID " + std::to_string(uid), set.error().message()));
    }

    out.uid_changed = true;
    log->info("Assuming the UID {}.", describe_user(uid));
    return mudhost_core::Ok();
}

mudhost_core::Result<void> PrivilegeTransition::check_root(const ResolvedIdentity& resolved) {
    if (m_system.effective_uid() != 0) {
        return mudhost_core::Ok();
    }

    auto log = mudhost_core::kernel_logger();
    if (resolved.explicit_root) {
        log->warn("The server is running as root. This is not recommended.");
        return mudhost_core::Ok();
    }

    log->critical("Please do not run the server as root.");
    log->critical("Set a UID via the --uid command-line argument, or in the MUD configuration file. "
                  "If the server must run as root, provide a UID of 0.");
    return mudhost_core::Err(mudhost_core::IdentityError::root_denied());
}

mudhost_core::Result<void> PrivilegeTransition::apply_gid(const std::optional<IdentityValue>& value,
                                                          ResolvedIdentity& out) {
    if (!value) {
        return mudhost_core::Ok();
    }

    auto log = mudhost_core::kernel_logger();
    gid_t gid = 0;

    if (const auto* number = std::get_if<std::int64_t>(&*value)) {
        // ((gid_t)-1) is reserved and never names a group
        if (*number < 0 || *number >= static_cast<std::int64_t>(std::numeric_limits<gid_t>::max())) {
            log->critical("No such group '{}'.", *number);
            return mudhost_core::Err(mudhost_core::IdentityError::no_such_group(std::to_string(*number)));
        }
        gid = static_cast<gid_t>(*number);
    } else {
        const auto& name = std::get<std::string>(*value);
        auto found = m_system.lookup_group(name);
        if (!found) {
            log->critical("No such group '{}'.", name);
            return mudhost_core::Err(mudhost_core::IdentityError::no_such_group(name));
        }
        gid = *found;
    }

    out.gid = gid;

    if (m_system.current_gid() == gid) {
        return mudhost_core::Ok();
    }

    auto set = m_system.set_gid(gid);
    if (!set) {
        log->critical("Unable to assume the GID {}: {}", describe_group(gid), set.error().message());
        return mudhost_core::Err(
            mudhost_core::IdentityError::apply_failed("GID " + std::to_string(gid), set.error().message()));
    }

    out.gid_changed = true;
    log->info("Assuming the GID {}.", describe_group(gid));
    return mudhost_core::Ok();
}

void PrivilegeTransition::apply_umask(const std::optional<IdentityValue>& value, ResolvedIdentity& out) {
    if (!value) {
        return;
    }

    auto mask = parse_umask(*value);
    if (!mask) {
        mudhost_core::kernel_logger()->warn("Invalid value for umask '{}'.", to_string(*value));
        return;
    }

    mode_t old = m_system.set_umask(*mask);
    out.umask = *mask;
    out.previous_umask = old;
    mudhost_core::kernel_logger()->info("Assuming the umask {:04o} (old was {:04o}).",
                                        static_cast<unsigned>(*mask), static_cast<unsigned>(old));
}

} // namespace mudhost_kernel
