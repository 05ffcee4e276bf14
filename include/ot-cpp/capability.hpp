/// @file capability.hpp
/// @brief Capabilities, roles and the permission collaborator interface.

#pragma once

#include <ot-cpp/types.hpp>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string_view>

namespace ot_cpp {

/// A single thing a client may do with a document.
enum class Capability : std::uint8_t {
    read    = 1 << 0,  ///< Receive the document and its updates.
    write   = 1 << 1,  ///< Submit insert and delete operations.
    comment = 1 << 2,  ///< Annotate the document.
};

/// Convert a Capability to its string representation.
constexpr auto to_string_view(Capability cap) noexcept -> std::string_view {
    switch (cap) {
        case Capability::read:    return "read";
        case Capability::write:   return "write";
        case Capability::comment: return "comment";
    }
    return "unknown";
}

/// A set of capabilities, stored as a bit mask.
class CapabilitySet {
public:
    constexpr CapabilitySet() = default;

    constexpr CapabilitySet(std::initializer_list<Capability> caps) {
        for (auto cap : caps) insert(cap);
    }

    constexpr auto contains(Capability cap) const -> bool {
        return (bits_ & static_cast<std::uint8_t>(cap)) != 0;
    }

    constexpr void insert(Capability cap) { bits_ |= static_cast<std::uint8_t>(cap); }
    constexpr void erase(Capability cap) { bits_ &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(cap)); }

    constexpr auto empty() const -> bool { return bits_ == 0; }
    constexpr auto bits() const -> std::uint8_t { return bits_; }

    auto operator==(const CapabilitySet&) const -> bool = default;

private:
    std::uint8_t bits_{0};
};

/// Coarse-grained access levels granted per document.
enum class Role : std::uint8_t {
    viewer,     ///< read
    commenter,  ///< read, comment
    editor,     ///< read, write, comment
    owner,      ///< everything an editor can do; granted to the creator
};

/// Convert a Role to its string representation.
constexpr auto to_string_view(Role role) noexcept -> std::string_view {
    switch (role) {
        case Role::viewer:    return "viewer";
        case Role::commenter: return "commenter";
        case Role::editor:    return "editor";
        case Role::owner:     return "owner";
    }
    return "unknown";
}

/// Parse a role name produced by to_string_view(Role).
auto parse_role(std::string_view name) -> std::optional<Role>;

/// The capabilities a role carries.
constexpr auto capabilities_of(Role role) -> CapabilitySet {
    switch (role) {
        case Role::viewer:    return {Capability::read};
        case Role::commenter: return {Capability::read, Capability::comment};
        case Role::editor:
        case Role::owner:     return {Capability::read, Capability::write, Capability::comment};
    }
    return {};
}

/// The permission collaborator consulted by the sync controller.
///
/// Queried once per submitted operation. Implementations must be safe to
/// call from multiple threads.
class PermissionProvider {
public:
    virtual ~PermissionProvider() = default;

    /// Check whether `client` currently holds `cap`.
    virtual auto has_capability(const ClientId& client, Capability cap) const -> bool = 0;
};

/// An in-memory, thread-safe role table for one document.
///
/// Clients without an explicit grant get the default role.
class PermissionTable final : public PermissionProvider {
public:
    explicit PermissionTable(Role default_role = Role::viewer)
        : default_role_{default_role} {}

    /// Assign a role to a client, replacing any previous grant.
    void grant(const ClientId& client, Role role);

    /// Remove an explicit grant. @return true if one existed.
    auto revoke(const ClientId& client) -> bool;

    /// The effective role of a client.
    auto role_of(const ClientId& client) const -> Role;

    /// The effective capabilities of a client.
    auto capabilities(const ClientId& client) const -> CapabilitySet;

    auto has_capability(const ClientId& client, Capability cap) const -> bool override;

    auto default_role() const -> Role { return default_role_; }

private:
    Role default_role_;
    std::map<ClientId, Role> roles_;
    mutable std::shared_mutex mutex_;
};

}  // namespace ot_cpp
