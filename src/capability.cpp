#include <ot-cpp/capability.hpp>

#include <array>
#include <mutex>

namespace ot_cpp {

auto parse_role(std::string_view name) -> std::optional<Role> {
    static constexpr auto roles = std::array{
        Role::viewer, Role::commenter, Role::editor, Role::owner,
    };
    for (auto role : roles) {
        if (to_string_view(role) == name) return role;
    }
    return std::nullopt;
}

void PermissionTable::grant(const ClientId& client, Role role) {
    auto lock = std::unique_lock{mutex_};
    roles_.insert_or_assign(client, role);
}

auto PermissionTable::revoke(const ClientId& client) -> bool {
    auto lock = std::unique_lock{mutex_};
    return roles_.erase(client) > 0;
}

auto PermissionTable::role_of(const ClientId& client) const -> Role {
    auto lock = std::shared_lock{mutex_};
    auto it = roles_.find(client);
    return it != roles_.end() ? it->second : default_role_;
}

auto PermissionTable::capabilities(const ClientId& client) const -> CapabilitySet {
    return capabilities_of(role_of(client));
}

auto PermissionTable::has_capability(const ClientId& client, Capability cap) const -> bool {
    return capabilities(client).contains(cap);
}

}  // namespace ot_cpp
