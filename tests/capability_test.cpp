#include <ot-cpp/capability.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

using namespace ot_cpp;

// -- CapabilitySet ------------------------------------------------------------

TEST(CapabilitySet, default_constructed_is_empty) {
    constexpr auto set = CapabilitySet{};
    EXPECT_TRUE(set.empty());
    EXPECT_FALSE(set.contains(Capability::read));
}

TEST(CapabilitySet, insert_and_erase) {
    auto set = CapabilitySet{Capability::read};
    set.insert(Capability::write);
    EXPECT_TRUE(set.contains(Capability::read));
    EXPECT_TRUE(set.contains(Capability::write));
    EXPECT_FALSE(set.contains(Capability::comment));

    set.erase(Capability::read);
    EXPECT_FALSE(set.contains(Capability::read));
    EXPECT_TRUE(set.contains(Capability::write));
}

TEST(CapabilitySet, equality_ignores_insertion_order) {
    EXPECT_EQ((CapabilitySet{Capability::write, Capability::read}),
              (CapabilitySet{Capability::read, Capability::write}));
}

TEST(Capability, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(Capability::read),    "read");
    EXPECT_EQ(to_string_view(Capability::write),   "write");
    EXPECT_EQ(to_string_view(Capability::comment), "comment");
}

// -- Roles --------------------------------------------------------------------

TEST(Role, capabilities_of_each_role) {
    EXPECT_EQ(capabilities_of(Role::viewer), (CapabilitySet{Capability::read}));
    EXPECT_EQ(capabilities_of(Role::commenter),
              (CapabilitySet{Capability::read, Capability::comment}));
    EXPECT_TRUE(capabilities_of(Role::editor).contains(Capability::write));
    EXPECT_TRUE(capabilities_of(Role::owner).contains(Capability::write));
    EXPECT_FALSE(capabilities_of(Role::commenter).contains(Capability::write));
}

TEST(Role, parse_role_accepts_every_name) {
    for (auto role : {Role::viewer, Role::commenter, Role::editor, Role::owner}) {
        EXPECT_EQ(parse_role(to_string_view(role)), role);
    }
}

TEST(Role, parse_role_rejects_unknown_names) {
    EXPECT_FALSE(parse_role("admin").has_value());
    EXPECT_FALSE(parse_role("").has_value());
    EXPECT_FALSE(parse_role("Owner").has_value());
}

// -- PermissionTable ----------------------------------------------------------

TEST(PermissionTable, unknown_clients_get_the_default_role) {
    auto table = PermissionTable{};
    EXPECT_EQ(table.default_role(), Role::viewer);
    EXPECT_EQ(table.role_of("stranger"), Role::viewer);
    EXPECT_TRUE(table.has_capability("stranger", Capability::read));
    EXPECT_FALSE(table.has_capability("stranger", Capability::write));
}

TEST(PermissionTable, configured_default_role) {
    auto table = PermissionTable{Role::editor};
    EXPECT_TRUE(table.has_capability("anyone", Capability::write));
}

TEST(PermissionTable, grant_and_revoke) {
    auto table = PermissionTable{};
    table.grant("alice", Role::editor);
    EXPECT_TRUE(table.has_capability("alice", Capability::write));

    EXPECT_TRUE(table.revoke("alice"));
    EXPECT_FALSE(table.has_capability("alice", Capability::write));
    EXPECT_FALSE(table.revoke("alice"));
}

TEST(PermissionTable, grant_replaces_previous_role) {
    auto table = PermissionTable{};
    table.grant("bob", Role::owner);
    table.grant("bob", Role::commenter);
    EXPECT_EQ(table.role_of("bob"), Role::commenter);
    EXPECT_TRUE(table.has_capability("bob", Capability::comment));
    EXPECT_FALSE(table.has_capability("bob", Capability::write));
}

TEST(PermissionTable, usable_through_the_provider_interface) {
    auto table = std::make_shared<PermissionTable>();
    table->grant("alice", Role::editor);
    std::shared_ptr<const PermissionProvider> provider = table;
    EXPECT_TRUE(provider->has_capability("alice", Capability::write));
    EXPECT_FALSE(provider->has_capability("bob", Capability::write));
}

TEST(PermissionTable, concurrent_grants_and_reads) {
    auto table = PermissionTable{};
    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&table, t] {
            for (int i = 0; i < 200; ++i) {
                auto client = "c" + std::to_string(t) + "-" + std::to_string(i);
                table.grant(client, Role::editor);
                EXPECT_TRUE(table.has_capability(client, Capability::write));
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(table.role_of("c3-199"), Role::editor);
}
