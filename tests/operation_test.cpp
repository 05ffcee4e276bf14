#include <ot-cpp/operation.hpp>

#include <gtest/gtest.h>

using namespace ot_cpp;

TEST(OpKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpKind::insert), "insert");
    EXPECT_EQ(to_string_view(OpKind::del),    "delete");
}

TEST(Operation, make_insert_fills_fields) {
    const auto op = make_insert(OpId{"alice", 3}, 4, "hey", 7);

    EXPECT_EQ(op.id, (OpId{"alice", 3}));
    EXPECT_EQ(op.author(), "alice");
    EXPECT_EQ(op.kind, OpKind::insert);
    EXPECT_EQ(op.position, 4u);
    EXPECT_EQ(op.text, "hey");
    EXPECT_EQ(op.length, 0u);
    EXPECT_EQ(op.base_revision, 7);
}

TEST(Operation, make_delete_fills_fields) {
    const auto op = make_delete(OpId{"bob", 1}, 2, 5);

    EXPECT_EQ(op.kind, OpKind::del);
    EXPECT_EQ(op.position, 2u);
    EXPECT_EQ(op.length, 5u);
    EXPECT_TRUE(op.text.empty());
    EXPECT_EQ(op.base_revision, 0);
}

TEST(Operation, extent_and_end) {
    const auto ins = make_insert(OpId{"a", 1}, 2, "xyz");
    const auto del = make_delete(OpId{"a", 2}, 1, 4);

    EXPECT_EQ(ins.extent(), 3u);
    EXPECT_EQ(ins.end(), 5u);
    EXPECT_EQ(del.extent(), 4u);
    EXPECT_EQ(del.end(), 5u);
}

TEST(Operation, empty_insert_and_zero_length_delete_are_noops) {
    EXPECT_TRUE(make_insert(OpId{"a", 1}, 0, "").is_noop());
    EXPECT_TRUE(make_delete(OpId{"a", 1}, 3, 0).is_noop());
    EXPECT_FALSE(make_insert(OpId{"a", 1}, 0, "x").is_noop());
}

TEST(Operation, rebased_returns_a_copy_with_new_base) {
    const auto op = make_insert(OpId{"a", 1}, 0, "x", 2);
    const auto moved = op.rebased(9);

    EXPECT_EQ(moved.base_revision, 9);
    EXPECT_EQ(op.base_revision, 2);
    EXPECT_EQ(moved.position, op.position);
    EXPECT_EQ(moved.id, op.id);
}

TEST(Operation, fits_checks_bounds) {
    EXPECT_TRUE(fits(make_insert(OpId{"a", 1}, 5, "x"), 5));
    EXPECT_FALSE(fits(make_insert(OpId{"a", 1}, 6, "x"), 5));
    EXPECT_TRUE(fits(make_delete(OpId{"a", 1}, 2, 3), 5));
    EXPECT_FALSE(fits(make_delete(OpId{"a", 1}, 2, 4), 5));
    EXPECT_FALSE(fits(make_delete(OpId{"a", 1}, 6, 0), 5));
    EXPECT_TRUE(fits(make_delete(OpId{"a", 1}, 5, 0), 5));
}

TEST(Operation, equality_covers_every_field) {
    const auto a = make_insert(OpId{"a", 1}, 0, "x", 0);
    EXPECT_EQ(a, make_insert(OpId{"a", 1}, 0, "x", 0));
    EXPECT_NE(a, make_insert(OpId{"a", 2}, 0, "x", 0));
    EXPECT_NE(a, make_insert(OpId{"a", 1}, 1, "x", 0));
    EXPECT_NE(a, make_insert(OpId{"a", 1}, 0, "y", 0));
    EXPECT_NE(a, make_insert(OpId{"a", 1}, 0, "x", 1));
}
