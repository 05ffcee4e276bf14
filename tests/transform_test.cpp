#include <ot-cpp/transform.hpp>

#include <gtest/gtest.h>

#include <random>
#include <stdexcept>
#include <string>

using namespace ot_cpp;

namespace {

auto ins(const char* author, std::size_t pos, std::string text) -> Operation {
    return make_insert(OpId{author, 1}, pos, std::move(text));
}

auto del(const char* author, std::size_t pos, std::size_t len) -> Operation {
    return make_delete(OpId{author, 1}, pos, len);
}

auto applied(std::string content, const Operation& op) -> std::string {
    apply_operation(content, op);
    return content;
}

// Apply b then a', and a then b'; both must give the same text.
void expect_converges(const std::string& doc, const Operation& a, const Operation& b) {
    auto via_b = applied(applied(doc, b), transform(a, b));
    auto via_a = applied(applied(doc, a), transform(b, a));
    EXPECT_EQ(via_b, via_a) << "doc=" << doc;
}

}  // namespace

// -- Insert vs insert ---------------------------------------------------------

TEST(Transform, insert_before_insert_is_unchanged) {
    auto t = transform(ins("a", 1, "x"), ins("b", 3, "yy"));
    EXPECT_EQ(t.position, 1u);
}

TEST(Transform, insert_after_insert_shifts_right) {
    auto t = transform(ins("a", 4, "x"), ins("b", 2, "yy"));
    EXPECT_EQ(t.position, 6u);
}

TEST(Transform, same_position_lower_author_keeps_place) {
    auto a = ins("a", 0, "A");
    auto b = ins("b", 0, "B");
    EXPECT_EQ(transform(a, b).position, 0u);
    EXPECT_EQ(transform(b, a).position, 1u);
    EXPECT_EQ(applied(applied("", a), transform(b, a)), "AB");
    EXPECT_EQ(applied(applied("", b), transform(a, b)), "AB");
}

TEST(Transform, same_author_ties_break_on_counter) {
    auto first = make_insert(OpId{"a", 1}, 2, "1");
    auto second = make_insert(OpId{"a", 2}, 2, "2");
    EXPECT_EQ(transform(first, second).position, 2u);
    EXPECT_EQ(transform(second, first).position, 3u);
}

// -- Insert vs delete ---------------------------------------------------------

TEST(Transform, insert_at_delete_start_is_unchanged) {
    auto t = transform(ins("a", 2, "x"), del("b", 2, 3));
    EXPECT_EQ(t.position, 2u);
    EXPECT_EQ(t.text, "x");
}

TEST(Transform, insert_inside_delete_is_clamped_and_emptied) {
    auto t = transform(ins("a", 3, "x"), del("b", 2, 3));
    EXPECT_EQ(t.position, 2u);
    EXPECT_TRUE(t.text.empty());
}

TEST(Transform, insert_after_delete_shifts_left) {
    auto t = transform(ins("a", 7, "x"), del("b", 2, 3));
    EXPECT_EQ(t.position, 4u);
}

TEST(Transform, insert_at_delete_end_shifts_to_start) {
    auto t = transform(ins("a", 5, "x"), del("b", 2, 3));
    EXPECT_EQ(t.position, 2u);
    EXPECT_EQ(t.text, "x");
}

// -- Delete vs insert ---------------------------------------------------------

TEST(Transform, delete_after_insert_at_its_start_shifts_right) {
    auto t = transform(del("a", 2, 3), ins("b", 2, "xy"));
    EXPECT_EQ(t.position, 4u);
    EXPECT_EQ(t.length, 3u);
}

TEST(Transform, delete_before_insert_is_unchanged) {
    auto t = transform(del("a", 0, 2), ins("b", 5, "xy"));
    EXPECT_EQ(t.position, 0u);
    EXPECT_EQ(t.length, 2u);
}

TEST(Transform, delete_absorbs_insert_inside_its_range) {
    auto t = transform(del("a", 2, 3), ins("b", 3, "xy"));
    EXPECT_EQ(t.position, 2u);
    EXPECT_EQ(t.length, 5u);
}

// -- Delete vs delete ---------------------------------------------------------

TEST(Transform, disjoint_deletes_shift) {
    EXPECT_EQ(transform(del("a", 6, 2), del("b", 1, 3)).position, 3u);
    EXPECT_EQ(transform(del("a", 0, 2), del("b", 4, 3)).position, 0u);
}

TEST(Transform, contained_delete_becomes_noop) {
    auto t = transform(del("a", 3, 2), del("b", 1, 6));
    EXPECT_EQ(t.position, 1u);
    EXPECT_EQ(t.length, 0u);
    EXPECT_TRUE(t.is_noop());
}

TEST(Transform, partial_overlap_shrinks_to_remainder) {
    // a covers [2,6), b covers [4,8): a keeps [2,4).
    auto t = transform(del("a", 2, 4), del("b", 4, 4));
    EXPECT_EQ(t.position, 2u);
    EXPECT_EQ(t.length, 2u);

    // and from the other side b keeps [6,8), now at [2,4).
    auto u = transform(del("b", 4, 4), del("a", 2, 4));
    EXPECT_EQ(u.position, 2u);
    EXPECT_EQ(u.length, 2u);
}

TEST(Transform, keeps_id_and_base_revision) {
    auto a = make_insert(OpId{"a", 7}, 4, "x", 3);
    auto t = transform(a, make_insert(OpId{"b", 1}, 0, "yy", 3));
    EXPECT_EQ(t.id, a.id);
    EXPECT_EQ(t.base_revision, 3);
}

TEST(Transform, transform_pair_returns_both_directions) {
    auto a = ins("a", 1, "x");
    auto b = del("b", 0, 3);
    auto [a2, b2] = transform_pair(a, b);
    EXPECT_EQ(a2, transform(a, b));
    EXPECT_EQ(b2, transform(b, a));
}

// -- Convergence --------------------------------------------------------------

TEST(Convergence, delete_range_and_insert_inside_it) {
    // Delete(2..5) and Insert(3) composed against the same text.
    expect_converges("abcdefgh", del("a", 2, 3), ins("b", 3, "XY"));
    expect_converges("abcdefgh", ins("b", 3, "XY"), del("a", 2, 3));
    EXPECT_EQ(applied(applied("abcdefgh", del("a", 2, 3)), transform(ins("b", 3, "XY"), del("a", 2, 3))),
              "abfgh");
}

TEST(Convergence, concurrent_inserts_at_zero_agree_on_interleaving) {
    auto a = ins("a", 0, "aaa");
    auto b = ins("b", 0, "bbb");
    EXPECT_EQ(applied(applied("", a), transform(b, a)), "aaabbb");
    EXPECT_EQ(applied(applied("", b), transform(a, b)), "aaabbb");
}

TEST(Convergence, holds_for_random_pairs) {
    auto rng = std::mt19937{12345};
    auto pick = [&](std::size_t lo, std::size_t hi) {
        return std::uniform_int_distribution<std::size_t>{lo, hi}(rng);
    };
    auto random_op = [&](const std::string& doc, const char* author) {
        auto pos = pick(0, doc.size());
        if (pick(0, 1) == 0) {
            return ins(author, pos, std::string(pick(0, 3), author[0]));
        }
        return del(author, pos, pick(0, doc.size() - pos));
    };

    for (int i = 0; i < 5000; ++i) {
        auto doc = std::string(pick(0, 10), 'z');
        for (auto& c : doc) c = static_cast<char>('a' + pick(0, 7));
        expect_converges(doc, random_op(doc, "p"), random_op(doc, "q"));
    }
}

// -- Index and cursor re-projection -------------------------------------------

TEST(TransformIndex, insert_before_shifts_right) {
    EXPECT_EQ(transform_index(5, ins("a", 2, "xyz")), 8u);
}

TEST(TransformIndex, insert_at_index_sticks_only_when_asked) {
    EXPECT_EQ(transform_index(5, ins("a", 5, "xy")), 5u);
    EXPECT_EQ(transform_index(5, ins("a", 5, "xy"), true), 7u);
}

TEST(TransformIndex, delete_before_shifts_left_and_covering_clamps) {
    EXPECT_EQ(transform_index(8, del("a", 2, 3)), 5u);
    EXPECT_EQ(transform_index(3, del("a", 2, 3)), 2u);
    EXPECT_EQ(transform_index(2, del("a", 2, 3)), 2u);
    EXPECT_EQ(transform_index(1, del("a", 2, 3)), 1u);
}

TEST(TransformCursor, own_insert_moves_collapsed_cursor) {
    auto c = transform_cursor(Cursor::at(3), ins("a", 3, "ab"), true);
    EXPECT_EQ(c, Cursor::at(5));
}

TEST(TransformCursor, foreign_insert_at_cursor_leaves_it) {
    auto c = transform_cursor(Cursor::at(3), ins("b", 3, "ab"), false);
    EXPECT_EQ(c, Cursor::at(3));
}

TEST(TransformCursor, selection_anchor_does_not_follow_own_insert) {
    auto c = transform_cursor(Cursor{.position = 3, .anchor = 1}, ins("a", 3, "ab"), true);
    EXPECT_EQ(c.position, 5u);
    EXPECT_EQ(c.anchor, 1u);
}

TEST(TransformCursor, delete_overlapping_selection_shrinks_it) {
    auto c = transform_cursor(Cursor{.position = 6, .anchor = 2}, del("b", 4, 4));
    EXPECT_EQ(c.position, 4u);
    EXPECT_EQ(c.anchor, 2u);
}

// -- apply --------------------------------------------------------------------

TEST(Apply, inserts_and_deletes) {
    auto s = std::string{"hello"};
    apply_operation(s, ins("a", 5, " world"));
    EXPECT_EQ(s, "hello world");
    apply_operation(s, del("a", 0, 6));
    EXPECT_EQ(s, "world");
}

TEST(Apply, accepts_mutable_and_temporary_operations) {
    auto s = std::string{"abc"};
    auto op = ins("a", 3, "d");
    apply_operation(s, op);
    apply_operation(s, std::move(op));
    apply_operation(s, make_delete(OpId{"a", 2}, 0, 1));
    EXPECT_EQ(s, "bcdd");
}

TEST(Apply, out_of_bounds_throws_and_leaves_content) {
    auto s = std::string{"abc"};
    EXPECT_THROW(apply_operation(s, ins("a", 4, "x")), std::out_of_range);
    EXPECT_THROW(apply_operation(s, del("a", 1, 3)), std::out_of_range);
    EXPECT_EQ(s, "abc");
}
