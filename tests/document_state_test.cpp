#include <ot-cpp/document_state.hpp>
#include <ot-cpp/transform.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace ot_cpp;

TEST(DocumentState, default_constructed_is_empty_at_revision_zero) {
    const auto state = DocumentState{};
    EXPECT_EQ(state.revision(), 0);
    EXPECT_EQ(state.content(), "");
    EXPECT_EQ(state.size(), 0u);
    EXPECT_EQ(state.snapshot(), (Snapshot{0, ""}));
}

TEST(DocumentState, apply_updates_content_and_revision_together) {
    auto state = DocumentState{};
    EXPECT_EQ(state.apply(make_insert(OpId{"x", 1}, 0, "hello")), 1);
    EXPECT_EQ(state.apply(make_insert(OpId{"y", 1}, 5, "!!", 1)), 2);

    EXPECT_EQ(state.content(), "hello!!");
    EXPECT_EQ(state.revision(), 2);
    EXPECT_EQ(static_cast<std::size_t>(state.revision()), state.log().size());
}

TEST(DocumentState, check_reports_out_of_bounds_as_malformed) {
    auto state = DocumentState{};
    state.apply(make_insert(OpId{"x", 1}, 0, "abc"));

    EXPECT_FALSE(state.check(make_delete(OpId{"x", 2}, 1, 2)).has_value());
    auto error = state.check(make_delete(OpId{"x", 2}, 1, 5));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::malformed_operation);
}

TEST(DocumentState, apply_rejects_out_of_bounds_without_changes) {
    auto state = DocumentState{};
    state.apply(make_insert(OpId{"x", 1}, 0, "abc"));

    EXPECT_THROW(state.apply(make_insert(OpId{"x", 2}, 9, "z")), std::out_of_range);
    EXPECT_EQ(state.content(), "abc");
    EXPECT_EQ(state.revision(), 1);
}

TEST(DocumentState, content_equals_replayed_history) {
    auto state = DocumentState{};
    state.apply(make_insert(OpId{"a", 1}, 0, "the quick fox"));
    state.apply(make_insert(OpId{"a", 2}, 10, "brown ", 1));
    state.apply(make_delete(OpId{"b", 1}, 0, 4, 2));
    state.apply(make_insert(OpId{"b", 2}, 0, "a ", 3));

    EXPECT_EQ(state.content(), "a quick brown fox");
    for (auto r = Revision{0}; r <= state.revision(); ++r) {
        EXPECT_EQ(state.content_at(r), state.log().replay("", r));
    }
    EXPECT_EQ(state.content_at(state.revision()), state.content());
    EXPECT_EQ(state.content_at(2), "the quick brown fox");
}

TEST(DocumentState, from_snapshot_starts_the_log_after_it) {
    auto state = DocumentState::from_snapshot(Snapshot{7, "seven"});
    EXPECT_EQ(state.revision(), 7);
    EXPECT_EQ(state.content(), "seven");
    EXPECT_EQ(state.log().base(), 7);
    EXPECT_TRUE(state.log().empty());

    EXPECT_EQ(state.apply(make_insert(OpId{"a", 1}, 5, "!", 7)), 8);
    EXPECT_EQ(state.content_at(7), "seven");
    EXPECT_EQ(state.content_at(8), "seven!");
    EXPECT_THROW((void)state.content_at(6), std::out_of_range);
    EXPECT_EQ(state.base_snapshot(), (Snapshot{7, "seven"}));
}

TEST(DocumentState, copies_are_independent) {
    auto state = DocumentState{};
    state.apply(make_insert(OpId{"a", 1}, 0, "abc"));

    auto copy = state;
    copy.apply(make_delete(OpId{"a", 2}, 0, 1, 1));

    EXPECT_EQ(state.content(), "abc");
    EXPECT_EQ(copy.content(), "bc");
    EXPECT_EQ(state.revision(), 1);
    EXPECT_EQ(copy.revision(), 2);
}

TEST(DocumentState, many_scattered_edits_match_a_plain_string) {
    auto state = DocumentState{};
    auto expected = std::string{};
    for (std::uint64_t i = 1; i <= 300; ++i) {
        auto pos = static_cast<std::size_t>((i * 7919) % (expected.size() + 1));
        auto op = (i % 3 == 0 && pos < expected.size())
            ? make_delete(OpId{"a", i}, pos, 1)
            : make_insert(OpId{"a", i}, pos, std::string(i % 5 + 1, static_cast<char>('a' + i % 26)));
        apply_operation(expected, op);
        state.apply(op);
    }
    EXPECT_EQ(state.content(), expected);
    EXPECT_EQ(state.size(), expected.size());
}
