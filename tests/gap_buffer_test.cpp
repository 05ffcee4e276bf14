#include "../src/text/gap_buffer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>

using namespace ot_cpp::detail;

TEST(GapBuffer, default_constructed_is_empty) {
    const auto buffer = GapBuffer{};
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.str(), "");
}

TEST(GapBuffer, construct_from_text) {
    const auto buffer = GapBuffer{"hello"};
    EXPECT_EQ(buffer.size(), 5u);
    EXPECT_EQ(buffer.str(), "hello");
}

TEST(GapBuffer, insert_at_start_middle_and_end) {
    auto buffer = GapBuffer{"ace"};
    buffer.insert(1, "b");
    buffer.insert(3, "d");
    buffer.insert(5, "f");
    buffer.insert(0, ">");
    EXPECT_EQ(buffer.str(), ">abcdef");
}

TEST(GapBuffer, erase_ranges) {
    auto buffer = GapBuffer{"abcdefgh"};
    buffer.erase(2, 3);
    EXPECT_EQ(buffer.str(), "abfgh");
    buffer.erase(0, 1);
    EXPECT_EQ(buffer.str(), "bfgh");
    buffer.erase(3, 1);
    EXPECT_EQ(buffer.str(), "bfg");
    buffer.erase(1, 0);
    EXPECT_EQ(buffer.str(), "bfg");
}

TEST(GapBuffer, insert_larger_than_the_gap_grows) {
    auto buffer = GapBuffer{"[]"};
    auto big = std::string(1000, 'x');
    buffer.insert(1, big);
    EXPECT_EQ(buffer.size(), 1002u);
    EXPECT_EQ(buffer.str(), "[" + big + "]");
}

TEST(GapBuffer, assign_replaces_content) {
    auto buffer = GapBuffer{"old"};
    buffer.insert(3, " text");
    buffer.assign("new");
    EXPECT_EQ(buffer.str(), "new");
    buffer.insert(3, "!");
    EXPECT_EQ(buffer.str(), "new!");
}

TEST(GapBuffer, random_edits_match_std_string) {
    auto rng = std::mt19937{2024};
    auto buffer = GapBuffer{};
    auto expected = std::string{};
    for (int i = 0; i < 2000; ++i) {
        auto pos = std::uniform_int_distribution<std::size_t>{0, expected.size()}(rng);
        if (rng() % 3 == 0 && pos < expected.size()) {
            auto len = std::uniform_int_distribution<std::size_t>{1, expected.size() - pos}(rng);
            len = std::min<std::size_t>(len, 7);
            expected.erase(pos, len);
            buffer.erase(pos, len);
        } else {
            auto text = std::string(rng() % 9 + 1, static_cast<char>('a' + rng() % 26));
            expected.insert(pos, text);
            buffer.insert(pos, text);
        }
    }
    EXPECT_EQ(buffer.str(), expected);
    EXPECT_EQ(buffer.size(), expected.size());
}
