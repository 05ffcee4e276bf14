#include <ot-cpp/json.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <variant>

using namespace ot_cpp;
using json = nlohmann::json;

// -- Value types --------------------------------------------------------------

TEST(Json, insert_operation_fields) {
    auto j = json(make_insert(OpId{"alice", 2}, 5, "!!", 1));
    EXPECT_EQ(j["id"]["author"], "alice");
    EXPECT_EQ(j["id"]["counter"], 2);
    EXPECT_EQ(j["kind"], "insert");
    EXPECT_EQ(j["position"], 5);
    EXPECT_EQ(j["text"], "!!");
    EXPECT_EQ(j["base_revision"], 1);
    EXPECT_FALSE(j.contains("length"));
}

TEST(Json, delete_operation_fields) {
    auto j = json(make_delete(OpId{"bob", 1}, 3, 4, 7));
    EXPECT_EQ(j["kind"], "delete");
    EXPECT_EQ(j["length"], 4);
    EXPECT_FALSE(j.contains("text"));
    EXPECT_EQ(j.get<Operation>(), make_delete(OpId{"bob", 1}, 3, 4, 7));
}

TEST(Json, cursor_anchor_defaults_to_position) {
    auto cursor = json::parse(R"({"position": 4})").get<Cursor>();
    EXPECT_EQ(cursor, Cursor::at(4));

    auto selection = json::parse(R"({"position": 4, "anchor": 1})").get<Cursor>();
    EXPECT_TRUE(selection.has_selection());
    EXPECT_EQ(selection.selection_start(), 1u);
}

TEST(Json, presence_and_snapshot) {
    auto presence = Presence{.client = "c1", .username = "Carol", .cursor = Cursor{3, 1}};
    EXPECT_EQ(json(presence).get<Presence>(), presence);

    auto snapshot = Snapshot{12, "text"};
    auto j = json(snapshot);
    EXPECT_EQ(j["revision"], 12);
    EXPECT_EQ(j.get<Snapshot>(), snapshot);
}

TEST(Json, error_uses_kind_names) {
    auto j = json(Error{ErrorKind::stale_revision, "too old"});
    EXPECT_EQ(j["kind"], "stale_revision");
    EXPECT_EQ(j["message"], "too old");
    EXPECT_EQ(j.get<Error>(), (Error{ErrorKind::stale_revision, "too old"}));
}

TEST(Json, unknown_kind_throws) {
    auto j = json::parse(R"({"author": "a", "counter": 1})");
    auto op = json{{"id", j}, {"kind", "replace"}, {"position", 0}, {"base_revision", 0}};
    EXPECT_THROW((void)op.get<Operation>(), std::runtime_error);
}

// -- Messages -----------------------------------------------------------------

TEST(Json, submission_encodes_with_type_tag) {
    auto submission = Submission{.client = "alice",
                                 .operation = make_insert(OpId{"alice", 1}, 0, "hi")};
    auto j = json::parse(encode(submission));
    EXPECT_EQ(j["type"], "submit");
    EXPECT_EQ(j["client"], "alice");

    auto decoded = decode_submission(encode(submission));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, submission);
}

TEST(Json, server_messages_decode_to_the_right_alternative) {
    auto broadcast = ServerMessage{Broadcast{.revision = 3,
                                             .operation = make_delete(OpId{"b", 2}, 0, 1, 2)}};
    auto ack = ServerMessage{Ack{.op_id = OpId{"a", 5}, .revision = 9}};
    auto rejection = ServerMessage{Rejection{
        .op_id = OpId{"a", 6}, .error = Error{ErrorKind::unauthorized, "read-only"}}};

    for (const auto& message : {broadcast, ack, rejection}) {
        auto decoded = decode_server_message(encode(message));
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(decoded->index(), message.index());
        EXPECT_EQ(*decoded, message);
    }
    EXPECT_EQ(json::parse(encode(rejection))["type"], "rejection");
}

TEST(Json, decode_rejects_invalid_input) {
    EXPECT_FALSE(decode_submission("not json").has_value());
    EXPECT_FALSE(decode_submission("{}").has_value());
    EXPECT_FALSE(decode_submission(R"({"type": "ack", "op_id": {"author": "a", "counter": 1},
                                       "revision": 1})").has_value());
    EXPECT_FALSE(decode_server_message(R"({"type": "hello"})").has_value());
    EXPECT_FALSE(decode_server_message("[1, 2, 3]").has_value());
}

TEST(Json, negative_position_is_rejected) {
    auto text = std::string{R"({"type": "submit", "client": "a", "operation": {
        "id": {"author": "a", "counter": 1}, "kind": "insert",
        "position": -1, "text": "x", "base_revision": 0}})"};
    EXPECT_FALSE(decode_submission(text).has_value());
}

TEST(Json, negative_base_revision_survives_decoding) {
    // Stale bases are the controller's to reject, not the codec's.
    auto text = std::string{R"({"type": "submit", "client": "a", "operation": {
        "id": {"author": "a", "counter": 1}, "kind": "delete",
        "position": 0, "length": 1, "base_revision": -3}})"};
    auto decoded = decode_submission(text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->operation.base_revision, -3);
}

// -- Configuration ------------------------------------------------------------

TEST(Json, options_missing_keys_keep_defaults) {
    auto options = json::parse(R"({"delivery_threads": 4})").get<ServiceOptions>();
    EXPECT_EQ(options.delivery_threads, 4u);
    EXPECT_EQ(options.default_role, Role::viewer);
    EXPECT_EQ(options.log_level, "");
}

TEST(Json, load_options_from_file) {
    auto path = std::filesystem::temp_directory_path() / "ot_cpp_json_test_options.json";
    {
        auto out = std::ofstream{path};
        out << R"({"delivery_threads": 2, "default_role": "commenter", "log_level": "warn"})";
    }
    auto options = load_options(path);
    std::filesystem::remove(path);

    EXPECT_EQ(options, (ServiceOptions{.delivery_threads = 2,
                                       .default_role = Role::commenter,
                                       .log_level = "warn"}));
}

TEST(Json, load_options_errors_throw) {
    auto dir = std::filesystem::temp_directory_path();
    EXPECT_THROW((void)load_options(dir / "ot_cpp_no_such_options.json"), std::runtime_error);

    auto path = dir / "ot_cpp_json_test_bad_options.json";
    {
        auto out = std::ofstream{path};
        out << R"({"default_role": "admin"})";
    }
    EXPECT_THROW((void)load_options(path), std::runtime_error);
    std::filesystem::remove(path);
}
