#include <ot-cpp/json.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace ot_cpp {

namespace {

auto require(const nlohmann::json& j, const char* key) -> const nlohmann::json& {
    if (!j.is_object() || !j.contains(key)) {
        throw std::runtime_error{std::string{"missing key '"} + key + "'"};
    }
    return j.at(key);
}

// Offsets and counters must be non-negative integers; nlohmann would
// otherwise wrap a negative number into a huge unsigned value.
template <typename T>
auto require_unsigned(const nlohmann::json& j, const char* key) -> T {
    const auto& value = require(j, key);
    if (!value.is_number_unsigned()) {
        throw std::runtime_error{std::string{"'"} + key + "' must be a non-negative integer"};
    }
    return value.get<T>();
}

auto require_revision(const nlohmann::json& j, const char* key) -> Revision {
    const auto& value = require(j, key);
    if (!value.is_number_integer()) {
        throw std::runtime_error{std::string{"'"} + key + "' must be an integer"};
    }
    return value.get<Revision>();
}

auto require_type(const nlohmann::json& j) -> std::string {
    const auto& type = require(j, "type");
    if (!type.is_string()) throw std::runtime_error{"'type' must be a string"};
    return type.get<std::string>();
}

template <typename Enum, std::size_t N>
auto enum_from_json(const nlohmann::json& j, const std::array<Enum, N>& values,
                    const char* what) -> Enum {
    if (!j.is_string()) throw std::runtime_error{std::string{what} + " must be a string"};
    auto name = j.get<std::string>();
    for (auto value : values) {
        if (to_string_view(value) == name) return value;
    }
    throw std::runtime_error{"unknown " + std::string{what} + " '" + name + "'"};
}

}  // namespace

// -- Enums --------------------------------------------------------------------

void to_json(nlohmann::json& j, OpKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, OpKind& kind) {
    kind = enum_from_json(j, std::array{OpKind::insert, OpKind::del}, "operation kind");
}

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ErrorKind& kind) {
    kind = enum_from_json(j, std::array{
        ErrorKind::stale_revision, ErrorKind::unauthorized, ErrorKind::malformed_operation,
        ErrorKind::session_closed, ErrorKind::unknown_document, ErrorKind::unknown_session,
    }, "error kind");
}

void to_json(nlohmann::json& j, Role role) {
    j = std::string{to_string_view(role)};
}

void from_json(const nlohmann::json& j, Role& role) {
    if (!j.is_string()) throw std::runtime_error{"role must be a string"};
    auto parsed = parse_role(j.get<std::string>());
    if (!parsed) throw std::runtime_error{"unknown role '" + j.get<std::string>() + "'"};
    role = *parsed;
}

// -- Value types --------------------------------------------------------------

void to_json(nlohmann::json& j, const OpId& id) {
    j = nlohmann::json{{"author", id.author}, {"counter", id.counter}};
}

void from_json(const nlohmann::json& j, OpId& id) {
    id.author = require(j, "author").get<std::string>();
    id.counter = require_unsigned<std::uint64_t>(j, "counter");
}

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"id", op.id},
        {"kind", op.kind},
        {"position", op.position},
        {"base_revision", op.base_revision},
    };
    if (op.kind == OpKind::insert) {
        j["text"] = op.text;
    } else {
        j["length"] = op.length;
    }
}

void from_json(const nlohmann::json& j, Operation& op) {
    op.id = require(j, "id").get<OpId>();
    op.kind = require(j, "kind").get<OpKind>();
    op.position = require_unsigned<std::size_t>(j, "position");
    op.base_revision = require_revision(j, "base_revision");
    if (op.kind == OpKind::insert) {
        op.text = require(j, "text").get<std::string>();
        op.length = 0;
    } else {
        op.text.clear();
        op.length = require_unsigned<std::size_t>(j, "length");
    }
}

void to_json(nlohmann::json& j, const Cursor& c) {
    j = nlohmann::json{{"position", c.position}, {"anchor", c.anchor}};
}

void from_json(const nlohmann::json& j, Cursor& c) {
    c.position = require_unsigned<std::size_t>(j, "position");
    c.anchor = j.contains("anchor") ? require_unsigned<std::size_t>(j, "anchor") : c.position;
}

void to_json(nlohmann::json& j, const Presence& p) {
    j = nlohmann::json{{"client", p.client}, {"username", p.username}, {"cursor", p.cursor}};
}

void from_json(const nlohmann::json& j, Presence& p) {
    p.client = require(j, "client").get<std::string>();
    p.username = require(j, "username").get<std::string>();
    p.cursor = require(j, "cursor").get<Cursor>();
}

void to_json(nlohmann::json& j, const Snapshot& s) {
    j = nlohmann::json{{"revision", s.revision}, {"content", s.content}};
}

void from_json(const nlohmann::json& j, Snapshot& s) {
    s.revision = require_revision(j, "revision");
    s.content = require(j, "content").get<std::string>();
}

// -- Messages -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Submission& s) {
    j = nlohmann::json{{"type", "submit"}, {"client", s.client}, {"operation", s.operation}};
}

void from_json(const nlohmann::json& j, Submission& s) {
    if (require_type(j) != "submit") throw std::runtime_error{"not a submission"};
    s.client = require(j, "client").get<std::string>();
    s.operation = require(j, "operation").get<Operation>();
}

void to_json(nlohmann::json& j, const Broadcast& b) {
    j = nlohmann::json{{"type", "broadcast"}, {"revision", b.revision}, {"operation", b.operation}};
}

void from_json(const nlohmann::json& j, Broadcast& b) {
    if (require_type(j) != "broadcast") throw std::runtime_error{"not a broadcast"};
    b.revision = require_revision(j, "revision");
    b.operation = require(j, "operation").get<Operation>();
}

void to_json(nlohmann::json& j, const Ack& a) {
    j = nlohmann::json{{"type", "ack"}, {"op_id", a.op_id}, {"revision", a.revision}};
}

void from_json(const nlohmann::json& j, Ack& a) {
    if (require_type(j) != "ack") throw std::runtime_error{"not an ack"};
    a.op_id = require(j, "op_id").get<OpId>();
    a.revision = require_revision(j, "revision");
}

void to_json(nlohmann::json& j, const ServerMessage& message) {
    std::visit([&](const auto& m) { j = m; }, message);
}

void from_json(const nlohmann::json& j, ServerMessage& message) {
    auto type = require_type(j);
    if (type == "broadcast") {
        message = j.get<Broadcast>();
    } else if (type == "ack") {
        message = j.get<Ack>();
    } else if (type == "rejection") {
        message = j.get<Rejection>();
    } else {
        throw std::runtime_error{"unknown message type '" + type + "'"};
    }
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const ServiceOptions& options) {
    j = nlohmann::json{
        {"delivery_threads", options.delivery_threads},
        {"default_role", options.default_role},
        {"log_level", options.log_level},
    };
}

void from_json(const nlohmann::json& j, ServiceOptions& options) {
    if (!j.is_object()) throw std::runtime_error{"options must be a JSON object"};
    if (j.contains("delivery_threads")) {
        options.delivery_threads = require_unsigned<unsigned int>(j, "delivery_threads");
    }
    if (j.contains("default_role")) {
        options.default_role = j.at("default_role").get<Role>();
    }
    if (j.contains("log_level")) {
        options.log_level = j.at("log_level").get<std::string>();
    }
}

// -- Wire encoding ------------------------------------------------------------

auto encode(const Submission& submission) -> std::string {
    return nlohmann::json(submission).dump();
}

auto encode(const ServerMessage& message) -> std::string {
    auto j = nlohmann::json{};
    to_json(j, message);
    return j.dump();
}

auto decode_submission(std::string_view text) -> std::optional<Submission> {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    try {
        return j.get<Submission>();
    } catch (const nlohmann::json::exception& e) {
        SPDLOG_DEBUG("invalid submission: {}", e.what());
    } catch (const std::runtime_error& e) {
        SPDLOG_DEBUG("invalid submission: {}", e.what());
    }
    return std::nullopt;
}

auto decode_server_message(std::string_view text) -> std::optional<ServerMessage> {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    try {
        auto message = ServerMessage{};
        from_json(j, message);
        return message;
    } catch (const nlohmann::json::exception& e) {
        SPDLOG_DEBUG("invalid server message: {}", e.what());
    } catch (const std::runtime_error& e) {
        SPDLOG_DEBUG("invalid server message: {}", e.what());
    }
    return std::nullopt;
}

// -- Configuration files ------------------------------------------------------

auto load_options(const std::filesystem::path& path) -> ServiceOptions {
    auto in = std::ifstream{path};
    if (!in) {
        throw std::runtime_error{"cannot open options file " + path.string()};
    }
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error{"options file " + path.string() + " is not valid JSON"};
    }
    auto options = ServiceOptions{};
    try {
        from_json(j, options);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error{"invalid options in " + path.string() + ": " + e.what()};
    }
    return options;
}

}  // namespace ot_cpp

// -- Non-default-constructible types ------------------------------------------

namespace nlohmann {

void adl_serializer<ot_cpp::Error>::to_json(json& j, const ot_cpp::Error& e) {
    j = json{{"kind", e.kind}, {"message", e.message}};
}

auto adl_serializer<ot_cpp::Error>::from_json(const json& j) -> ot_cpp::Error {
    if (!j.is_object() || !j.contains("kind") || !j.contains("message")) {
        throw std::runtime_error{"error must have 'kind' and 'message'"};
    }
    return ot_cpp::Error{j.at("kind").get<ot_cpp::ErrorKind>(),
                         j.at("message").get<std::string>()};
}

void adl_serializer<ot_cpp::Rejection>::to_json(json& j, const ot_cpp::Rejection& r) {
    j = json{{"type", "rejection"}, {"op_id", r.op_id}, {"error", r.error}};
}

auto adl_serializer<ot_cpp::Rejection>::from_json(const json& j) -> ot_cpp::Rejection {
    if (!j.is_object() || j.value("type", "") != "rejection" ||
        !j.contains("op_id") || !j.contains("error")) {
        throw std::runtime_error{"not a rejection"};
    }
    return ot_cpp::Rejection{
        .op_id = j.at("op_id").get<ot_cpp::OpId>(),
        .error = j.at("error").get<ot_cpp::Error>(),
    };
}

}  // namespace nlohmann
