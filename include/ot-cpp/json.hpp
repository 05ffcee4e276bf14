/// @file json.hpp
/// @brief nlohmann/json wire codec for ot-cpp messages and configuration.
///
/// Provides ADL serialization (to_json/from_json) for the value types that
/// cross the wire, tagged encoding of client and server messages, and a
/// JSON configuration loader for ServiceOptions.
///
/// The throwing from_json overloads report malformed input with
/// nlohmann::json exceptions or std::runtime_error; the decode_* functions
/// turn any such failure into nullopt.

#pragma once

#include <ot-cpp/cursor.hpp>
#include <ot-cpp/document_state.hpp>
#include <ot-cpp/error.hpp>
#include <ot-cpp/messages.hpp>
#include <ot-cpp/operation.hpp>
#include <ot-cpp/options.hpp>
#include <ot-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ot_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Enums (string names) -----------------------------------------------------

void to_json(nlohmann::json& j, OpKind kind);
void from_json(const nlohmann::json& j, OpKind& kind);

void to_json(nlohmann::json& j, ErrorKind kind);
void from_json(const nlohmann::json& j, ErrorKind& kind);

void to_json(nlohmann::json& j, Role role);
void from_json(const nlohmann::json& j, Role& role);

// -- Value types --------------------------------------------------------------

void to_json(nlohmann::json& j, const OpId& id);
void from_json(const nlohmann::json& j, OpId& id);

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

void to_json(nlohmann::json& j, const Cursor& c);
void from_json(const nlohmann::json& j, Cursor& c);

void to_json(nlohmann::json& j, const Presence& p);
void from_json(const nlohmann::json& j, Presence& p);

void to_json(nlohmann::json& j, const Snapshot& s);
void from_json(const nlohmann::json& j, Snapshot& s);

// -- Messages (tagged with "type") --------------------------------------------

void to_json(nlohmann::json& j, const Submission& s);
void from_json(const nlohmann::json& j, Submission& s);

void to_json(nlohmann::json& j, const Broadcast& b);
void from_json(const nlohmann::json& j, Broadcast& b);

void to_json(nlohmann::json& j, const Ack& a);
void from_json(const nlohmann::json& j, Ack& a);

void to_json(nlohmann::json& j, const ServerMessage& message);
void from_json(const nlohmann::json& j, ServerMessage& message);

// -- Configuration ------------------------------------------------------------

/// Missing keys keep their defaults.
void to_json(nlohmann::json& j, const ServiceOptions& options);
void from_json(const nlohmann::json& j, ServiceOptions& options);

// =============================================================================
// Wire encoding
// =============================================================================

/// Serialize a submission to its JSON text.
auto encode(const Submission& submission) -> std::string;

/// Serialize a server message to its JSON text.
auto encode(const ServerMessage& message) -> std::string;

/// Parse a submission. @return nullopt if the text is not a valid submission.
auto decode_submission(std::string_view text) -> std::optional<Submission>;

/// Parse a server message. @return nullopt if the text is not a valid message.
auto decode_server_message(std::string_view text) -> std::optional<ServerMessage>;

// =============================================================================
// Configuration files
// =============================================================================

/// Read ServiceOptions from a JSON file.
/// @throws std::runtime_error if the file cannot be read or is not valid
///         options JSON.
auto load_options(const std::filesystem::path& path) -> ServiceOptions;

}  // namespace ot_cpp

// Error and Rejection have no default constructor, so they are converted
// through adl_serializer specializations.
/// @cond ADL_SERIALIZERS
namespace nlohmann {

template <>
struct adl_serializer<ot_cpp::Error> {
    static void to_json(json& j, const ot_cpp::Error& e);
    static auto from_json(const json& j) -> ot_cpp::Error;
};

template <>
struct adl_serializer<ot_cpp::Rejection> {
    static void to_json(json& j, const ot_cpp::Rejection& r);
    static auto from_json(const json& j) -> ot_cpp::Rejection;
};

}  // namespace nlohmann
/// @endcond
