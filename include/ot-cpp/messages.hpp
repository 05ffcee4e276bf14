/// @file messages.hpp
/// @brief Messages exchanged between sessions and the sync controller.

#pragma once

#include <ot-cpp/error.hpp>
#include <ot-cpp/operation.hpp>
#include <ot-cpp/types.hpp>

#include <variant>

namespace ot_cpp {

/// An operation submitted by a client.
///
/// The operation's base_revision is the revision it was composed against.
struct Submission {
    ClientId client;      ///< The submitting client.
    Operation operation;  ///< The operation as composed by the client.

    auto operator==(const Submission&) const -> bool = default;
};

/// A committed operation, sent to every client except its author.
struct Broadcast {
    Revision revision;    ///< The revision the operation produced.
    Operation operation;  ///< The operation as committed (author inside its id).

    auto operator==(const Broadcast&) const -> bool = default;
};

/// Acknowledgement sent to the author of a committed operation.
struct Ack {
    OpId op_id;         ///< The id of the acknowledged operation.
    Revision revision;  ///< The revision the operation produced.

    auto operator==(const Ack&) const -> bool = default;
};

/// A rejected submission, sent to its author only.
struct Rejection {
    OpId op_id;   ///< The id of the rejected operation.
    Error error;  ///< Why it was rejected.

    auto operator==(const Rejection&) const -> bool = default;
};

/// Everything the controller sends to a session.
using ServerMessage = std::variant<Broadcast, Ack, Rejection>;

/// The outcome of a successful submission.
struct Commit {
    Revision revision;    ///< The revision the operation produced.
    Operation operation;  ///< The operation as appended to the log.

    auto operator==(const Commit&) const -> bool = default;
};

/// The outcome of SyncController::submit(): committed or rejected.
using SubmitResult = std::variant<Commit, Error>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Broadcast& b) { printf("rev %lld\n", static_cast<long long>(b.revision)); },
///     [](const auto&) {},
/// }, message);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace ot_cpp
