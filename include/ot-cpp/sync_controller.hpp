/// @file sync_controller.hpp
/// @brief SyncController: validates, transforms, commits and fans out operations.

#pragma once

#include <ot-cpp/capability.hpp>
#include <ot-cpp/cursor.hpp>
#include <ot-cpp/document_state.hpp>
#include <ot-cpp/messages.hpp>
#include <ot-cpp/operation.hpp>
#include <ot-cpp/types.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ot_cpp {

/// The phases one submission goes through.
enum class SyncPhase : std::uint8_t {
    idle,          ///< Waiting for a submission.
    validating,    ///< Checking identity, capability and base revision.
    transforming,  ///< Rewriting against history newer than the base revision.
    committing,    ///< Appending to the log and applying to the content.
    broadcasting,  ///< Notifying other sessions and acknowledging the author.
};

/// Convert a SyncPhase to its string representation.
constexpr auto to_string_view(SyncPhase phase) noexcept -> std::string_view {
    switch (phase) {
        case SyncPhase::idle:         return "idle";
        case SyncPhase::validating:   return "validating";
        case SyncPhase::transforming: return "transforming";
        case SyncPhase::committing:   return "committing";
        case SyncPhase::broadcasting: return "broadcasting";
    }
    return "unknown";
}

/// Counters describing what a controller has done so far.
struct SyncStats {
    std::uint64_t committed{0};     ///< Operations appended to the log.
    std::uint64_t stale{0};         ///< Rejected with stale_revision.
    std::uint64_t unauthorized{0};  ///< Rejected with unauthorized.
    std::uint64_t malformed{0};     ///< Rejected with malformed_operation.
    std::uint64_t dropped{0};       ///< Dropped because the author disconnected mid-cycle.
    std::uint64_t retransforms{0};  ///< Commits that had to catch up on entries committed concurrently.

    auto operator==(const SyncStats&) const -> bool = default;
};

/// Receives the messages addressed to one client.
///
/// Listeners are invoked without any controller lock held, in revision
/// order, one message at a time. They must not block: a listener that
/// needs to do real work should queue the message (Session::deliver does).
using Listener = std::function<void(const ServerMessage&)>;

/// The per-document conflict resolver.
///
/// A submission goes through validation, transformation against every
/// operation committed since its base revision, and commit. Commit is the
/// single serialization point of the document: the revision check, the
/// log append and the content update happen under one exclusive lock, and
/// if other operations were committed while the submission was being
/// transformed it is transformed against those too before being appended.
///
/// Rejections never modify the document. They are returned to the caller
/// and, if the author is attached, sent to the author alone as a Rejection.
///
/// Committed operations are queued for delivery while the commit lock is
/// held and delivered after it is released: every other attached client
/// receives a Broadcast, the author receives an Ack. Listeners therefore
/// observe revisions in order and never hold up a commit.
///
/// @code
/// auto permissions = std::make_shared<PermissionTable>(Role::editor);
/// auto controller = SyncController{"doc", permissions};
/// auto result = controller.submit({"alice", make_insert({"alice", 1}, 0, "hi")});
/// @endcode
class SyncController {
public:
    /// Construct a controller for an empty document.
    /// @throws std::invalid_argument if `permissions` is null.
    SyncController(DocumentId id, std::shared_ptr<const PermissionProvider> permissions);

    /// Construct a controller for a restored document.
    /// @throws std::invalid_argument if `permissions` is null.
    SyncController(DocumentId id, std::shared_ptr<const PermissionProvider> permissions,
                   DocumentState initial);

    SyncController(const SyncController&) = delete;
    auto operator=(const SyncController&) -> SyncController& = delete;

    /// The document this controller is responsible for.
    auto id() const -> const DocumentId& { return id_; }

    // -- Submissions ----------------------------------------------------------

    /// Run one validate/transform/commit/broadcast cycle.
    ///
    /// @return The commit, or the error the submission was rejected with:
    ///   - malformed_operation: the operation's author is not the client,
    ///     or it does not fit the document after transformation.
    ///   - unauthorized: the client lacks Capability::write.
    ///   - stale_revision: the base revision is negative, newer than the
    ///     current revision, or older than the start of the log.
    ///   - session_closed: the client was attached when the cycle started
    ///     and detached before it could commit.
    auto submit(const Submission& submission) -> SubmitResult;

    // -- Attachment and presence ----------------------------------------------

    /// Register a client's listener and presence entry.
    ///
    /// The returned snapshot is taken atomically with the registration: the
    /// listener receives every revision after the snapshot. A listener may
    /// still see messages at or below the snapshot revision that were queued
    /// before it attached; sessions ignore those.
    auto attach(const ClientId& client, std::string username, Listener listener) -> Snapshot;

    /// Remove a client's listener and presence entry.
    /// @return true if the client was attached.
    auto detach(const ClientId& client) -> bool;

    auto is_attached(const ClientId& client) const -> bool;
    auto attached_count() const -> std::size_t;

    /// Move an attached client's cursor.
    ///
    /// `cursor` is expressed against `revision` and is transformed through
    /// every operation committed after it, then clamped to the content.
    /// @return false if the client is not attached or the revision is not
    ///         in the log.
    auto update_cursor(const ClientId& client, Cursor cursor, Revision revision) -> bool;

    /// Every attached client with their cursor in current coordinates.
    auto presence() const -> std::vector<Presence>;

    // -- Reads (persistence collaborator) -------------------------------------

    auto revision() const -> Revision;
    auto content() const -> std::string;

    /// The current revision and content.
    auto snapshot() const -> Snapshot;

    /// Operations committed after `revision`, or nullopt if the revision is
    /// not in the log.
    auto appended_since(Revision revision) const -> std::optional<std::vector<Operation>>;

    /// Content at a past revision, or nullopt if it is not in the log.
    auto content_at(Revision revision) const -> std::optional<std::string>;

    /// A copy of the full document state (content, log and log base).
    auto state() const -> DocumentState;

    auto stats() const -> SyncStats;

private:
    // One queued delivery. `exclusive` sends to `client` only; otherwise
    // the message goes to every attached client except `client`.
    struct Outgoing {
        ClientId client;
        bool exclusive;
        ServerMessage message;
    };

    auto reject(const Submission& submission, Error error) -> SubmitResult;
    void enqueue(Outgoing outgoing);
    void flush();
    void deliver(const Outgoing& outgoing);
    void trace(const Submission& submission, SyncPhase from, SyncPhase to) const;

    DocumentId id_;
    std::shared_ptr<const PermissionProvider> permissions_;

    // Lock order: mutex_, then listeners_mutex_, then outbox_mutex_.
    mutable std::shared_mutex mutex_;
    DocumentState state_;
    std::map<ClientId, Presence> presence_;

    mutable std::mutex listeners_mutex_;
    std::map<ClientId, Listener> listeners_;

    std::mutex outbox_mutex_;
    std::deque<Outgoing> outbox_;
    bool flushing_ = false;

    std::atomic<std::uint64_t> committed_{0};
    std::atomic<std::uint64_t> stale_{0};
    std::atomic<std::uint64_t> unauthorized_{0};
    std::atomic<std::uint64_t> malformed_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> retransforms_{0};
};

}  // namespace ot_cpp
