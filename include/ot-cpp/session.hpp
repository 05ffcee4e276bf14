/// @file session.hpp
/// @brief Session: a connected client's optimistic view of a document.

#pragma once

#include <ot-cpp/capability.hpp>
#include <ot-cpp/cursor.hpp>
#include <ot-cpp/document_state.hpp>
#include <ot-cpp/error.hpp>
#include <ot-cpp/messages.hpp>
#include <ot-cpp/operation.hpp>
#include <ot-cpp/types.hpp>

#include <thread_pool.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ot_cpp {

/// The session's connection to its document's controller.
///
/// Implementations carry submissions and cursor updates to the server
/// side and fetch snapshots on resync. Delivery in the other direction
/// goes through Session::deliver().
class Uplink {
public:
    virtual ~Uplink() = default;

    /// Forward a submission to the controller.
    virtual void send(const Submission& submission) = 0;

    /// The current committed state, or nullopt if the document is gone.
    virtual auto fetch_snapshot() -> std::optional<Snapshot> = 0;

    /// Forward a cursor expressed against `revision`.
    virtual void send_cursor(const ClientId& client, const Cursor& cursor,
                             Revision revision) = 0;
};

/// The per-client side of the protocol.
///
/// Local edits are applied to the session's text immediately, queued as
/// pending and sent to the controller one at a time: the next pending
/// operation goes out when the previous one is acknowledged, with the
/// acknowledged revision as its base. Operations committed by other
/// clients are transformed against the pending queue before they are
/// applied, and the pending queue is transformed against them, so the
/// session's text always equals the server content at acked_revision()
/// followed by the pending operations.
///
/// Server messages are queued by deliver() and processed in arrival order,
/// either inline or on the thread pool given at construction. A rejection
/// of the in-flight operation, or a gap in the broadcast revisions, makes
/// the session resync: it fetches a fresh snapshot and drops its pending
/// operations.
///
/// Sessions are meant to be owned by a std::shared_ptr so that queued
/// deliveries can keep them alive.
class Session : public std::enable_shared_from_this<Session> {
public:
    /// Construct a session that starts from `initial`.
    /// @param pool Thread pool for message processing; nullptr processes
    ///        messages on the thread that delivers them.
    /// @throws std::invalid_argument if `uplink` is null.
    Session(ClientId client, CapabilitySet capabilities, Snapshot initial,
            std::shared_ptr<Uplink> uplink, std::shared_ptr<thread_pool> pool = nullptr);

    Session(const Session&) = delete;
    auto operator=(const Session&) -> Session& = delete;

    auto client() const -> const ClientId& { return client_; }

    // -- Local edits ----------------------------------------------------------

    /// Insert text at a byte offset of the session's current text.
    auto insert(std::size_t position, std::string text) -> std::optional<Error>;

    /// Delete `length` bytes at a byte offset of the session's current text.
    auto erase(std::size_t position, std::size_t length) -> std::optional<Error>;

    /// Apply an operation composed against the current text and queue it
    /// for the controller.
    ///
    /// @return nullopt if the edit was applied locally, otherwise:
    ///   - session_closed: the session is closed.
    ///   - malformed_operation: wrong author, or out of bounds.
    ///   - unauthorized: the session lacks Capability::write.
    auto submit_local_edit(Operation op) -> std::optional<Error>;

    /// A fresh id for the next local operation.
    auto next_op_id() -> OpId;

    // -- Server messages ------------------------------------------------------

    /// Queue a message from the controller for processing.
    void deliver(ServerMessage message);

    /// Apply an operation committed by another client.
    void on_remote_operation(const Broadcast& broadcast);

    /// Retire the in-flight operation and send the next pending one.
    void on_ack(const Ack& ack);

    /// Handle the rejection of the in-flight operation.
    void on_reject(const Rejection& rejection);

    /// Replace the local state with a fresh snapshot, dropping pending edits.
    /// @return false if no snapshot could be fetched; the session is closed.
    auto resync() -> bool;

    /// Adopt a snapshot newer than the acknowledged revision, dropping
    /// pending edits. Older or equal snapshots are ignored.
    /// @return true if the snapshot was adopted.
    auto reset(Snapshot snapshot) -> bool;

    // -- State ----------------------------------------------------------------

    auto text() const -> std::string;
    auto acked_revision() const -> Revision;

    /// Unacknowledged local operations, oldest (in flight) first.
    auto pending() const -> std::vector<Operation>;
    auto has_pending() const -> bool;

    /// Remote operations applied to the local text, as transformed locally.
    auto applied() const -> std::vector<Operation>;

    /// Number of resyncs so far.
    auto resyncs() const -> std::uint64_t;

    auto capabilities() const -> CapabilitySet;
    void set_capabilities(CapabilitySet capabilities);

    auto cursor() const -> Cursor;

    /// Move the cursor. Positions are clamped to the current text.
    /// The cursor is forwarded to the controller once nothing is pending.
    void set_cursor(Cursor cursor);

    auto is_open() const -> bool;

    /// Stop accepting edits and ignore further messages.
    void close();

private:
    void drain();
    void handle(const ServerMessage& message);
    void transmit(std::optional<Submission> submission);
    void forward_cursor();

    ClientId client_;
    std::shared_ptr<Uplink> uplink_;
    std::shared_ptr<thread_pool> pool_;

    mutable std::mutex mutex_;
    CapabilitySet capabilities_;
    std::string text_;
    Revision acked_{0};
    std::deque<Operation> pending_;
    bool in_flight_ = false;
    std::vector<Operation> applied_;
    Cursor cursor_;
    bool cursor_dirty_ = false;
    bool open_ = true;
    std::uint64_t counter_ = 0;
    std::uint64_t resyncs_ = 0;

    std::mutex inbox_mutex_;
    std::deque<ServerMessage> inbox_;
    bool draining_ = false;
};

}  // namespace ot_cpp
