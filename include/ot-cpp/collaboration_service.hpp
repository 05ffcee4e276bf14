/// @file collaboration_service.hpp
/// @brief CollaborationService: the registry of hosted documents.

#pragma once

#include <ot-cpp/capability.hpp>
#include <ot-cpp/cursor.hpp>
#include <ot-cpp/document_state.hpp>
#include <ot-cpp/error.hpp>
#include <ot-cpp/operation.hpp>
#include <ot-cpp/options.hpp>
#include <ot-cpp/session.hpp>
#include <ot-cpp/sync_controller.hpp>
#include <ot-cpp/types.hpp>

#include <thread_pool.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ot_cpp {

/// Summary of a hosted document.
struct DocumentInfo {
    DocumentId id;             ///< The document id.
    std::string title;         ///< Title given at creation.
    ClientId owner;            ///< The client granted Role::owner at creation.
    Revision revision{0};      ///< Current revision.
    std::size_t sessions{0};   ///< Number of joined sessions.

    auto operator==(const DocumentInfo&) const -> bool = default;
};

/// Hosts documents and the sessions editing them, in one process.
///
/// Each document gets its own SyncController and PermissionTable; clients
/// join a document to get a Session wired to its controller. Documents are
/// independent: they commit concurrently and share only the delivery pool.
///
/// All methods are thread-safe.
///
/// @code
/// auto service = CollaborationService{};
/// auto doc = service.create_document("Notes", "alice");
/// service.join(doc, "alice", "Alice");
/// service.insert_text(doc, "alice", 0, "Hello");
/// auto text = service.content(doc);  // "Hello"
/// @endcode
class CollaborationService {
public:
    /// Construct a service with default options (inline delivery).
    CollaborationService();

    /// Construct a service with the given options.
    explicit CollaborationService(ServiceOptions options);

    /// Closes every session and waits for pending deliveries.
    ~CollaborationService();

    CollaborationService(const CollaborationService&) = delete;
    auto operator=(const CollaborationService&) -> CollaborationService& = delete;

    // -- Documents ------------------------------------------------------------

    /// Create an empty document. The owner is granted Role::owner.
    /// @return The new document's id (32 hex digits).
    auto create_document(std::string title, const ClientId& owner) -> DocumentId;

    /// Host a document restored from a checkpoint.
    auto restore_document(std::string title, const ClientId& owner,
                          DocumentState state) -> DocumentId;

    /// Close a document: every session is closed and detached.
    /// @return false if the document is unknown.
    auto close_document(const DocumentId& doc) -> bool;

    auto has_document(const DocumentId& doc) const -> bool;

    /// Ids of all hosted documents, sorted.
    auto documents() const -> std::vector<DocumentId>;

    auto info(const DocumentId& doc) const -> std::optional<DocumentInfo>;

    /// The controller of a document, or nullptr if it is unknown.
    auto controller(const DocumentId& doc) const -> std::shared_ptr<SyncController>;

    // -- Sessions -------------------------------------------------------------

    /// Join a document. Joining twice returns the existing session.
    /// @return The client's session, or nullptr if the document is unknown.
    auto join(const DocumentId& doc, const ClientId& client, std::string username)
        -> std::shared_ptr<Session>;

    /// Leave a document; the session is closed.
    /// @return false if the client had not joined.
    auto leave(const DocumentId& doc, const ClientId& client) -> bool;

    /// The client's session, or nullptr.
    auto session(const DocumentId& doc, const ClientId& client) const
        -> std::shared_ptr<Session>;

    // -- Permissions ----------------------------------------------------------

    /// Set a client's role on a document. Applies to a joined session at once.
    auto grant(const DocumentId& doc, const ClientId& client, Role role) -> std::optional<Error>;

    /// Remove a client's explicit role; they fall back to the default role.
    auto revoke(const DocumentId& doc, const ClientId& client) -> std::optional<Error>;

    auto role_of(const DocumentId& doc, const ClientId& client) const -> std::optional<Role>;

    // -- Editing --------------------------------------------------------------

    /// Insert text through the client's session.
    /// @return unknown_document, unknown_session, or the session's own
    ///         error (see Session::submit_local_edit); nullopt on success.
    auto insert_text(const DocumentId& doc, const ClientId& client,
                     std::size_t position, std::string text) -> std::optional<Error>;

    /// Delete text through the client's session.
    auto delete_text(const DocumentId& doc, const ClientId& client,
                     std::size_t position, std::size_t length) -> std::optional<Error>;

    /// Move the client's cursor.
    auto move_cursor(const DocumentId& doc, const ClientId& client,
                     Cursor cursor) -> std::optional<Error>;

    // -- Reads ----------------------------------------------------------------

    /// The committed content, or nullopt if the document is unknown.
    auto content(const DocumentId& doc) const -> std::optional<std::string>;

    /// Joined clients with their usernames and committed cursors.
    /// Empty if the document is unknown.
    auto active_users(const DocumentId& doc) const -> std::vector<Presence>;

    auto snapshot(const DocumentId& doc) const -> std::optional<Snapshot>;

    auto appended_since(const DocumentId& doc, Revision revision) const
        -> std::optional<std::vector<Operation>>;

    /// A binary checkpoint of the document (see checkpoint.hpp).
    auto checkpoint(const DocumentId& doc) const -> std::optional<std::vector<std::byte>>;

    /// Block until every queued delivery has been processed.
    void wait_idle();

    auto options() const -> const ServiceOptions& { return options_; }

private:
    struct Hosted;

    auto host(std::string title, const ClientId& owner, DocumentState state) -> DocumentId;
    auto find(const DocumentId& doc) const -> std::shared_ptr<Hosted>;
    auto edit(const DocumentId& doc, const ClientId& client,
              const std::function<std::optional<Error>(Session&)>& fn) -> std::optional<Error>;

    ServiceOptions options_;
    std::shared_ptr<thread_pool> pool_;

    mutable std::shared_mutex mutex_;
    std::map<DocumentId, std::shared_ptr<Hosted>> documents_;
};

}  // namespace ot_cpp
