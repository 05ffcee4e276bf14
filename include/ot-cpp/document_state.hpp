/// @file document_state.hpp
/// @brief DocumentState: the materialized text plus its revision log.

#pragma once

#include <ot-cpp/error.hpp>
#include <ot-cpp/operation.hpp>
#include <ot-cpp/revision_log.hpp>
#include <ot-cpp/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace ot_cpp {

namespace detail {
class GapBuffer;
}  // namespace detail

/// The committed state of a document at a revision.
struct Snapshot {
    Revision revision{0};  ///< The revision the content corresponds to.
    std::string content;   ///< The document text at that revision.

    auto operator==(const Snapshot&) const -> bool = default;
};

/// The authoritative text of a document and the history that produced it.
///
/// The content is only ever changed by apply(), which appends the
/// operation to the log in the same step, so `revision()` always equals
/// `log().head()` and the content always equals replaying the log on top
/// of `base_snapshot()`.
///
/// DocumentState is a plain value with no internal locking;
/// SyncController owns one and serializes every mutation.
class DocumentState {
public:
    /// An empty document at revision 0.
    DocumentState();

    /// A document restored from a snapshot. The log starts after the
    /// snapshot revision.
    static auto from_snapshot(Snapshot snapshot) -> DocumentState;

    ~DocumentState();
    DocumentState(const DocumentState& other);
    auto operator=(const DocumentState& other) -> DocumentState&;
    DocumentState(DocumentState&&) noexcept;
    auto operator=(DocumentState&&) noexcept -> DocumentState&;

    /// The current revision.
    auto revision() const -> Revision { return log_.head(); }

    /// The current content.
    auto content() const -> std::string;

    /// Number of characters in the current content.
    auto size() const -> std::size_t;

    /// The current revision and content.
    auto snapshot() const -> Snapshot;

    /// The snapshot the log starts after.
    auto base_snapshot() const -> const Snapshot& { return base_; }

    /// The history of accepted operations.
    auto log() const -> const RevisionLog& { return log_; }

    /// Check that an operation fits the current content.
    /// @return A malformed_operation error, or nullopt if it fits.
    auto check(const Operation& op) const -> std::optional<Error>;

    /// Append an operation to the log and apply it to the content.
    /// @return The new revision.
    /// @throws std::out_of_range if the operation does not fit; nothing is
    ///         modified in that case.
    auto apply(Operation op) -> Revision;

    /// Reconstruct the content at a past revision by replaying the log.
    /// @throws std::out_of_range if the revision is not in the log.
    auto content_at(Revision revision) const -> std::string;

private:
    std::unique_ptr<detail::GapBuffer> buffer_;
    RevisionLog log_;
    Snapshot base_;
};

}  // namespace ot_cpp
