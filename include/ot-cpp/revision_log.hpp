/// @file revision_log.hpp
/// @brief The append-only revision log (event-sourcing store).

#pragma once

#include <ot-cpp/operation.hpp>
#include <ot-cpp/types.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace ot_cpp {

/// The ordered history of accepted operations.
///
/// Entry `r` (1-based) is the operation that produced revision `r`. A log
/// may start after a snapshot: its `base()` is the revision of the
/// snapshot, and entries at or below the base are not available.
///
/// The log is append-only: no entry is modified or removed once appended.
/// It is not internally synchronized; SyncController serializes access.
class RevisionLog {
public:
    RevisionLog() = default;

    /// Construct an empty log that starts after revision `base`.
    explicit RevisionLog(Revision base) : base_{base} {}

    /// Append an operation. @return The revision it produced.
    auto append(Operation op) -> Revision;

    /// Operations with a revision greater than `revision`, in order.
    /// @throws std::out_of_range if `revision` is below base() or above head().
    auto entries_since(Revision revision) const -> std::vector<Operation>;

    /// The operation that produced `revision`.
    /// @throws std::out_of_range if the entry is not in the log.
    auto at(Revision revision) const -> const Operation&;

    /// Check whether entries after `revision` can be served.
    auto reaches(Revision revision) const -> bool {
        return revision >= base_ && revision <= head();
    }

    /// Revision of the snapshot the log starts after (0 for a full log).
    auto base() const -> Revision { return base_; }

    /// Revision produced by the last entry.
    auto head() const -> Revision { return base_ + static_cast<Revision>(ops_.size()); }

    auto size() const -> std::size_t { return ops_.size(); }
    auto empty() const -> bool { return ops_.empty(); }

    /// All entries, oldest first.
    auto entries() const -> std::span<const Operation> { return ops_; }

    /// Replay entries up to and including `revision` on top of `base_content`,
    /// which must be the document content at base().
    /// @throws std::out_of_range if `revision` is not reachable or an entry
    ///         does not fit the replayed content.
    auto replay(const std::string& base_content, Revision revision) const -> std::string;

private:
    Revision base_{0};
    std::vector<Operation> ops_;
};

}  // namespace ot_cpp
