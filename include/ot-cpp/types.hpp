/// @file types.hpp
/// @brief Core identity types: ClientId, DocumentId, Revision, OpId.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace ot_cpp {

/// Identifies a connected editor. Ordered lexicographically; the ordering
/// is the tie-break between concurrent inserts at the same position.
using ClientId = std::string;

/// Identifies a document hosted by a CollaborationService.
using DocumentId = std::string;

/// A point in a document's edit history.
///
/// Revision 0 is the empty document; every accepted operation increments
/// the revision by exactly one. Signed so that invalid base revisions sent
/// by a client can be represented and rejected.
using Revision = std::int64_t;

/// Identifies a single operation: (author, counter).
///
/// The counter increases monotonically per author, so OpIds are globally
/// unique. Ordering is by author first, then counter.
struct OpId {
    ClientId author;             ///< The client that authored the operation.
    std::uint64_t counter{0};    ///< Per-author sequence number (1-based).

    auto operator<=>(const OpId&) const = default;
    auto operator==(const OpId&) const -> bool = default;
};

}  // namespace ot_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<ot_cpp::OpId> {
    auto operator()(const ot_cpp::OpId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::string>{}(id.author);
        auto h2 = std::hash<std::uint64_t>{}(id.counter);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
