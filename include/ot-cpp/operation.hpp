/// @file operation.hpp
/// @brief The Operation value type: a single plain-text insert or delete.

#pragma once

#include <ot-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace ot_cpp {

/// The kind of edit an operation represents.
enum class OpKind : std::uint8_t {
    insert,  ///< Insert text at a position.
    del,     ///< Delete a range of characters starting at a position.
};

/// Convert an OpKind to its string representation.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::insert: return "insert";
        case OpKind::del:    return "delete";
    }
    return "unknown";
}

/// A single edit to a plain-text document.
///
/// Operations are the unit of change exchanged between sessions and the
/// sync controller, and the unit stored in the revision log. They are
/// values: transformation and rebasing produce new operations and never
/// modify an existing one.
///
/// Positions and lengths are byte offsets into the document content.
///
/// @code
/// auto op = make_insert(OpId{"alice", 1}, 0, "hello");
/// @endcode
struct Operation {
    OpId id;                        ///< Globally unique identifier (author + counter).
    OpKind kind{OpKind::insert};    ///< Insert or delete.
    std::size_t position{0};        ///< Offset in the document the operation was composed against.
    std::string text;               ///< Inserted text (insert only).
    std::size_t length{0};          ///< Number of characters removed (delete only).
    Revision base_revision{0};      ///< Revision of the document the operation was composed against.

    /// The author of the operation.
    auto author() const -> const ClientId& { return id.author; }

    /// Number of characters the operation inserts or removes.
    auto extent() const -> std::size_t {
        return kind == OpKind::insert ? text.size() : length;
    }

    /// One past the last offset the operation touches.
    auto end() const -> std::size_t { return position + extent(); }

    /// True if applying the operation leaves the content unchanged.
    auto is_noop() const -> bool { return extent() == 0; }

    /// A copy of this operation expressed against another base revision.
    auto rebased(Revision revision) const -> Operation {
        auto copy = *this;
        copy.base_revision = revision;
        return copy;
    }

    auto operator==(const Operation&) const -> bool = default;
};

/// Create an insert operation.
inline auto make_insert(OpId id, std::size_t position, std::string text,
                        Revision base_revision = 0) -> Operation {
    return Operation{
        .id = std::move(id),
        .kind = OpKind::insert,
        .position = position,
        .text = std::move(text),
        .length = 0,
        .base_revision = base_revision,
    };
}

/// Create a delete operation removing `length` characters at `position`.
inline auto make_delete(OpId id, std::size_t position, std::size_t length,
                        Revision base_revision = 0) -> Operation {
    return Operation{
        .id = std::move(id),
        .kind = OpKind::del,
        .position = position,
        .text = {},
        .length = length,
        .base_revision = base_revision,
    };
}

/// Check that an operation fits a document of `size` characters.
inline auto fits(const Operation& op, std::size_t size) -> bool {
    if (op.position > size) return false;
    return op.kind == OpKind::insert || op.length <= size - op.position;
}

}  // namespace ot_cpp
