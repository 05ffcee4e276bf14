/// @file cursor.hpp
/// @brief Cursor and presence types for caret and selection tracking.

#pragma once

#include <ot-cpp/types.hpp>

#include <algorithm>
#include <cstddef>
#include <string>

namespace ot_cpp {

/// A caret with an optional selection.
///
/// `position` is where the caret is drawn; `anchor` is the other end of
/// the selection. A collapsed cursor has `anchor == position`. Both ends
/// are re-projected through every operation applied to the document, with
/// the same rules the transform engine uses for text.
struct Cursor {
    std::size_t position{0};  ///< Caret offset.
    std::size_t anchor{0};    ///< Selection anchor offset.

    /// A collapsed cursor at `pos`.
    static constexpr auto at(std::size_t pos) -> Cursor { return Cursor{pos, pos}; }

    /// True if the cursor selects at least one character.
    constexpr auto has_selection() const -> bool { return position != anchor; }

    /// Start of the selected range.
    constexpr auto selection_start() const -> std::size_t { return std::min(position, anchor); }

    /// End of the selected range (exclusive).
    constexpr auto selection_end() const -> std::size_t { return std::max(position, anchor); }

    auto operator==(const Cursor&) const -> bool = default;
};

/// The server-side view of a connected editor: who they are and where
/// their cursor is in the committed document.
struct Presence {
    ClientId client;       ///< The connected client.
    std::string username;  ///< Display name supplied on join.
    Cursor cursor;         ///< Cursor in committed-document coordinates.

    auto operator==(const Presence&) const -> bool = default;
};

}  // namespace ot_cpp
