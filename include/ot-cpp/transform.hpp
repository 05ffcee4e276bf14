/// @file transform.hpp
/// @brief The transform engine: position-space rewriting of concurrent edits.

#pragma once

#include <ot-cpp/cursor.hpp>
#include <ot-cpp/operation.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace ot_cpp {

/// Rewrite `a` so that it can be applied after `b`.
///
/// Both operations must have been composed against the same document.
/// The result preserves the intent of `a` in the coordinate space that
/// exists once `b` has been applied:
///
/// - insert/insert: an insert at a greater position shifts right by the
///   other insert's length; at equal positions the lower OpId keeps its
///   place and the higher one shifts.
/// - insert/delete: an insert inside the deleted range moves to the start
///   of the range and loses its text; one after the range shifts left.
/// - delete/insert: an insert at or before the range start shifts it right;
///   an insert inside the range extends it, so the delete absorbs it.
/// - delete/delete: characters already removed by `b` are dropped from `a`.
///
/// The function is pure and total. The id and base revision of `a` are
/// carried over unchanged.
///
/// Convergence: for any `a` and `b` composed against the same document,
/// `apply_operation` of `b` then `transform(a, b)` gives the same text as `a` then `transform(b, a)`.
auto transform(const Operation& a, const Operation& b) -> Operation;

/// Transform two concurrent operations against each other.
/// @return `{transform(a, b), transform(b, a)}`.
auto transform_pair(const Operation& a, const Operation& b) -> std::pair<Operation, Operation>;

/// Re-project an offset through an applied operation.
///
/// An insert strictly before the offset shifts it right. An insert exactly
/// at the offset shifts it only when `stick_after_insert` is set, which
/// is how the author's own caret follows the text they type. A delete
/// before the offset shifts it left; one covering it clamps it to the
/// start of the deleted range.
auto transform_index(std::size_t index, const Operation& op,
                     bool stick_after_insert = false) -> std::size_t;

/// Re-project both ends of a cursor through an applied operation.
/// @param own True if `op` was authored by the cursor's owner.
auto transform_cursor(const Cursor& cursor, const Operation& op, bool own = false) -> Cursor;

/// Apply an operation to a string.
/// @throws std::out_of_range if the operation does not fit the string.
void apply_operation(std::string& content, const Operation& op);

}  // namespace ot_cpp
