/// @file checkpoint.hpp
/// @brief Binary checkpoints of a document's state and history.

#pragma once

#include <ot-cpp/document_state.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace ot_cpp {

/// Serialize a document to a self-checking binary checkpoint.
///
/// The checkpoint holds the snapshot the log starts after and every log
/// entry, so load_checkpoint() restores the full reachable history, not
/// just the current content. Large checkpoints are DEFLATE-compressed.
///
/// @code
/// auto bytes = save_checkpoint(controller.state());
/// auto restored = load_checkpoint(bytes);  // std::optional<DocumentState>
/// @endcode
auto save_checkpoint(const DocumentState& state) -> std::vector<std::byte>;

/// Restore a document from a checkpoint.
///
/// @return nullopt if the data is truncated, fails its checksum, does not
///         decompress, or holds an entry that does not fit the content it
///         is replayed onto.
auto load_checkpoint(std::span<const std::byte> data) -> std::optional<DocumentState>;

}  // namespace ot_cpp
