#include <ot-cpp/document_state.hpp>

#include "text/gap_buffer.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace ot_cpp {

DocumentState::DocumentState()
    : buffer_{std::make_unique<detail::GapBuffer>()} {}

auto DocumentState::from_snapshot(Snapshot snapshot) -> DocumentState {
    auto state = DocumentState{};
    state.buffer_->assign(snapshot.content);
    state.log_ = RevisionLog{snapshot.revision};
    state.base_ = std::move(snapshot);
    return state;
}

DocumentState::~DocumentState() = default;

DocumentState::DocumentState(const DocumentState& other)
    : buffer_{std::make_unique<detail::GapBuffer>(*other.buffer_)},
      log_{other.log_},
      base_{other.base_} {}

auto DocumentState::operator=(const DocumentState& other) -> DocumentState& {
    if (this != &other) {
        buffer_ = std::make_unique<detail::GapBuffer>(*other.buffer_);
        log_ = other.log_;
        base_ = other.base_;
    }
    return *this;
}

DocumentState::DocumentState(DocumentState&&) noexcept = default;
auto DocumentState::operator=(DocumentState&&) noexcept -> DocumentState& = default;

auto DocumentState::content() const -> std::string {
    return buffer_->str();
}

auto DocumentState::size() const -> std::size_t {
    return buffer_->size();
}

auto DocumentState::snapshot() const -> Snapshot {
    return Snapshot{.revision = revision(), .content = content()};
}

auto DocumentState::check(const Operation& op) const -> std::optional<Error> {
    if (fits(op, size())) return std::nullopt;
    return Error{ErrorKind::malformed_operation,
                 std::string{to_string_view(op.kind)} + " at " + std::to_string(op.position) +
                 " of extent " + std::to_string(op.extent()) +
                 " does not fit a document of size " + std::to_string(size())};
}

auto DocumentState::apply(Operation op) -> Revision {
    if (!fits(op, size())) {
        throw std::out_of_range{"operation does not fit the document"};
    }
    switch (op.kind) {
        case OpKind::insert:
            buffer_->insert(op.position, op.text);
            break;
        case OpKind::del:
            buffer_->erase(op.position, op.length);
            break;
    }
    return log_.append(std::move(op));
}

auto DocumentState::content_at(Revision revision) const -> std::string {
    return log_.replay(base_.content, revision);
}

}  // namespace ot_cpp
