#include <ot-cpp/session.hpp>
#include <ot-cpp/transform.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <variant>

namespace ot_cpp {

namespace {

auto clamped(Cursor cursor, std::size_t size) -> Cursor {
    cursor.position = std::min(cursor.position, size);
    cursor.anchor = std::min(cursor.anchor, size);
    return cursor;
}

}  // namespace

Session::Session(ClientId client, CapabilitySet capabilities, Snapshot initial,
                 std::shared_ptr<Uplink> uplink, std::shared_ptr<thread_pool> pool)
    : client_{std::move(client)},
      uplink_{std::move(uplink)},
      pool_{std::move(pool)},
      capabilities_{capabilities},
      text_{std::move(initial.content)},
      acked_{initial.revision} {
    if (!uplink_) {
        throw std::invalid_argument{"Session requires an uplink"};
    }
}

// -- Local edits --------------------------------------------------------------

auto Session::insert(std::size_t position, std::string text) -> std::optional<Error> {
    return submit_local_edit(make_insert(next_op_id(), position, std::move(text)));
}

auto Session::erase(std::size_t position, std::size_t length) -> std::optional<Error> {
    return submit_local_edit(make_delete(next_op_id(), position, length));
}

auto Session::submit_local_edit(Operation op) -> std::optional<Error> {
    auto outgoing = std::optional<Submission>{};
    {
        auto lock = std::scoped_lock{mutex_};
        if (!open_) {
            return Error{ErrorKind::session_closed, "session '" + client_ + "' is closed"};
        }
        if (op.author() != client_) {
            return Error{ErrorKind::malformed_operation,
                         "session '" + client_ + "' cannot submit edits by '" + op.author() + "'"};
        }
        if (!capabilities_.contains(Capability::write)) {
            return Error{ErrorKind::unauthorized, "session '" + client_ + "' is read-only"};
        }
        if (!fits(op, text_.size())) {
            return Error{ErrorKind::malformed_operation,
                         std::string{to_string_view(op.kind)} + " at " + std::to_string(op.position) +
                         " of extent " + std::to_string(op.extent()) + " does not fit " +
                         std::to_string(text_.size()) + " bytes"};
        }

        apply_operation(text_, op);
        cursor_ = transform_cursor(cursor_, op, true);
        op.base_revision = acked_;
        pending_.push_back(std::move(op));
        if (!in_flight_) {
            in_flight_ = true;
            outgoing = Submission{.client = client_, .operation = pending_.front()};
        }
    }
    transmit(std::move(outgoing));
    return std::nullopt;
}

auto Session::next_op_id() -> OpId {
    auto lock = std::scoped_lock{mutex_};
    return OpId{client_, ++counter_};
}

void Session::transmit(std::optional<Submission> submission) {
    if (!submission) return;
    SPDLOG_DEBUG("session '{}': sending {}:{} at base {}", client_,
                 submission->operation.id.author, submission->operation.id.counter,
                 submission->operation.base_revision);
    uplink_->send(*submission);
}

// -- Server messages ----------------------------------------------------------

void Session::deliver(ServerMessage message) {
    {
        auto lock = std::scoped_lock{inbox_mutex_};
        inbox_.push_back(std::move(message));
        if (draining_) return;
        draining_ = true;
    }
    auto self = weak_from_this().lock();
    if (!pool_ || !self) {
        drain();
        return;
    }
    pool_->push_task([self] { self->drain(); });
}

void Session::drain() {
    while (true) {
        auto next = std::optional<ServerMessage>{};
        {
            auto lock = std::scoped_lock{inbox_mutex_};
            if (inbox_.empty()) {
                draining_ = false;
                return;
            }
            next.emplace(std::move(inbox_.front()));
            inbox_.pop_front();
        }
        handle(*next);
    }
}

void Session::handle(const ServerMessage& message) {
    std::visit(overload{
        [this](const Broadcast& b) { on_remote_operation(b); },
        [this](const Ack& a) { on_ack(a); },
        [this](const Rejection& r) { on_reject(r); },
    }, message);
}

void Session::on_remote_operation(const Broadcast& broadcast) {
    auto out_of_sync = false;
    {
        auto lock = std::scoped_lock{mutex_};
        if (!open_ || broadcast.revision <= acked_) return;

        if (broadcast.revision != acked_ + 1) {
            SPDLOG_WARN("session '{}': revision gap, expected {} got {}",
                        client_, acked_ + 1, broadcast.revision);
            out_of_sync = true;
        } else {
            auto op = broadcast.operation;
            for (auto& pending : pending_) {
                auto [pending_after, op_after] = transform_pair(pending, op);
                pending = std::move(pending_after);
                op = std::move(op_after);
            }
            if (fits(op, text_.size())) {
                apply_operation(text_, op);
                cursor_ = transform_cursor(cursor_, op, false);
                applied_.push_back(std::move(op));
                acked_ = broadcast.revision;
            } else {
                SPDLOG_ERROR("session '{}': revision {} does not fit the local text",
                             client_, broadcast.revision);
                out_of_sync = true;
            }
        }
    }
    if (out_of_sync) resync();
}

void Session::on_ack(const Ack& ack) {
    auto outgoing = std::optional<Submission>{};
    auto out_of_sync = false;
    {
        auto lock = std::scoped_lock{mutex_};
        if (!open_) return;
        if (!in_flight_ || pending_.front().id != ack.op_id) {
            SPDLOG_DEBUG("session '{}': ignoring ack for {}:{}",
                         client_, ack.op_id.author, ack.op_id.counter);
            return;
        }
        if (ack.revision != acked_ + 1) {
            SPDLOG_WARN("session '{}': ack at revision {} after {}", client_, ack.revision, acked_);
            out_of_sync = true;
        } else {
            pending_.pop_front();
            acked_ = ack.revision;
            if (pending_.empty()) {
                in_flight_ = false;
            } else {
                pending_.front() = pending_.front().rebased(acked_);
                outgoing = Submission{.client = client_, .operation = pending_.front()};
            }
        }
    }
    if (out_of_sync) {
        resync();
        return;
    }
    transmit(std::move(outgoing));
    forward_cursor();
}

void Session::on_reject(const Rejection& rejection) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (!open_ || !in_flight_ || pending_.front().id != rejection.op_id) return;
    }
    SPDLOG_WARN("session '{}': {}:{} rejected ({}): {}", client_,
                rejection.op_id.author, rejection.op_id.counter,
                to_string_view(rejection.error.kind), rejection.error.message);
    resync();
}

auto Session::resync() -> bool {
    if (!is_open()) return false;
    auto snapshot = uplink_->fetch_snapshot();
    {
        auto lock = std::scoped_lock{mutex_};
        pending_.clear();
        in_flight_ = false;
        if (!snapshot) {
            open_ = false;
            SPDLOG_WARN("session '{}': resync failed, closing", client_);
            return false;
        }
        ++resyncs_;
        if (snapshot->revision < acked_) {
            open_ = false;
            SPDLOG_ERROR("session '{}': snapshot at {} is older than acknowledged revision {}, closing",
                         client_, snapshot->revision, acked_);
            return false;
        }
        SPDLOG_WARN("session '{}': resync from revision {} to {}",
                    client_, acked_, snapshot->revision);
        text_ = std::move(snapshot->content);
        acked_ = snapshot->revision;
        cursor_ = clamped(cursor_, text_.size());
        cursor_dirty_ = true;
    }
    forward_cursor();
    return true;
}

auto Session::reset(Snapshot snapshot) -> bool {
    auto lock = std::scoped_lock{mutex_};
    if (!open_ || snapshot.revision <= acked_) return false;
    SPDLOG_DEBUG("session '{}': adopting revision {} (was {}), dropping {} pending",
                 client_, snapshot.revision, acked_, pending_.size());
    text_ = std::move(snapshot.content);
    acked_ = snapshot.revision;
    pending_.clear();
    in_flight_ = false;
    cursor_ = clamped(cursor_, text_.size());
    cursor_dirty_ = true;
    return true;
}

// -- Cursor -------------------------------------------------------------------

auto Session::cursor() const -> Cursor {
    auto lock = std::scoped_lock{mutex_};
    return cursor_;
}

void Session::set_cursor(Cursor cursor) {
    {
        auto lock = std::scoped_lock{mutex_};
        cursor_ = clamped(cursor, text_.size());
        cursor_dirty_ = true;
    }
    forward_cursor();
}

void Session::forward_cursor() {
    auto cursor = Cursor{};
    auto revision = Revision{0};
    {
        auto lock = std::scoped_lock{mutex_};
        if (!open_ || !pending_.empty() || !cursor_dirty_) return;
        cursor_dirty_ = false;
        cursor = cursor_;
        revision = acked_;
    }
    uplink_->send_cursor(client_, cursor, revision);
}

// -- State --------------------------------------------------------------------

auto Session::text() const -> std::string {
    auto lock = std::scoped_lock{mutex_};
    return text_;
}

auto Session::acked_revision() const -> Revision {
    auto lock = std::scoped_lock{mutex_};
    return acked_;
}

auto Session::pending() const -> std::vector<Operation> {
    auto lock = std::scoped_lock{mutex_};
    return {pending_.begin(), pending_.end()};
}

auto Session::has_pending() const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return !pending_.empty();
}

auto Session::applied() const -> std::vector<Operation> {
    auto lock = std::scoped_lock{mutex_};
    return applied_;
}

auto Session::resyncs() const -> std::uint64_t {
    auto lock = std::scoped_lock{mutex_};
    return resyncs_;
}

auto Session::capabilities() const -> CapabilitySet {
    auto lock = std::scoped_lock{mutex_};
    return capabilities_;
}

void Session::set_capabilities(CapabilitySet capabilities) {
    auto lock = std::scoped_lock{mutex_};
    capabilities_ = capabilities;
}

auto Session::is_open() const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return open_;
}

void Session::close() {
    {
        auto lock = std::scoped_lock{mutex_};
        open_ = false;
        pending_.clear();
        in_flight_ = false;
    }
    auto lock = std::scoped_lock{inbox_mutex_};
    inbox_.clear();
}

}  // namespace ot_cpp
