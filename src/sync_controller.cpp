#include <ot-cpp/sync_controller.hpp>
#include <ot-cpp/transform.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace ot_cpp {

SyncController::SyncController(DocumentId id,
                               std::shared_ptr<const PermissionProvider> permissions)
    : SyncController{std::move(id), std::move(permissions), DocumentState{}} {}

SyncController::SyncController(DocumentId id,
                               std::shared_ptr<const PermissionProvider> permissions,
                               DocumentState initial)
    : id_{std::move(id)},
      permissions_{std::move(permissions)},
      state_{std::move(initial)} {
    if (!permissions_) {
        throw std::invalid_argument{"SyncController requires a permission provider"};
    }
}

// -- Submissions --------------------------------------------------------------

auto SyncController::submit(const Submission& submission) -> SubmitResult {
    const auto& client = submission.client;
    auto op = submission.operation;
    const auto base = op.base_revision;

    trace(submission, SyncPhase::idle, SyncPhase::validating);

    if (op.author() != client) {
        return reject(submission, Error{ErrorKind::malformed_operation,
            "operation authored by '" + op.author() + "' submitted by '" + client + "'"});
    }
    if (!permissions_->has_capability(client, Capability::write)) {
        return reject(submission, Error{ErrorKind::unauthorized,
            "client '" + client + "' may not edit document " + id_});
    }

    const auto was_attached = is_attached(client);
    auto seen = Revision{0};
    auto gap = std::vector<Operation>{};
    {
        auto lock = std::shared_lock{mutex_};
        const auto& log = state_.log();
        if (base < 0 || !log.reaches(base)) {
            auto message = "base revision " + std::to_string(base) + " outside [" +
                           std::to_string(log.base()) + ", " + std::to_string(log.head()) + "]";
            lock.unlock();
            return reject(submission, Error{ErrorKind::stale_revision, std::move(message)});
        }
        gap = log.entries_since(base);
        seen = log.head();
    }

    trace(submission, SyncPhase::validating, SyncPhase::transforming);
    for (const auto& entry : gap) {
        op = transform(op, entry);
    }

    trace(submission, SyncPhase::transforming, SyncPhase::committing);
    auto revision = Revision{0};
    auto failure = std::optional<Error>{};
    {
        auto lock = std::unique_lock{mutex_};
        if (state_.revision() != seen) {
            // Others committed while we were transforming; catch up.
            retransforms_.fetch_add(1, std::memory_order_relaxed);
            for (const auto& entry : state_.log().entries_since(seen)) {
                op = transform(op, entry);
            }
        }

        if (was_attached && !is_attached(client)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_INFO("doc {}: dropped {}:{} from disconnected client",
                        id_, op.id.author, op.id.counter);
            return Error{ErrorKind::session_closed,
                         "client '" + client + "' disconnected before commit"};
        }

        failure = state_.check(op);
        if (!failure) {
            op = op.rebased(state_.revision());
            revision = state_.apply(op);
            for (auto& [id, entry] : presence_) {
                entry.cursor = transform_cursor(entry.cursor, op, id == op.author());
            }
            enqueue(Outgoing{.client = client, .exclusive = false,
                             .message = Broadcast{.revision = revision, .operation = op}});
            enqueue(Outgoing{.client = client, .exclusive = true,
                             .message = Ack{.op_id = op.id, .revision = revision}});
        }
    }
    if (failure) {
        SPDLOG_ERROR("doc {}: malformed operation {}:{} from '{}': {}",
                     id_, op.id.author, op.id.counter, client, failure->message);
        return reject(submission, std::move(*failure));
    }

    committed_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_DEBUG("doc {}: committed {}:{} as revision {} (base {})",
                 id_, op.id.author, op.id.counter, revision, base);

    trace(submission, SyncPhase::committing, SyncPhase::broadcasting);
    flush();
    trace(submission, SyncPhase::broadcasting, SyncPhase::idle);

    return Commit{.revision = revision, .operation = std::move(op)};
}

auto SyncController::reject(const Submission& submission, Error error) -> SubmitResult {
    switch (error.kind) {
        case ErrorKind::stale_revision:      stale_.fetch_add(1, std::memory_order_relaxed); break;
        case ErrorKind::unauthorized:        unauthorized_.fetch_add(1, std::memory_order_relaxed); break;
        case ErrorKind::malformed_operation: malformed_.fetch_add(1, std::memory_order_relaxed); break;
        default: break;
    }
    SPDLOG_WARN("doc {}: rejected {}:{} from '{}' ({}): {}",
                id_, submission.operation.id.author, submission.operation.id.counter,
                submission.client, to_string_view(error.kind), error.message);

    if (is_attached(submission.client)) {
        enqueue(Outgoing{.client = submission.client, .exclusive = true,
                         .message = Rejection{.op_id = submission.operation.id, .error = error}});
        flush();
    }
    return error;
}

// -- Delivery -----------------------------------------------------------------

void SyncController::enqueue(Outgoing outgoing) {
    auto lock = std::scoped_lock{outbox_mutex_};
    outbox_.push_back(std::move(outgoing));
}

void SyncController::flush() {
    {
        auto lock = std::scoped_lock{outbox_mutex_};
        if (flushing_) return;  // the thread already flushing will pick ours up
        flushing_ = true;
    }
    while (true) {
        auto next = std::optional<Outgoing>{};
        {
            auto lock = std::scoped_lock{outbox_mutex_};
            if (outbox_.empty()) {
                flushing_ = false;
                return;
            }
            next.emplace(std::move(outbox_.front()));
            outbox_.pop_front();
        }
        deliver(*next);
    }
}

void SyncController::deliver(const Outgoing& outgoing) {
    auto targets = std::vector<std::pair<ClientId, Listener>>{};
    {
        auto lock = std::scoped_lock{listeners_mutex_};
        if (outgoing.exclusive) {
            auto it = listeners_.find(outgoing.client);
            if (it != listeners_.end()) targets.emplace_back(*it);
        } else {
            for (const auto& entry : listeners_) {
                if (entry.first != outgoing.client) targets.push_back(entry);
            }
        }
    }
    for (const auto& [client, listener] : targets) {
        try {
            listener(outgoing.message);
        } catch (const std::exception& e) {
            SPDLOG_ERROR("doc {}: listener for '{}' failed: {}", id_, client, e.what());
        }
    }
}

void SyncController::trace(const Submission& submission, SyncPhase from, SyncPhase to) const {
    SPDLOG_TRACE("doc {}: {}:{} {} -> {}", id_, submission.operation.id.author,
                 submission.operation.id.counter, to_string_view(from), to_string_view(to));
}

// -- Attachment and presence --------------------------------------------------

auto SyncController::attach(const ClientId& client, std::string username,
                            Listener listener) -> Snapshot {
    auto lock = std::unique_lock{mutex_};
    {
        auto listeners_lock = std::scoped_lock{listeners_mutex_};
        listeners_.insert_or_assign(client, std::move(listener));
    }
    presence_.insert_or_assign(client, Presence{
        .client = client, .username = std::move(username), .cursor = Cursor{}});
    SPDLOG_INFO("doc {}: '{}' attached at revision {}", id_, client, state_.revision());
    return state_.snapshot();
}

auto SyncController::detach(const ClientId& client) -> bool {
    auto lock = std::unique_lock{mutex_};
    presence_.erase(client);
    auto listeners_lock = std::scoped_lock{listeners_mutex_};
    auto removed = listeners_.erase(client) > 0;
    if (removed) {
        SPDLOG_INFO("doc {}: '{}' detached", id_, client);
    }
    return removed;
}

auto SyncController::is_attached(const ClientId& client) const -> bool {
    auto lock = std::scoped_lock{listeners_mutex_};
    return listeners_.contains(client);
}

auto SyncController::attached_count() const -> std::size_t {
    auto lock = std::scoped_lock{listeners_mutex_};
    return listeners_.size();
}

auto SyncController::update_cursor(const ClientId& client, Cursor cursor,
                                   Revision revision) -> bool {
    auto lock = std::unique_lock{mutex_};
    auto it = presence_.find(client);
    if (it == presence_.end() || !state_.log().reaches(revision)) return false;

    for (const auto& entry : state_.log().entries_since(revision)) {
        cursor = transform_cursor(cursor, entry, entry.author() == client);
    }
    const auto size = state_.size();
    cursor.position = std::min(cursor.position, size);
    cursor.anchor = std::min(cursor.anchor, size);
    it->second.cursor = cursor;
    return true;
}

auto SyncController::presence() const -> std::vector<Presence> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<Presence>{};
    result.reserve(presence_.size());
    for (const auto& [client, entry] : presence_) {
        result.push_back(entry);
    }
    return result;
}

// -- Reads --------------------------------------------------------------------

auto SyncController::revision() const -> Revision {
    auto lock = std::shared_lock{mutex_};
    return state_.revision();
}

auto SyncController::content() const -> std::string {
    auto lock = std::shared_lock{mutex_};
    return state_.content();
}

auto SyncController::snapshot() const -> Snapshot {
    auto lock = std::shared_lock{mutex_};
    return state_.snapshot();
}

auto SyncController::appended_since(Revision revision) const
    -> std::optional<std::vector<Operation>> {
    auto lock = std::shared_lock{mutex_};
    if (!state_.log().reaches(revision)) return std::nullopt;
    return state_.log().entries_since(revision);
}

auto SyncController::content_at(Revision revision) const -> std::optional<std::string> {
    auto lock = std::shared_lock{mutex_};
    if (!state_.log().reaches(revision)) return std::nullopt;
    return state_.content_at(revision);
}

auto SyncController::state() const -> DocumentState {
    auto lock = std::shared_lock{mutex_};
    return state_;
}

auto SyncController::stats() const -> SyncStats {
    return SyncStats{
        .committed = committed_.load(std::memory_order_relaxed),
        .stale = stale_.load(std::memory_order_relaxed),
        .unauthorized = unauthorized_.load(std::memory_order_relaxed),
        .malformed = malformed_.load(std::memory_order_relaxed),
        .dropped = dropped_.load(std::memory_order_relaxed),
        .retransforms = retransforms_.load(std::memory_order_relaxed),
    };
}

}  // namespace ot_cpp
