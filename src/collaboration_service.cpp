#include <ot-cpp/checkpoint.hpp>
#include <ot-cpp/collaboration_service.hpp>
#include <ot-cpp/logging.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>
#include <thread>
#include <utility>
#include <variant>

namespace ot_cpp {

namespace {

auto make_pool(unsigned int delivery_threads) -> std::shared_ptr<thread_pool> {
    if (delivery_threads == 1) return nullptr;
    auto n = (delivery_threads == 0) ? std::thread::hardware_concurrency() : delivery_threads;
    if (n <= 1) return nullptr;
    return std::make_shared<thread_pool>(n);
}

// 128 random bits as 32 lowercase hex digits. One engine per thread, so
// services on different threads never share it.
auto random_document_id() -> DocumentId {
    thread_local auto gen = std::mt19937_64{std::random_device{}()};
    thread_local auto dis = std::uniform_int_distribution<std::uint64_t>{};
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(dis(gen)),
                  static_cast<unsigned long long>(dis(gen)));
    return DocumentId{buf};
}

// Connects a session to a controller in the same process.
class LocalUplink final : public Uplink {
public:
    explicit LocalUplink(std::weak_ptr<SyncController> controller)
        : controller_{std::move(controller)} {}

    void send(const Submission& submission) override {
        auto controller = controller_.lock();
        if (!controller) {
            SPDLOG_WARN("submission {}:{} for a closed document",
                        submission.operation.id.author, submission.operation.id.counter);
            return;
        }
        auto result = controller->submit(submission);
        if (const auto* error = std::get_if<Error>(&result)) {
            SPDLOG_DEBUG("submission {}:{} not committed: {}",
                         submission.operation.id.author, submission.operation.id.counter,
                         error->message);
        }
    }

    auto fetch_snapshot() -> std::optional<Snapshot> override {
        auto controller = controller_.lock();
        if (!controller) return std::nullopt;
        return controller->snapshot();
    }

    void send_cursor(const ClientId& client, const Cursor& cursor, Revision revision) override {
        auto controller = controller_.lock();
        if (!controller) return;
        if (!controller->update_cursor(client, cursor, revision)) {
            SPDLOG_DEBUG("cursor of '{}' at revision {} not applied", client, revision);
        }
    }

private:
    std::weak_ptr<SyncController> controller_;
};

}  // namespace

struct CollaborationService::Hosted {
    DocumentId id;
    std::string title;
    ClientId owner;
    std::shared_ptr<PermissionTable> permissions;
    std::shared_ptr<SyncController> controller;

    std::mutex sessions_mutex;
    std::map<ClientId, std::shared_ptr<Session>> sessions;

    auto find_session(const ClientId& client) -> std::shared_ptr<Session> {
        auto lock = std::scoped_lock{sessions_mutex};
        auto it = sessions.find(client);
        return it != sessions.end() ? it->second : nullptr;
    }
};

CollaborationService::CollaborationService()
    : CollaborationService{ServiceOptions{}} {}

CollaborationService::CollaborationService(ServiceOptions options)
    : options_{std::move(options)},
      pool_{make_pool(options_.delivery_threads)} {
    if (!options_.log_level.empty() && !set_log_level(options_.log_level)) {
        SPDLOG_WARN("unknown log level '{}'", options_.log_level);
    }
}

CollaborationService::~CollaborationService() {
    auto hosted = std::vector<std::shared_ptr<Hosted>>{};
    {
        auto lock = std::unique_lock{mutex_};
        for (auto& [id, entry] : documents_) {
            hosted.push_back(std::move(entry));
        }
        documents_.clear();
    }
    for (const auto& entry : hosted) {
        auto lock = std::scoped_lock{entry->sessions_mutex};
        for (const auto& [client, session] : entry->sessions) {
            entry->controller->detach(client);
            session->close();
        }
    }
    wait_idle();
}

// -- Documents ----------------------------------------------------------------

auto CollaborationService::create_document(std::string title, const ClientId& owner)
    -> DocumentId {
    return host(std::move(title), owner, DocumentState{});
}

auto CollaborationService::restore_document(std::string title, const ClientId& owner,
                                            DocumentState state) -> DocumentId {
    return host(std::move(title), owner, std::move(state));
}

auto CollaborationService::host(std::string title, const ClientId& owner,
                                DocumentState state) -> DocumentId {
    auto hosted = std::make_shared<Hosted>();
    hosted->title = std::move(title);
    hosted->owner = owner;
    hosted->permissions = std::make_shared<PermissionTable>(options_.default_role);
    hosted->permissions->grant(owner, Role::owner);

    auto lock = std::unique_lock{mutex_};
    do {
        hosted->id = random_document_id();
    } while (documents_.contains(hosted->id));
    hosted->controller = std::make_shared<SyncController>(hosted->id, hosted->permissions,
                                                          std::move(state));
    documents_.emplace(hosted->id, hosted);
    SPDLOG_INFO("doc {}: '{}' opened by '{}' at revision {}",
                hosted->id, hosted->title, owner, hosted->controller->revision());
    return hosted->id;
}

auto CollaborationService::close_document(const DocumentId& doc) -> bool {
    auto hosted = std::shared_ptr<Hosted>{};
    {
        auto lock = std::unique_lock{mutex_};
        auto it = documents_.find(doc);
        if (it == documents_.end()) return false;
        hosted = std::move(it->second);
        documents_.erase(it);
    }
    auto lock = std::scoped_lock{hosted->sessions_mutex};
    for (const auto& [client, session] : hosted->sessions) {
        hosted->controller->detach(client);
        session->close();
    }
    hosted->sessions.clear();
    SPDLOG_INFO("doc {}: closed", doc);
    return true;
}

auto CollaborationService::has_document(const DocumentId& doc) const -> bool {
    return find(doc) != nullptr;
}

auto CollaborationService::documents() const -> std::vector<DocumentId> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<DocumentId>{};
    result.reserve(documents_.size());
    for (const auto& [id, hosted] : documents_) {
        result.push_back(id);
    }
    return result;
}

auto CollaborationService::info(const DocumentId& doc) const -> std::optional<DocumentInfo> {
    auto hosted = find(doc);
    if (!hosted) return std::nullopt;
    auto sessions = std::size_t{0};
    {
        auto lock = std::scoped_lock{hosted->sessions_mutex};
        sessions = hosted->sessions.size();
    }
    return DocumentInfo{
        .id = hosted->id,
        .title = hosted->title,
        .owner = hosted->owner,
        .revision = hosted->controller->revision(),
        .sessions = sessions,
    };
}

auto CollaborationService::controller(const DocumentId& doc) const
    -> std::shared_ptr<SyncController> {
    auto hosted = find(doc);
    return hosted ? hosted->controller : nullptr;
}

auto CollaborationService::find(const DocumentId& doc) const -> std::shared_ptr<Hosted> {
    auto lock = std::shared_lock{mutex_};
    auto it = documents_.find(doc);
    return it != documents_.end() ? it->second : nullptr;
}

// -- Sessions -----------------------------------------------------------------

auto CollaborationService::join(const DocumentId& doc, const ClientId& client,
                                std::string username) -> std::shared_ptr<Session> {
    auto hosted = find(doc);
    if (!hosted) return nullptr;

    auto lock = std::scoped_lock{hosted->sessions_mutex};
    if (auto it = hosted->sessions.find(client); it != hosted->sessions.end()) {
        return it->second;
    }

    auto session = std::make_shared<Session>(
        client, hosted->permissions->capabilities(client), hosted->controller->snapshot(),
        std::make_shared<LocalUplink>(hosted->controller), pool_);
    auto weak = std::weak_ptr<Session>{session};
    auto snapshot = hosted->controller->attach(client, std::move(username),
        [weak](const ServerMessage& message) {
            if (auto target = weak.lock()) target->deliver(message);
        });
    // Commits between the first snapshot and attach() are not delivered.
    session->reset(std::move(snapshot));
    hosted->sessions.emplace(client, session);
    return session;
}

auto CollaborationService::leave(const DocumentId& doc, const ClientId& client) -> bool {
    auto hosted = find(doc);
    if (!hosted) return false;

    auto session = std::shared_ptr<Session>{};
    {
        auto lock = std::scoped_lock{hosted->sessions_mutex};
        auto it = hosted->sessions.find(client);
        if (it == hosted->sessions.end()) return false;
        session = std::move(it->second);
        hosted->sessions.erase(it);
    }
    hosted->controller->detach(client);
    session->close();
    return true;
}

auto CollaborationService::session(const DocumentId& doc, const ClientId& client) const
    -> std::shared_ptr<Session> {
    auto hosted = find(doc);
    return hosted ? hosted->find_session(client) : nullptr;
}

// -- Permissions --------------------------------------------------------------

auto CollaborationService::grant(const DocumentId& doc, const ClientId& client,
                                 Role role) -> std::optional<Error> {
    auto hosted = find(doc);
    if (!hosted) return Error{ErrorKind::unknown_document, "no document " + doc};
    hosted->permissions->grant(client, role);
    if (auto session = hosted->find_session(client)) {
        session->set_capabilities(capabilities_of(role));
    }
    SPDLOG_INFO("doc {}: '{}' granted {}", doc, client, to_string_view(role));
    return std::nullopt;
}

auto CollaborationService::revoke(const DocumentId& doc, const ClientId& client)
    -> std::optional<Error> {
    auto hosted = find(doc);
    if (!hosted) return Error{ErrorKind::unknown_document, "no document " + doc};
    if (hosted->permissions->revoke(client)) {
        SPDLOG_INFO("doc {}: '{}' revoked", doc, client);
    }
    if (auto session = hosted->find_session(client)) {
        session->set_capabilities(hosted->permissions->capabilities(client));
    }
    return std::nullopt;
}

auto CollaborationService::role_of(const DocumentId& doc, const ClientId& client) const
    -> std::optional<Role> {
    auto hosted = find(doc);
    if (!hosted) return std::nullopt;
    return hosted->permissions->role_of(client);
}

// -- Editing ------------------------------------------------------------------

auto CollaborationService::edit(const DocumentId& doc, const ClientId& client,
                                const std::function<std::optional<Error>(Session&)>& fn)
    -> std::optional<Error> {
    auto hosted = find(doc);
    if (!hosted) return Error{ErrorKind::unknown_document, "no document " + doc};
    auto session = hosted->find_session(client);
    if (!session) {
        return Error{ErrorKind::unknown_session, "'" + client + "' has not joined " + doc};
    }
    return fn(*session);
}

auto CollaborationService::insert_text(const DocumentId& doc, const ClientId& client,
                                       std::size_t position, std::string text)
    -> std::optional<Error> {
    return edit(doc, client, [&](Session& session) {
        return session.insert(position, std::move(text));
    });
}

auto CollaborationService::delete_text(const DocumentId& doc, const ClientId& client,
                                       std::size_t position, std::size_t length)
    -> std::optional<Error> {
    return edit(doc, client, [&](Session& session) {
        return session.erase(position, length);
    });
}

auto CollaborationService::move_cursor(const DocumentId& doc, const ClientId& client,
                                       Cursor cursor) -> std::optional<Error> {
    return edit(doc, client, [&](Session& session) -> std::optional<Error> {
        session.set_cursor(cursor);
        return std::nullopt;
    });
}

// -- Reads --------------------------------------------------------------------

auto CollaborationService::content(const DocumentId& doc) const -> std::optional<std::string> {
    auto hosted = find(doc);
    if (!hosted) return std::nullopt;
    return hosted->controller->content();
}

auto CollaborationService::active_users(const DocumentId& doc) const -> std::vector<Presence> {
    auto hosted = find(doc);
    if (!hosted) return {};
    return hosted->controller->presence();
}

auto CollaborationService::snapshot(const DocumentId& doc) const -> std::optional<Snapshot> {
    auto hosted = find(doc);
    if (!hosted) return std::nullopt;
    return hosted->controller->snapshot();
}

auto CollaborationService::appended_since(const DocumentId& doc, Revision revision) const
    -> std::optional<std::vector<Operation>> {
    auto hosted = find(doc);
    if (!hosted) return std::nullopt;
    return hosted->controller->appended_since(revision);
}

auto CollaborationService::checkpoint(const DocumentId& doc) const
    -> std::optional<std::vector<std::byte>> {
    auto hosted = find(doc);
    if (!hosted) return std::nullopt;
    return save_checkpoint(hosted->controller->state());
}

void CollaborationService::wait_idle() {
    if (pool_) pool_->wait_for_tasks();
}

}  // namespace ot_cpp
