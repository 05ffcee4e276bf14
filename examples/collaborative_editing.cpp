// collaborative_editing — two users editing one document through a service
//
// Alice owns the document; Bob joins as a viewer, is refused, and edits
// once Alice grants him the editor role.
//
// Build: cmake --build build
// Run:   ./build/collaborative_editing

#include <ot-cpp/ot.hpp>

#include <cstdio>
#include <optional>
#include <string>

namespace ot = ot_cpp;

static void report(const char* action, const std::optional<ot::Error>& error) {
    if (error) {
        std::printf("%-34s -> %s: %s\n", action,
                    std::string{ot::to_string_view(error->kind)}.c_str(), error->message.c_str());
    } else {
        std::printf("%-34s -> ok\n", action);
    }
}

int main() {
    auto service = ot::CollaborationService{};
    auto doc = service.create_document("Greeting", "alice");
    std::printf("document %s\n", doc.c_str());

    service.join(doc, "alice", "Alice");
    service.join(doc, "bob", "Bob");

    report("alice inserts \"Hello, \"", service.insert_text(doc, "alice", 0, "Hello, "));
    report("bob inserts \"World\" (viewer)", service.insert_text(doc, "bob", 7, "World"));

    service.grant(doc, "bob", ot::Role::editor);
    report("bob inserts \"World\" (editor)", service.insert_text(doc, "bob", 7, "World"));
    report("alice moves her cursor to the end", service.move_cursor(doc, "alice", ot::Cursor::at(12)));
    report("bob inserts \"!\"", service.insert_text(doc, "bob", 12, "!"));

    std::printf("\ncontent: \"%s\"\n", service.content(doc)->c_str());
    for (const auto& user : service.active_users(doc)) {
        std::printf("  %-6s (%s) cursor %zu\n", user.username.c_str(), user.client.c_str(),
                    user.cursor.position);
    }

    auto info = service.info(doc);
    std::printf("revision %lld, %zu sessions\n",
                static_cast<long long>(info->revision), info->sessions);
    return 0;
}
