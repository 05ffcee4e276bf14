// checkpoint_demo — saving a document and hosting the restored copy
//
// Build: cmake --build build
// Run:   ./build/checkpoint_demo [options.json]

#include <ot-cpp/ot.hpp>

#include <cstddef>
#include <cstdio>
#include <exception>
#include <string>
#include <utility>

namespace ot = ot_cpp;

int main(int argc, char** argv) {
    auto options = ot::ServiceOptions{};
    if (argc > 1) {
        try {
            options = ot::load_options(argv[1]);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "%s\n", e.what());
            return 1;
        }
    }

    auto service = ot::CollaborationService{options};
    auto doc = service.create_document("Journal", "alice");
    auto alice = service.join(doc, "alice", "Alice");
    for (int day = 1; day <= 30; ++day) {
        auto line = "day " + std::to_string(day) + ": wrote some more\n";
        if (auto error = alice->insert(alice->text().size(), line)) {
            std::fprintf(stderr, "%s\n", error->message.c_str());
            return 1;
        }
    }
    service.wait_idle();

    auto bytes = service.checkpoint(doc);
    std::printf("revision %lld, %zu bytes of content, %zu byte checkpoint\n",
                static_cast<long long>(service.info(doc)->revision),
                service.content(doc)->size(), bytes->size());

    auto state = ot::load_checkpoint(*bytes);
    if (!state) {
        std::fprintf(stderr, "checkpoint did not load\n");
        return 1;
    }
    std::printf("restored revision %lld, %zu log entries\n",
                static_cast<long long>(state->revision()), state->log().size());
    std::printf("revision 3 was:\n%s", state->content_at(3).c_str());

    auto copy = service.restore_document("Journal (copy)", "alice", std::move(*state));
    std::printf("restored copy %s matches: %s\n", copy.c_str(),
                service.content(copy) == service.content(doc) ? "yes" : "no");

    // Corrupt one byte: the checksum catches it.
    (*bytes)[bytes->size() / 2] ^= std::byte{0x01};
    std::printf("corrupted checkpoint loads: %s\n",
                ot::load_checkpoint(*bytes) ? "yes" : "no");
    return 0;
}
