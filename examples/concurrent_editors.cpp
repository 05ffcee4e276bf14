// concurrent_editors — many editors typing at once
//
// Each editor runs on its own thread and inserts at the start of the
// document; server messages are processed on the service's thread pool.
// Every session ends with the same text as the server.
//
// Build: cmake --build build
// Run:   ./build/concurrent_editors [editors] [edits]

#include <ot-cpp/ot.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ot = ot_cpp;

int main(int argc, char** argv) {
    const int editors = argc > 1 ? std::atoi(argv[1]) : 8;
    const int edits = argc > 2 ? std::atoi(argv[2]) : 200;
    if (editors <= 0 || edits <= 0) {
        std::fprintf(stderr, "usage: %s [editors] [edits]\n", argv[0]);
        return 1;
    }

    auto service = ot::CollaborationService{ot::ServiceOptions{
        .delivery_threads = 0,
        .default_role = ot::Role::editor,
        .log_level = "warn",
    }};
    auto doc = service.create_document("Scratch", "host");

    auto sessions = std::vector<std::shared_ptr<ot::Session>>{};
    for (int e = 0; e < editors; ++e) {
        auto client = "editor-" + std::to_string(e);
        sessions.push_back(service.join(doc, client, client));
    }

    const auto start = std::chrono::steady_clock::now();
    auto threads = std::vector<std::thread>{};
    for (int e = 0; e < editors; ++e) {
        threads.emplace_back([&, e] {
            const auto letter = std::string(1, static_cast<char>('a' + e % 26));
            for (int i = 0; i < edits; ++i) {
                if (auto error = sessions[e]->insert(0, letter)) {
                    std::fprintf(stderr, "editor %d: %s\n", e, error->message.c_str());
                }
            }
        });
    }
    for (auto& t : threads) t.join();
    service.wait_idle();
    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    const auto content = *service.content(doc);
    auto converged = 0;
    for (const auto& session : sessions) {
        if (session->text() == content && !session->has_pending()) ++converged;
    }

    const auto stats = service.controller(doc)->stats();
    std::printf("%d editors x %d edits in %.1f ms\n", editors, edits, elapsed);
    std::printf("revision %lld, %zu bytes\n",
                static_cast<long long>(service.info(doc)->revision), content.size());
    std::printf("committed %llu, retransformed %llu, rejected %llu\n",
                static_cast<unsigned long long>(stats.committed),
                static_cast<unsigned long long>(stats.retransforms),
                static_cast<unsigned long long>(stats.stale + stats.malformed + stats.unauthorized));
    std::printf("%d/%d sessions converged\n", converged, editors);
    return converged == editors ? 0 : 1;
}
