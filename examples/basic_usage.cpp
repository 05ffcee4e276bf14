// basic_usage — demonstrates the core ot-cpp API
//
// Builds operations by hand, transforms two concurrent edits against each
// other, and commits them through a SyncController.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <ot-cpp/ot.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <variant>

namespace ot = ot_cpp;

static void print_result(const char* label, const ot::SubmitResult& result) {
    if (const auto* commit = std::get_if<ot::Commit>(&result)) {
        std::printf("%-28s committed as revision %lld at position %zu\n", label,
                    static_cast<long long>(commit->revision), commit->operation.position);
    } else {
        const auto& error = std::get<ot::Error>(result);
        std::printf("%-28s rejected (%s): %s\n", label,
                    std::string{ot::to_string_view(error.kind)}.c_str(), error.message.c_str());
    }
}

int main() {
    // -- Transform two concurrent operations by hand ---------------------------
    auto doc = std::string{"abcdefgh"};
    auto del = ot::make_delete({"alice", 1}, 2, 3);
    auto ins = ot::make_insert({"bob", 1}, 3, "XY");

    auto left = doc;
    ot::apply_operation(left, del);
    ot::apply_operation(left, ot::transform(ins, del));

    auto right = doc;
    ot::apply_operation(right, ins);
    ot::apply_operation(right, ot::transform(del, ins));

    std::printf("delete-then-insert: %s\n", left.c_str());
    std::printf("insert-then-delete: %s\n", right.c_str());

    // -- Commit through a controller ------------------------------------------
    auto permissions = std::make_shared<ot::PermissionTable>();
    permissions->grant("x", ot::Role::editor);
    permissions->grant("y", ot::Role::editor);

    auto controller = ot::SyncController{"demo", permissions};
    print_result("x: insert \"hello\" @0 base 0",
                 controller.submit({"x", ot::make_insert({"x", 1}, 0, "hello", 0)}));
    print_result("y: insert \"!!\" @0 base 0",
                 controller.submit({"y", ot::make_insert({"y", 1}, 0, "!!", 0)}));
    print_result("z: insert \"?\" @0 base 2",
                 controller.submit({"z", ot::make_insert({"z", 1}, 0, "?", 2)}));
    print_result("x: delete 1 @0 base 7",
                 controller.submit({"x", ot::make_delete({"x", 2}, 0, 1, 7)}));

    std::printf("content at revision %lld: \"%s\"\n",
                static_cast<long long>(controller.revision()), controller.content().c_str());

    // -- Replay history -------------------------------------------------------
    for (auto r = ot::Revision{0}; r <= controller.revision(); ++r) {
        if (auto text = controller.content_at(r)) {
            std::printf("  revision %lld: \"%s\"\n", static_cast<long long>(r), text->c_str());
        }
    }

    return 0;
}
