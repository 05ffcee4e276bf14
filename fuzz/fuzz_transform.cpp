// Fuzz target for the transform functions: two operations decoded from the
// input, both composed against the same document, must converge in either
// application order.

#include <ot-cpp/transform.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace {

auto next(const uint8_t*& data, size_t& size) -> uint8_t {
    if (size == 0) return 0;
    --size;
    return *data++;
}

auto make_op(const char* author, const std::string& doc,
             const uint8_t*& data, size_t& size) -> ot_cpp::Operation {
    const auto position = next(data, size) % (doc.size() + 1);
    const auto extent = static_cast<std::size_t>(next(data, size) % 8);
    if (next(data, size) & 1) {
        return ot_cpp::make_insert({author, 1}, position, std::string(extent, author[0]));
    }
    return ot_cpp::make_delete({author, 1}, position, std::min(extent, doc.size() - position));
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto doc = std::string(next(data, size) % 32, '.');
    const auto a = make_op("a", doc, data, size);
    const auto b = make_op("b", doc, data, size);

    auto left = doc;
    ot_cpp::apply_operation(left, a);
    ot_cpp::apply_operation(left, ot_cpp::transform(b, a));

    auto right = doc;
    ot_cpp::apply_operation(right, b);
    ot_cpp::apply_operation(right, ot_cpp::transform(a, b));

    if (left != right) std::abort();
    return 0;
}
