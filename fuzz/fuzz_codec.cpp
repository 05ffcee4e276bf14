// Fuzz target for the checkpoint body reader — LEB128 edge cases
// (overflow, truncation) and length-prefixed strings.

#include "src/storage/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto u = ot_cpp::storage::decode_uleb128(span);
    (void)u;
    auto s = ot_cpp::storage::decode_sleb128(span);
    (void)s;

    auto reader = ot_cpp::storage::Reader{span};
    while (!reader.at_end()) {
        if (!reader.read_operation()) break;
    }
    return 0;
}
