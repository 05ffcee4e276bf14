// Fuzz target for load_checkpoint() — exercises the chunk envelope, inflate
// and the body decoder. Any checkpoint that loads must save and load again
// to the same document.

#include <ot-cpp/checkpoint.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto state = ot_cpp::load_checkpoint(span);
    if (state) {
        auto again = ot_cpp::load_checkpoint(ot_cpp::save_checkpoint(*state));
        if (!again || again->snapshot() != state->snapshot()) std::abort();
    }
    return 0;
}
