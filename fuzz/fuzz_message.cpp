// Fuzz target for the JSON wire codec. Anything that decodes must encode
// and decode back to the same message.

#include <ot-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    if (auto submission = ot_cpp::decode_submission(text)) {
        auto again = ot_cpp::decode_submission(ot_cpp::encode(*submission));
        if (!again || *again != *submission) std::abort();
    }
    if (auto message = ot_cpp::decode_server_message(text)) {
        auto again = ot_cpp::decode_server_message(ot_cpp::encode(*message));
        if (!again || *again != *message) std::abort();
    }
    return 0;
}
