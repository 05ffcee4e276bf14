#include <ot-cpp/checkpoint.hpp>

#include "storage/chunk.hpp"
#include "storage/codec.hpp"
#include "storage/compression.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace ot_cpp {

namespace {

// Body layout: base revision, base content, entry count, entries.
auto encode_body(const DocumentState& state) -> std::vector<std::byte> {
    auto writer = storage::Writer{};
    const auto& base = state.base_snapshot();
    writer.write_sleb128(base.revision);
    writer.write_string(base.content);

    auto entries = state.log().entries();
    writer.write_uleb128(entries.size());
    for (const auto& op : entries) {
        writer.write_operation(op);
    }
    return writer.take();
}

auto decode_body(std::span<const std::byte> body) -> std::optional<DocumentState> {
    auto reader = storage::Reader{body};
    auto revision = reader.read_sleb128();
    if (!revision || *revision < 0) return std::nullopt;
    auto content = reader.read_string();
    auto count = content ? reader.read_uleb128() : std::nullopt;
    if (!count) return std::nullopt;

    auto state = DocumentState::from_snapshot(Snapshot{*revision, std::move(*content)});
    for (std::uint64_t i = 0; i < *count; ++i) {
        auto op = reader.read_operation();
        if (!op) return std::nullopt;
        if (auto error = state.check(*op)) {
            SPDLOG_DEBUG("checkpoint entry {} rejected: {}", i + 1, error->message);
            return std::nullopt;
        }
        state.apply(std::move(*op));
    }
    if (!reader.at_end()) return std::nullopt;
    return state;
}

}  // namespace

auto save_checkpoint(const DocumentState& state) -> std::vector<std::byte> {
    auto body = encode_body(state);
    auto output = std::vector<std::byte>{};

    if (body.size() >= storage::compress_threshold) {
        if (auto compressed = storage::compress_body(body)) {
            storage::write_chunk(storage::ChunkType::compressed, *compressed, output);
            return output;
        }
        SPDLOG_WARN("checkpoint compression failed, storing {} bytes uncompressed", body.size());
    }
    storage::write_chunk(storage::ChunkType::checkpoint, body, output);
    return output;
}

auto load_checkpoint(std::span<const std::byte> data) -> std::optional<DocumentState> {
    auto header = storage::parse_chunk_header(data);
    if (!header) return std::nullopt;
    auto body = storage::chunk_body(*header, data);
    if (!body) return std::nullopt;
    if (header->body_offset + header->body_length != data.size()) return std::nullopt;

    if (header->type == storage::ChunkType::compressed) {
        auto inflated = storage::inflate_body(*body);
        if (!inflated) return std::nullopt;
        return decode_body(*inflated);
    }
    return decode_body(*body);
}

}  // namespace ot_cpp
