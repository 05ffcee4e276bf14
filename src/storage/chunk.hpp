#pragma once

// Chunk envelope for checkpoints.
//
//   magic (4 bytes: "OTCP")
//   checksum (4 bytes: CRC-32 of the body, little endian)
//   chunk_type (1 byte)
//   body_length (ULEB128)
//   body (body_length bytes)
//
// Internal header — not installed.

#include "codec.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace ot_cpp::storage {

inline constexpr std::array<std::byte, 4> chunk_magic = {
    std::byte{'O'}, std::byte{'T'}, std::byte{'C'}, std::byte{'P'}
};

enum class ChunkType : std::uint8_t {
    checkpoint = 0x00,  // body stored as-is
    compressed = 0x01,  // body is a raw-DEFLATE compressed checkpoint body
};

struct ChunkHeader {
    ChunkType type;
    std::uint32_t checksum;
    std::size_t body_offset;  // where the body starts in the original data
    std::size_t body_length;
};

inline auto compute_chunk_checksum(std::span<const std::byte> body) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    // crc32() takes a uInt length; feed large bodies in pieces.
    constexpr auto max_piece = std::size_t{1} << 30;
    while (!body.empty()) {
        auto piece = body.first(std::min(body.size(), max_piece));
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(piece.data()),
                      static_cast<uInt>(piece.size()));
        body = body.subspan(piece.size());
    }
    return static_cast<std::uint32_t>(crc);
}

// Returns nullopt if the header is truncated, has the wrong magic or an
// unknown chunk type.
inline auto parse_chunk_header(std::span<const std::byte> data)
    -> std::optional<ChunkHeader> {
    if (data.size() < 9) return std::nullopt;
    if (std::memcmp(data.data(), chunk_magic.data(), chunk_magic.size()) != 0) {
        return std::nullopt;
    }

    auto checksum = std::uint32_t{0};
    for (std::size_t i = 0; i < 4; ++i) {
        checksum |= static_cast<std::uint32_t>(data[4 + i]) << (8 * i);
    }

    auto type = static_cast<std::uint8_t>(data[8]);
    if (type > static_cast<std::uint8_t>(ChunkType::compressed)) return std::nullopt;

    auto length = decode_uleb128(data.subspan(9));
    if (!length) return std::nullopt;

    return ChunkHeader{
        .type = static_cast<ChunkType>(type),
        .checksum = checksum,
        .body_offset = 9 + length->bytes_read,
        .body_length = static_cast<std::size_t>(length->value),
    };
}

// The body described by `header`, or nullopt if it is truncated or fails
// the checksum.
inline auto chunk_body(const ChunkHeader& header, std::span<const std::byte> data)
    -> std::optional<std::span<const std::byte>> {
    if (header.body_offset > data.size() ||
        header.body_length > data.size() - header.body_offset) {
        return std::nullopt;
    }
    auto body = data.subspan(header.body_offset, header.body_length);
    if (compute_chunk_checksum(body) != header.checksum) return std::nullopt;
    return body;
}

inline void write_chunk(ChunkType type, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    output.insert(output.end(), chunk_magic.begin(), chunk_magic.end());

    auto checksum = compute_chunk_checksum(body);
    for (std::size_t i = 0; i < 4; ++i) {
        output.push_back(static_cast<std::byte>((checksum >> (8 * i)) & 0xFF));
    }

    output.push_back(static_cast<std::byte>(type));
    encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

}  // namespace ot_cpp::storage
