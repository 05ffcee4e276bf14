#pragma once

// Raw DEFLATE for checkpoint bodies.
//
// A checkpoint body repeats the author of every log entry and tends to hold
// long runs of typed text, so it shrinks well. Small bodies are stored as
// they are; the chunk type records which form a checkpoint uses.
//
// Internal header — not installed.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace ot_cpp::storage {

// Bodies shorter than this are not worth a deflate stream.
inline constexpr std::size_t compress_threshold = 256;

// Largest body a checkpoint may inflate to.
inline constexpr std::size_t max_body_size = std::size_t{256} * 1024 * 1024;

namespace detail {

inline constexpr std::size_t block_size = 16 * 1024;
inline constexpr int raw_window_bits = -15;

inline auto as_bytef(const std::byte* p) -> Bytef* {
    return const_cast<Bytef*>(reinterpret_cast<const Bytef*>(p));
}

}  // namespace detail

// Deflate a checkpoint body, one output block at a time.
inline auto compress_body(std::span<const std::byte> body)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    if (::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                       detail::raw_window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }
    stream.next_in = detail::as_bytef(body.data());
    stream.avail_in = static_cast<uInt>(body.size());

    auto out = std::vector<std::byte>{};
    auto block = std::array<std::byte, detail::block_size>{};
    auto ret = Z_OK;
    while (ret == Z_OK) {
        stream.next_out = detail::as_bytef(block.data());
        stream.avail_out = static_cast<uInt>(block.size());
        ret = ::deflate(&stream, Z_FINISH);
        auto produced = block.size() - stream.avail_out;
        out.insert(out.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;
    return out;
}

// Inflate a checkpoint body. Fails on a corrupt stream, on bytes after the
// end of the stream, and once the output would exceed `limit`.
inline auto inflate_body(std::span<const std::byte> compressed,
                         std::size_t limit = max_body_size)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    if (::inflateInit2(&stream, detail::raw_window_bits) != Z_OK) return std::nullopt;
    stream.next_in = detail::as_bytef(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    auto out = std::vector<std::byte>{};
    auto block = std::array<std::byte, detail::block_size>{};
    // A truncated stream stops with Z_BUF_ERROR once the input runs out.
    auto ret = Z_OK;
    while (ret == Z_OK) {
        stream.next_out = detail::as_bytef(block.data());
        stream.avail_out = static_cast<uInt>(block.size());
        ret = ::inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) break;
        auto produced = block.size() - stream.avail_out;
        if (out.size() + produced > limit) {
            ret = Z_MEM_ERROR;
            break;
        }
        out.insert(out.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    ::inflateEnd(&stream);
    if (ret != Z_STREAM_END || stream.avail_in != 0) return std::nullopt;
    return out;
}

}  // namespace ot_cpp::storage
