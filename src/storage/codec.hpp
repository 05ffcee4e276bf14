#pragma once

// Byte stream writer/reader for checkpoint bodies.
//
// Integers are LEB128 (Little Endian Base 128): unsigned values as ULEB128,
// revisions as SLEB128. Strings are a ULEB128 byte length followed by the
// raw bytes.
//
// Internal header — not installed.

#include <ot-cpp/operation.hpp>
#include <ot-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ot_cpp::storage {

// -- LEB128 -------------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) byte |= std::byte{0x80};
        output.push_back(byte);
    } while (value != 0);
}

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    auto more = true;
    while (more) {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;  // arithmetic shift keeps the sign
        const bool sign_bit = (byte & std::byte{0x40}) != std::byte{0};
        if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
            more = false;
        } else {
            byte |= std::byte{0x80};
        }
        output.push_back(byte);
    }
}

// A decoded integer and the number of bytes it occupied.
template <typename T>
struct Decoded {
    T value;
    std::size_t bytes_read;
};

// Returns nullopt on truncated or overlong input.
inline auto decode_uleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::uint64_t>> {
    auto value = std::uint64_t{0};
    auto shift = 0u;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (shift >= 64) return std::nullopt;
        auto byte = input[i];
        value |= (static_cast<std::uint64_t>(byte) & 0x7F) << shift;
        shift += 7;
        if ((byte & std::byte{0x80}) == std::byte{0}) {
            return Decoded<std::uint64_t>{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

inline auto decode_sleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::int64_t>> {
    auto value = std::int64_t{0};
    auto shift = 0u;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (shift >= 64) return std::nullopt;
        auto byte = input[i];
        value |= (static_cast<std::int64_t>(byte) & 0x7F) << shift;
        shift += 7;
        if ((byte & std::byte{0x80}) == std::byte{0}) {
            if (shift < 64 && (byte & std::byte{0x40}) != std::byte{0}) {
                value |= -(std::int64_t{1} << shift);
            }
            return Decoded<std::int64_t>{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

// -- Writer -------------------------------------------------------------------

class Writer {
public:
    void write_u8(std::uint8_t v) { data_.push_back(static_cast<std::byte>(v)); }
    void write_uleb128(std::uint64_t value) { encode_uleb128(value, data_); }
    void write_sleb128(std::int64_t value) { encode_sleb128(value, data_); }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    // author, counter, kind, position, payload, base revision
    void write_operation(const Operation& op) {
        write_string(op.id.author);
        write_uleb128(op.id.counter);
        write_u8(static_cast<std::uint8_t>(op.kind));
        write_uleb128(op.position);
        if (op.kind == OpKind::insert) {
            write_string(op.text);
        } else {
            write_uleb128(op.length);
        }
        write_sleb128(op.base_revision);
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

// -- Reader -------------------------------------------------------------------

// Every read returns nullopt once the input is exhausted or malformed.
class Reader {
public:
    explicit Reader(std::span<const std::byte> data) : data_{data} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len || *len > remaining()) return std::nullopt;
        auto bytes = data_.subspan(pos_, static_cast<std::size_t>(*len));
        pos_ += bytes.size();
        return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    auto read_operation() -> std::optional<Operation> {
        auto author = read_string();
        auto counter = author ? read_uleb128() : std::nullopt;
        auto kind = counter ? read_u8() : std::nullopt;
        if (!kind || *kind > static_cast<std::uint8_t>(OpKind::del)) return std::nullopt;
        auto position = read_uleb128();
        if (!position) return std::nullopt;

        auto op = Operation{
            .id = OpId{std::move(*author), *counter},
            .kind = static_cast<OpKind>(*kind),
            .position = static_cast<std::size_t>(*position),
        };
        if (op.kind == OpKind::insert) {
            auto text = read_string();
            if (!text) return std::nullopt;
            op.text = std::move(*text);
        } else {
            auto length = read_uleb128();
            if (!length) return std::nullopt;
            op.length = static_cast<std::size_t>(*length);
        }
        auto base = read_sleb128();
        if (!base) return std::nullopt;
        op.base_revision = *base;
        return op;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
};

}  // namespace ot_cpp::storage
