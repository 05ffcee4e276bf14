#pragma once

// Gap buffer holding the committed content of a document.
//
// Edits cluster around the caret, so the free space is kept at the most
// recent edit position: consecutive inserts at the same place only move
// bytes once.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ot_cpp::detail {

class GapBuffer {
public:
    GapBuffer() = default;

    explicit GapBuffer(std::string_view text) { assign(text); }

    void assign(std::string_view text) {
        buf_.assign(text.begin(), text.end());
        buf_.resize(text.size() + min_gap);
        gap_start_ = text.size();
        gap_end_ = buf_.size();
    }

    auto size() const -> std::size_t { return buf_.size() - gap_size(); }
    auto empty() const -> bool { return size() == 0; }

    void insert(std::size_t pos, std::string_view text) {
        if (text.empty()) return;
        move_gap_to(pos);
        ensure_gap(text.size());
        std::ranges::copy(text, buf_.begin() + static_cast<std::ptrdiff_t>(gap_start_));
        gap_start_ += text.size();
    }

    void erase(std::size_t pos, std::size_t len) {
        if (len == 0) return;
        move_gap_to(pos);
        gap_end_ += len;
    }

    auto str() const -> std::string {
        auto out = std::string{};
        out.reserve(size());
        out.append(buf_.data(), gap_start_);
        out.append(buf_.data() + gap_end_, buf_.size() - gap_end_);
        return out;
    }

private:
    static constexpr std::size_t min_gap = 64;

    auto gap_size() const -> std::size_t { return gap_end_ - gap_start_; }

    void move_gap_to(std::size_t pos) {
        if (pos < gap_start_) {
            auto n = gap_start_ - pos;
            std::copy_backward(buf_.begin() + static_cast<std::ptrdiff_t>(pos),
                               buf_.begin() + static_cast<std::ptrdiff_t>(gap_start_),
                               buf_.begin() + static_cast<std::ptrdiff_t>(gap_end_));
            gap_start_ -= n;
            gap_end_ -= n;
        } else if (pos > gap_start_) {
            auto n = pos - gap_start_;
            std::copy(buf_.begin() + static_cast<std::ptrdiff_t>(gap_end_),
                      buf_.begin() + static_cast<std::ptrdiff_t>(gap_end_ + n),
                      buf_.begin() + static_cast<std::ptrdiff_t>(gap_start_));
            gap_start_ += n;
            gap_end_ += n;
        }
    }

    void ensure_gap(std::size_t need) {
        if (gap_size() >= need) return;
        auto grow = std::max({need - gap_size(), buf_.size(), min_gap});
        auto tail = buf_.size() - gap_end_;
        buf_.resize(buf_.size() + grow);
        std::copy_backward(buf_.begin() + static_cast<std::ptrdiff_t>(gap_end_),
                           buf_.begin() + static_cast<std::ptrdiff_t>(gap_end_ + tail),
                           buf_.end());
        gap_end_ += grow;
    }

    std::vector<char> buf_ = std::vector<char>(min_gap);
    std::size_t gap_start_ = 0;
    std::size_t gap_end_ = min_gap;
};

}  // namespace ot_cpp::detail
