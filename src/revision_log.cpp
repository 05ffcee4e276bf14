#include <ot-cpp/revision_log.hpp>
#include <ot-cpp/transform.hpp>

#include <stdexcept>
#include <utility>

namespace ot_cpp {

auto RevisionLog::append(Operation op) -> Revision {
    ops_.push_back(std::move(op));
    return head();
}

auto RevisionLog::entries_since(Revision revision) const -> std::vector<Operation> {
    if (!reaches(revision)) {
        throw std::out_of_range{"revision outside the log"};
    }
    auto first = ops_.begin() + (revision - base_);
    return {first, ops_.end()};
}

auto RevisionLog::at(Revision revision) const -> const Operation& {
    if (revision <= base_ || revision > head()) {
        throw std::out_of_range{"revision outside the log"};
    }
    return ops_[static_cast<std::size_t>(revision - base_ - 1)];
}

auto RevisionLog::replay(const std::string& base_content, Revision revision) const -> std::string {
    if (!reaches(revision)) {
        throw std::out_of_range{"revision outside the log"};
    }
    auto content = base_content;
    for (auto r = base_ + 1; r <= revision; ++r) {
        apply_operation(content, at(r));
    }
    return content;
}

}  // namespace ot_cpp
