#include <ot-cpp/transform.hpp>

#include <algorithm>
#include <stdexcept>

namespace ot_cpp {

namespace {

// Concurrent inserts at the same offset: the lower OpId keeps its place.
auto keeps_place(const Operation& a, const Operation& b) -> bool {
    return a.id < b.id;
}

auto insert_after_insert(Operation a, const Operation& b) -> Operation {
    if (a.position > b.position ||
        (a.position == b.position && !keeps_place(a, b))) {
        a.position += b.text.size();
    }
    return a;
}

auto insert_after_delete(Operation a, const Operation& b) -> Operation {
    if (a.position <= b.position) return a;
    if (a.position < b.end()) {
        // Swallowed by the delete: keep the slot, drop the text.
        a.position = b.position;
        a.text.clear();
        return a;
    }
    a.position -= b.length;
    return a;
}

auto delete_after_insert(Operation a, const Operation& b) -> Operation {
    if (b.position <= a.position) {
        a.position += b.text.size();
    } else if (b.position < a.end()) {
        a.length += b.text.size();
    }
    return a;
}

auto delete_after_delete(Operation a, const Operation& b) -> Operation {
    const auto a_end = a.end();
    const auto b_end = b.end();
    if (a_end <= b.position) return a;
    if (a.position >= b_end) {
        a.position -= b.length;
        return a;
    }
    const auto overlap = std::min(a_end, b_end) - std::max(a.position, b.position);
    a.position = std::min(a.position, b.position);
    a.length -= overlap;
    return a;
}

}  // namespace

auto transform(const Operation& a, const Operation& b) -> Operation {
    if (a.kind == OpKind::insert) {
        return b.kind == OpKind::insert ? insert_after_insert(a, b)
                                        : insert_after_delete(a, b);
    }
    return b.kind == OpKind::insert ? delete_after_insert(a, b)
                                    : delete_after_delete(a, b);
}

auto transform_pair(const Operation& a, const Operation& b) -> std::pair<Operation, Operation> {
    return {transform(a, b), transform(b, a)};
}

auto transform_index(std::size_t index, const Operation& op,
                     bool stick_after_insert) -> std::size_t {
    switch (op.kind) {
        case OpKind::insert:
            if (op.position < index || (op.position == index && stick_after_insert)) {
                return index + op.text.size();
            }
            return index;
        case OpKind::del:
            if (index <= op.position) return index;
            if (index >= op.end()) return index - op.length;
            return op.position;
    }
    return index;
}

auto transform_cursor(const Cursor& cursor, const Operation& op, bool own) -> Cursor {
    return Cursor{
        .position = transform_index(cursor.position, op, own),
        .anchor = transform_index(cursor.anchor, op, own && !cursor.has_selection()),
    };
}

void apply_operation(std::string& content, const Operation& op) {
    if (!fits(op, content.size())) {
        throw std::out_of_range{"operation does not fit the document"};
    }
    switch (op.kind) {
        case OpKind::insert:
            content.insert(op.position, op.text);
            break;
        case OpKind::del:
            content.erase(op.position, op.length);
            break;
    }
}

}  // namespace ot_cpp
