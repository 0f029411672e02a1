/**
 * @file pending_queue.cpp
 * @brief Indexable skip list implementation of the pending queue
 */

#include "tessera/sync/pending_queue.h"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace tessera::sync {

PendingQueue::PendingQueue(UInt32 seed)
    : rng_(seed) {
    Node head;
    head.links.assign(MAX_LEVEL, Link{NIL, 1});
    arena_.push_back(std::move(head));
}

UInt32 PendingQueue::allocate(Operation op, SizeT height) {
    UInt32 index;
    if (!free_.empty()) {
        index = free_.back();
        free_.pop_back();
        arena_[index].op = std::move(op);
        arena_[index].links.assign(height, Link{});
        arena_[index].prev = HEAD;
    } else {
        index = static_cast<UInt32>(arena_.size());
        arena_.push_back(Node{std::move(op), std::vector<Link>(height)});
    }
    return index;
}

void PendingQueue::release(UInt32 node) {
    arena_[node].op = Operation{};
    arena_[node].links.clear();
    free_.push_back(node);
}

SizeT PendingQueue::random_height() {
    std::bernoulli_distribution coin(0.5);
    SizeT height = 1;
    while (height < MAX_LEVEL && coin(rng_)) {
        height++;
    }
    return height;
}

UInt32 PendingQueue::node_at(SizeT position) const {
    UInt32 x = HEAD;
    SizeT pos = 0;
    for (SizeT level = MAX_LEVEL; level-- > 0;) {
        while (true) {
            const Link& link = arena_[x].links[level];
            if (link.next == NIL || pos + link.width > position) {
                break;
            }
            pos += link.width;
            x = link.next;
        }
    }
    return x;
}

const Operation& PendingQueue::at(SizeT index) const {
    if (index >= size_) {
        throw std::out_of_range("pending queue index out of range");
    }
    return arena_[node_at(index + 1)].op;
}

void PendingQueue::insert_at(SizeT index, Operation op) {
    index = std::min(index, size_);

    std::array<UInt32, MAX_LEVEL> update{};
    std::array<SizeT, MAX_LEVEL> update_pos{};

    UInt32 x = HEAD;
    SizeT pos = 0;
    for (SizeT level = MAX_LEVEL; level-- > 0;) {
        while (true) {
            const Link& link = arena_[x].links[level];
            if (link.next == NIL || pos + link.width > index) {
                break;
            }
            pos += link.width;
            x = link.next;
        }
        update[level] = x;
        update_pos[level] = pos;
    }

    const OperationId id = op.id;
    const SizeT height = random_height();
    const UInt32 node = allocate(std::move(op), height);
    const SizeT node_pos = index + 1;

    for (SizeT level = 0; level < MAX_LEVEL; ++level) {
        Link& prev = arena_[update[level]].links[level];
        if (level < height) {
            // Old target shifts one position to the right
            const SizeT target_pos = update_pos[level] + prev.width + 1;
            arena_[node].links[level] = Link{prev.next, target_pos - node_pos};
            prev.next = node;
            prev.width = node_pos - update_pos[level];
        } else {
            prev.width += 1;
        }
    }

    arena_[node].prev = update[0];
    const UInt32 next = arena_[node].links[0].next;
    if (next == NIL) {
        tail_ = node;
    } else {
        arena_[next].prev = node;
    }

    ids_.insert(id);
    size_++;
}

Operation PendingQueue::erase_at(SizeT index) {
    if (index >= size_) {
        throw std::out_of_range("pending queue index out of range");
    }

    std::array<UInt32, MAX_LEVEL> update{};

    UInt32 x = HEAD;
    SizeT pos = 0;
    for (SizeT level = MAX_LEVEL; level-- > 0;) {
        while (true) {
            const Link& link = arena_[x].links[level];
            if (link.next == NIL || pos + link.width > index) {
                break;
            }
            pos += link.width;
            x = link.next;
        }
        update[level] = x;
    }

    const UInt32 target = arena_[update[0]].links[0].next;
    const UInt32 next = arena_[target].links[0].next;
    if (next == NIL) {
        tail_ = update[0];
    } else {
        arena_[next].prev = update[0];
    }

    for (SizeT level = 0; level < MAX_LEVEL; ++level) {
        Link& prev = arena_[update[level]].links[level];
        if (prev.next == target) {
            const Link& removed = arena_[target].links[level];
            prev.width = prev.width + removed.width - 1;
            prev.next = removed.next;
        } else {
            prev.width -= 1;
        }
    }

    Operation op = std::move(arena_[target].op);
    release(target);
    ids_.erase(op.id);
    size_--;
    return op;
}

SizeT PendingQueue::causal_position(const Operation& op) const {
    // Predecessors sit ahead of successors, so the first predecessor met
    // from the tail is the last one in queue order
    std::optional<SizeT> last_before;
    std::optional<SizeT> first_after;
    std::vector<const Operation*> visited;

    for_each_reverse([&](SizeT index, const Operation& other) {
        const ClockOrdering ordering = other.vector_clock.compare(op.vector_clock);
        if (ordering == ClockOrdering::Before) {
            last_before = index;
            return false;
        }
        if (ordering == ClockOrdering::After) {
            first_after = index;
        }
        visited.push_back(&other);
        return true;
    });

    const SizeT lower = last_before ? *last_before + 1 : 0;
    const SizeT upper = first_after ? *first_after : size_;

    // visited[k] holds position size_ - 1 - k
    for (SizeT pos = lower; pos < upper; ++pos) {
        if (tie_break_less(op, *visited[size_ - 1 - pos])) {
            return pos;
        }
    }
    return upper;
}

SizeT PendingQueue::insert(Operation op) {
    const SizeT position = causal_position(op);
    insert_at(position, std::move(op));
    return position;
}

SizeT PendingQueue::prune_front(const std::function<bool(const Operation&)>& predicate) {
    SizeT removed = 0;
    while (size_ > 0 && predicate(at(0))) {
        erase_at(0);
        removed++;
    }
    return removed;
}

std::optional<SizeT> PendingQueue::index_of(const OperationId& id) const {
    if (!contains(id)) {
        return std::nullopt;
    }
    SizeT i = 0;
    for (UInt32 x = arena_[HEAD].links[0].next; x != NIL; x = arena_[x].links[0].next, ++i) {
        if (arena_[x].op.id == id) {
            return i;
        }
    }
    return std::nullopt;
}

void PendingQueue::for_each(const std::function<void(SizeT, const Operation&)>& visitor) const {
    SizeT i = 0;
    for (UInt32 x = arena_[HEAD].links[0].next; x != NIL; x = arena_[x].links[0].next, ++i) {
        visitor(i, arena_[x].op);
    }
}

void PendingQueue::for_each_reverse(const std::function<bool(SizeT, const Operation&)>& visitor) const {
    SizeT i = size_;
    for (UInt32 x = tail_; x != HEAD; x = arena_[x].prev) {
        if (!visitor(--i, arena_[x].op)) {
            return;
        }
    }
}

std::vector<Operation> PendingQueue::to_vector() const {
    std::vector<Operation> ops;
    ops.reserve(size_);
    for_each([&ops](SizeT, const Operation& op) { ops.push_back(op); });
    return ops;
}

void PendingQueue::clear() {
    arena_.resize(1);
    arena_[HEAD].links.assign(MAX_LEVEL, Link{NIL, 1});
    free_.clear();
    ids_.clear();
    tail_ = HEAD;
    size_ = 0;
}

} // namespace tessera::sync
