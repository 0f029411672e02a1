#pragma once
/**
 * @file pending_queue.h
 * @brief Causally ordered pending-operation queue
 *
 * Key features:
 * - Indexable skip list over a node arena (O(log n) positional insert/erase)
 * - Causal insertion: after every predecessor, before every successor
 * - Tie-break ordering (Lamport, user id, op id) between concurrent operations
 */

#include "tessera/sync/operation.h"
#include <functional>
#include <optional>
#include <random>
#include <unordered_set>
#include <vector>

namespace tessera::sync {

/**
 * @brief Ordered queue of operations awaiting commit
 *
 * Nodes live in a contiguous arena and link to each other by index. Every
 * forward link stores its width (number of level-0 steps it spans) so the
 * list can be addressed by position. Level 0 is also linked backwards so
 * recent entries can be visited from the tail.
 */
class PendingQueue {
public:
    static constexpr SizeT MAX_LEVEL = 16;

    /**
     * @param seed Level generator seed; fixed so layouts are reproducible
     */
    explicit PendingQueue(UInt32 seed = 0x5eed1234u);

    SizeT size() const { return size_; }
    bool empty() const { return size_ == 0; }

    bool contains(const OperationId& id) const { return ids_.count(id) > 0; }

    /**
     * @brief Operation at a queue position
     * @throws std::out_of_range when index >= size()
     */
    const Operation& at(SizeT index) const;

    /**
     * @brief Position an operation would take under causal insertion
     *
     * Vector clock order is authoritative. Among the slots between the last
     * causal predecessor and the first causal successor, the operation goes
     * before the first entry that sorts after it by tie-break key. The scan
     * walks back from the tail and stops at the last causal predecessor.
     */
    SizeT causal_position(const Operation& op) const;

    /**
     * @brief Insert at the causal position
     * @return The position the operation was inserted at
     */
    SizeT insert(Operation op);

    /**
     * @brief Insert at an explicit position (clamped to size())
     */
    void insert_at(SizeT index, Operation op);

    /**
     * @brief Remove and return the operation at a position
     * @throws std::out_of_range when index >= size()
     */
    Operation erase_at(SizeT index);

    /**
     * @brief Remove leading operations while the predicate holds
     * @return Number of operations removed
     */
    SizeT prune_front(const std::function<bool(const Operation&)>& predicate);

    std::optional<SizeT> index_of(const OperationId& id) const;

    /**
     * @brief Visit operations in queue order
     */
    void for_each(const std::function<void(SizeT, const Operation&)>& visitor) const;

    /**
     * @brief Visit operations from the tail towards the head
     *
     * Stops as soon as the visitor returns false.
     */
    void for_each_reverse(const std::function<bool(SizeT, const Operation&)>& visitor) const;

    std::vector<Operation> to_vector() const;

    void clear();

private:
    static constexpr UInt32 NIL = 0xffffffffu;
    static constexpr UInt32 HEAD = 0;

    struct Link {
        UInt32 next{NIL};
        SizeT width{1};
    };

    struct Node {
        Operation op;
        std::vector<Link> links;
        UInt32 prev{HEAD};      ///< Level-0 predecessor
    };

    UInt32 allocate(Operation op, SizeT height);
    void release(UInt32 node);
    SizeT random_height();

    /**
     * @brief Node at 1-based position (0 = head)
     */
    UInt32 node_at(SizeT position) const;

    std::vector<Node> arena_;
    std::vector<UInt32> free_;
    std::unordered_set<OperationId> ids_;
    UInt32 tail_{HEAD};
    SizeT size_{0};
    std::mt19937 rng_;
};

} // namespace tessera::sync
