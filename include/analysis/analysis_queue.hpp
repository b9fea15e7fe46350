#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace querywatch {

/**
 * @brief Unbounded lock-free Multi-Producer Single-Consumer FIFO
 *
 * Design (intrusive linked list with a stub node):
 * - Producers: allocate a node, atomic exchange on head_, then link the
 *   previous head to it. One exchange per push, never blocks.
 * - Consumer: single thread follows next pointers from tail_, moving
 *   values out and freeing the node it leaves behind.
 * - Optional max_depth: when > 0, a push that would exceed it is dropped
 *   (drop-new) and counted. 0 means unbounded.
 *
 * A producer that has exchanged head_ but not yet linked its node makes
 * the queue look momentarily shorter to the consumer; the item becomes
 * visible on the next pop.
 *
 * @tparam T Element type (must be move-constructible)
 */
template <typename T>
class AnalysisQueue {
    static_assert(std::is_move_constructible_v<T>,
                  "T must be move-constructible");

public:
    explicit AnalysisQueue(size_t max_depth = 0)
        : max_depth_(max_depth) {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }

    ~AnalysisQueue() {
        while (try_pop()) {}
        delete tail_;
    }

    // Non-copyable, non-movable (contains atomics)
    AnalysisQueue(const AnalysisQueue&) = delete;
    AnalysisQueue& operator=(const AnalysisQueue&) = delete;
    AnalysisQueue(AnalysisQueue&&) = delete;
    AnalysisQueue& operator=(AnalysisQueue&&) = delete;

    /**
     * @brief Enqueue an item (producer, thread-safe, non-blocking)
     * @return true if enqueued, false if dropped by the depth bound
     */
    bool push(T item) {
        // Allocated before reserving a slot so a throwing allocation leaves size_ intact
        auto node_owner = std::make_unique<Node>(std::move(item));

        const size_t depth = size_.fetch_add(1, std::memory_order_relaxed);
        if (max_depth_ > 0 && depth >= max_depth_) {
            size_.fetch_sub(1, std::memory_order_relaxed);
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        Node* node = node_owner.release();
        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);

        pushed_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    /**
     * @brief Dequeue one item (consumer only, NOT thread-safe)
     * @return The oldest item, or std::nullopt if none is visible
     */
    [[nodiscard]] std::optional<T> try_pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);
        if (!next) {
            return std::nullopt;
        }

        std::optional<T> result = std::move(next->value);
        next->value.reset();

        // next becomes the new stub
        tail_ = next;
        delete tail;

        size_.fetch_sub(1, std::memory_order_relaxed);
        return result;
    }

    /**
     * @brief Move up to max_count items into batch (consumer only)
     * @return Number of items appended
     */
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        while (count < max_count) {
            auto item = try_pop();
            if (!item) break;
            batch.emplace_back(std::move(*item));
            ++count;
        }
        return count;
    }

    /// Approximate number of queued items
    [[nodiscard]] size_t size() const noexcept {
        return size_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool empty() const noexcept {
        return size() == 0;
    }

    [[nodiscard]] uint64_t dropped_count() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t pushed_count() const noexcept {
        return pushed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t max_depth() const noexcept { return max_depth_; }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;

        Node() = default;
        explicit Node(T v) : value(std::move(v)) {}
    };

    const size_t max_depth_;

    // Producers contend on head_, the consumer owns tail_
    alignas(64) std::atomic<Node*> head_;
    alignas(64) Node* tail_;

    alignas(64) std::atomic<size_t> size_{0};
    std::atomic<uint64_t> pushed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace querywatch
