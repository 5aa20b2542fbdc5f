#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

namespace Vigilant {

/**
 * @brief Bounded single-producer / single-consumer ring buffer
 *
 * Exactly one thread may call TryPush and exactly one thread may call
 * TryPop. The producer publishes with a release store on the tail and the
 * consumer with a release store on the head, so an element is fully
 * constructed before the other side can observe it.
 *
 * @tparam T Element type (must be default constructible and movable)
 */
template<typename T>
class SpscQueue {
public:
    /**
     * @param capacity Maximum number of queued elements (at least 1)
     */
    explicit SpscQueue(size_t capacity)
        : m_capacity(capacity < 1 ? 2 : capacity + 1)
        , m_buffer(std::make_unique<T[]>(m_capacity)) {}

    ~SpscQueue() = default;

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;
    SpscQueue(SpscQueue&&) = delete;
    SpscQueue& operator=(SpscQueue&&) = delete;

    /**
     * @brief Producer side: enqueue a value
     * @return false if the queue is full (value is left untouched)
     */
    [[nodiscard]] bool TryPush(T&& value);
    [[nodiscard]] bool TryPush(const T& value) {
        T copy(value);
        return TryPush(std::move(copy));
    }

    /**
     * @brief Consumer side: dequeue the oldest value
     */
    [[nodiscard]] std::optional<T> TryPop();

    [[nodiscard]] bool IsEmpty() const noexcept {
        return m_head.load(std::memory_order_acquire) == m_tail.load(std::memory_order_acquire);
    }

    /**
     * @brief Approximate number of queued elements
     */
    [[nodiscard]] size_t Size() const noexcept {
        size_t head = m_head.load(std::memory_order_acquire);
        size_t tail = m_tail.load(std::memory_order_acquire);
        return tail >= head ? tail - head : m_capacity - head + tail;
    }

    [[nodiscard]] size_t Capacity() const noexcept { return m_capacity - 1; }

private:
    [[nodiscard]] size_t Next(size_t index) const noexcept {
        return index + 1 == m_capacity ? 0 : index + 1;
    }

    const size_t m_capacity;
    std::unique_ptr<T[]> m_buffer;
    alignas(64) std::atomic<size_t> m_head{0};  // consumer owned
    alignas(64) std::atomic<size_t> m_tail{0};  // producer owned
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename T>
bool SpscQueue<T>::TryPush(T&& value) {
    const size_t tail = m_tail.load(std::memory_order_relaxed);
    const size_t next = Next(tail);
    if (next == m_head.load(std::memory_order_acquire)) {
        return false;
    }
    m_buffer[tail] = std::move(value);
    m_tail.store(next, std::memory_order_release);
    return true;
}

template<typename T>
std::optional<T> SpscQueue<T>::TryPop() {
    const size_t head = m_head.load(std::memory_order_relaxed);
    if (head == m_tail.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    std::optional<T> value(std::move(m_buffer[head]));
    m_buffer[head] = T{};
    m_head.store(Next(head), std::memory_order_release);
    return value;
}

} // namespace Vigilant
