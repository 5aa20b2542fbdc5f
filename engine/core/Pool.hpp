#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace Vigilant {

/**
 * @brief Index plus generation identifying one occupant of a pool slot
 *
 * A handle stays valid until its slot is freed; reusing the slot bumps the
 * generation so older handles stop resolving.
 */
struct SlotHandle {
    static constexpr uint32_t INVALID_INDEX = ~uint32_t{0};

    uint32_t index = INVALID_INDEX;
    uint32_t generation = 0;

    /**
     * @brief Pack into a single 64-bit value: (generation << 32) | index
     */
    [[nodiscard]] constexpr uint64_t Pack() const noexcept {
        return (static_cast<uint64_t>(generation) << 32) | index;
    }

    [[nodiscard]] static constexpr SlotHandle Unpack(uint64_t packed) noexcept {
        return SlotHandle{static_cast<uint32_t>(packed & 0xFFFFFFFFu),
                          static_cast<uint32_t>(packed >> 32)};
    }

    [[nodiscard]] constexpr bool IsValid() const noexcept { return index != INVALID_INDEX; }

    constexpr bool operator==(const SlotHandle&) const noexcept = default;
};

/**
 * @brief Growable object pool with generational handles
 *
 * Free slots form an intrusive singly linked list threaded through the slot
 * array, so allocation and deallocation are O(1). Generations start at 1,
 * which keeps a packed handle from ever being zero.
 *
 * @tparam T Object type to pool
 */
template<typename T>
class GenerationalPool {
public:
    using value_type = T;
    using size_type = uint32_t;
    static constexpr size_type INVALID_INDEX = SlotHandle::INVALID_INDEX;

    GenerationalPool() = default;
    explicit GenerationalPool(size_type initialCapacity) { m_slots.reserve(initialCapacity); }
    ~GenerationalPool() = default;

    // Non-copyable, movable
    GenerationalPool(const GenerationalPool&) = delete;
    GenerationalPool& operator=(const GenerationalPool&) = delete;
    GenerationalPool(GenerationalPool&&) noexcept = default;
    GenerationalPool& operator=(GenerationalPool&&) noexcept = default;

    /**
     * @brief Allocate an object from the pool
     * @param args Constructor arguments
     * @return Handle of the new occupant
     */
    template<typename... Args>
    [[nodiscard]] SlotHandle Allocate(Args&&... args);

    /**
     * @brief Return a slot to the pool
     * @return false if the handle no longer refers to a live object
     */
    bool Deallocate(SlotHandle handle);

    [[nodiscard]] T* Get(SlotHandle handle);
    [[nodiscard]] const T* Get(SlotHandle handle) const;

    [[nodiscard]] bool IsActive(SlotHandle handle) const {
        return handle.index < m_slots.size()
            && m_slots[handle.index].value.has_value()
            && m_slots[handle.index].generation == handle.generation;
    }

    [[nodiscard]] size_type GetActiveCount() const noexcept { return m_activeCount; }
    [[nodiscard]] size_type GetSlotCount() const noexcept { return static_cast<size_type>(m_slots.size()); }

    /**
     * @brief Iterate over all active objects in slot order
     */
    template<typename Func>
    void ForEach(Func&& func);

    template<typename Func>
    void ForEach(Func&& func) const;

    /**
     * @brief Destroy every object; generations keep counting up
     */
    void Clear();

private:
    struct Slot {
        std::optional<T> value;
        uint32_t generation = 1;
        size_type nextFree = INVALID_INDEX;
    };

    std::vector<Slot> m_slots;
    size_type m_freeHead = INVALID_INDEX;
    size_type m_activeCount = 0;
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename T>
template<typename... Args>
SlotHandle GenerationalPool<T>::Allocate(Args&&... args) {
    size_type index;
    if (m_freeHead != INVALID_INDEX) {
        index = m_freeHead;
        m_freeHead = m_slots[index].nextFree;
    } else {
        index = static_cast<size_type>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot& slot = m_slots[index];
    slot.value.emplace(std::forward<Args>(args)...);
    slot.nextFree = INVALID_INDEX;
    ++m_activeCount;
    return SlotHandle{index, slot.generation};
}

template<typename T>
bool GenerationalPool<T>::Deallocate(SlotHandle handle) {
    if (!IsActive(handle)) {
        return false;
    }

    Slot& slot = m_slots[handle.index];
    slot.value.reset();
    ++slot.generation;
    if (slot.generation == 0) {
        slot.generation = 1;
    }
    slot.nextFree = m_freeHead;
    m_freeHead = handle.index;
    --m_activeCount;
    return true;
}

template<typename T>
T* GenerationalPool<T>::Get(SlotHandle handle) {
    return IsActive(handle) ? &*m_slots[handle.index].value : nullptr;
}

template<typename T>
const T* GenerationalPool<T>::Get(SlotHandle handle) const {
    return IsActive(handle) ? &*m_slots[handle.index].value : nullptr;
}

template<typename T>
template<typename Func>
void GenerationalPool<T>::ForEach(Func&& func) {
    for (size_type i = 0; i < m_slots.size(); ++i) {
        if (m_slots[i].value) {
            func(*m_slots[i].value, SlotHandle{i, m_slots[i].generation});
        }
    }
}

template<typename T>
template<typename Func>
void GenerationalPool<T>::ForEach(Func&& func) const {
    for (size_type i = 0; i < m_slots.size(); ++i) {
        if (m_slots[i].value) {
            func(*m_slots[i].value, SlotHandle{i, m_slots[i].generation});
        }
    }
}

template<typename T>
void GenerationalPool<T>::Clear() {
    for (size_type i = 0; i < m_slots.size(); ++i) {
        if (m_slots[i].value) {
            Deallocate(SlotHandle{i, m_slots[i].generation});
        }
    }
}

} // namespace Vigilant
