#pragma once

#include "Components.hpp"
#include "core/Pool.hpp"
#include <functional>
#include <optional>
#include <type_traits>
#include <vector>

namespace Spacewar {

/**
 * @brief Per-entity component storage
 *
 * The component set is fixed; each component is present or absent.
 */
struct EntityRecord {
    std::optional<Position> position;
    std::optional<Velocity> velocity;
    std::optional<Ship> ship;
    std::optional<Asteroid> asteroid;
    std::optional<Projectile> projectile;
    std::optional<Replicated> replicated;
    std::optional<ClientControlled> clientControlled;
    std::optional<LocalControl> localControl;
    std::optional<Dirty> dirty;
    std::optional<Delete> pendingDelete;

    template<typename C>
    [[nodiscard]] std::optional<C>& Slot() noexcept;

    template<typename C>
    [[nodiscard]] const std::optional<C>& Slot() const noexcept {
        return const_cast<EntityRecord*>(this)->Slot<C>();
    }
};

template<typename C>
std::optional<C>& EntityRecord::Slot() noexcept {
    if constexpr (std::is_same_v<C, Position>) return position;
    else if constexpr (std::is_same_v<C, Velocity>) return velocity;
    else if constexpr (std::is_same_v<C, Ship>) return ship;
    else if constexpr (std::is_same_v<C, Asteroid>) return asteroid;
    else if constexpr (std::is_same_v<C, Projectile>) return projectile;
    else if constexpr (std::is_same_v<C, Replicated>) return replicated;
    else if constexpr (std::is_same_v<C, ClientControlled>) return clientControlled;
    else if constexpr (std::is_same_v<C, LocalControl>) return localControl;
    else if constexpr (std::is_same_v<C, Dirty>) return dirty;
    else if constexpr (std::is_same_v<C, Delete>) return pendingDelete;
    else static_assert(!sizeof(C), "Not a World component");
}

class World;

/**
 * @brief Deferred mutation buffer
 *
 * Commands are applied in submission order by World::Maintain(). Commands
 * whose target handle has died by then are skipped.
 */
class LazyUpdate {
public:
    using Command = std::function<void(World&)>;

    template<typename C>
    void Insert(EntityHandle handle, C component);

    template<typename C>
    void Remove(EntityHandle handle);

    void Destroy(EntityHandle handle);

    [[nodiscard]] bool IsEmpty() const noexcept { return m_commands.empty(); }
    [[nodiscard]] size_t GetPendingCount() const noexcept { return m_commands.size(); }

private:
    friend class World;

    std::vector<Command> m_commands;
};

/**
 * @brief Entity store with generational handles
 *
 * Handles are reserved immediately by Create(); components normally arrive
 * through the LazyUpdate buffer so systems never change the store's shape
 * while iterating it. Create() must not be called from inside ForEach().
 */
class World {
public:
    World() = default;
    ~World() = default;

    // Non-copyable, non-movable
    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = delete;
    World& operator=(World&&) = delete;

    // =========================================================================
    // Entity Lifecycle
    // =========================================================================

    /**
     * @brief Reserve a new, component-less entity
     */
    [[nodiscard]] EntityHandle Create();

    /**
     * @brief Destroy an entity immediately
     * @return false if the handle was already dead
     */
    bool Destroy(EntityHandle handle);

    [[nodiscard]] bool IsAlive(EntityHandle handle) const { return m_entities.IsActive(handle); }

    /**
     * @brief Remove an entity on behalf of the simulation
     *
     * With replicated deletion enabled (networked authoritative role) the
     * entity is flagged with Delete so the send stage can announce it;
     * otherwise it is destroyed at once.
     */
    void MarkForDeletion(EntityHandle handle);

    void SetReplicatedDeletion(bool enabled) noexcept { m_replicatedDeletion = enabled; }
    [[nodiscard]] bool GetReplicatedDeletion() const noexcept { return m_replicatedDeletion; }

    // =========================================================================
    // Component Access
    // =========================================================================

    template<typename C>
    [[nodiscard]] C* Get(EntityHandle handle);

    template<typename C>
    [[nodiscard]] const C* Get(EntityHandle handle) const;

    template<typename C>
    [[nodiscard]] bool Has(EntityHandle handle) const { return Get<C>(handle) != nullptr; }

    /**
     * @brief Insert or replace a component immediately
     * @return false if the handle is dead
     */
    template<typename C>
    bool Insert(EntityHandle handle, C component);

    template<typename C>
    bool Remove(EntityHandle handle);

    /**
     * @brief Remove one component type from every entity
     */
    template<typename C>
    void ClearComponent();

    [[nodiscard]] EntityRecord* GetRecord(EntityHandle handle) { return m_entities.Get(handle); }
    [[nodiscard]] const EntityRecord* GetRecord(EntityHandle handle) const { return m_entities.Get(handle); }

    // =========================================================================
    // Iteration and Queries
    // =========================================================================

    /**
     * @brief Visit every live entity as (EntityRecord&, EntityHandle)
     */
    template<typename Func>
    void ForEach(Func&& func) { m_entities.ForEach(std::forward<Func>(func)); }

    template<typename Func>
    void ForEach(Func&& func) const { m_entities.ForEach(std::forward<Func>(func)); }

    /**
     * @brief Find the live entity carrying this replicated id
     */
    [[nodiscard]] std::optional<EntityHandle> FindByReplicatedId(uint64_t id) const;

    [[nodiscard]] size_t GetEntityCount() const noexcept { return m_entities.GetActiveCount(); }

    // =========================================================================
    // Deferred Mutation
    // =========================================================================

    [[nodiscard]] LazyUpdate& Lazy() noexcept { return m_lazy; }

    /**
     * @brief Apply all queued LazyUpdate commands in order
     *
     * Commands queued while applying are applied in the same call.
     */
    void Maintain();

    /**
     * @brief Destroy every entity and drop queued commands
     */
    void Clear();

private:
    Vigilant::GenerationalPool<EntityRecord> m_entities;
    LazyUpdate m_lazy;
    bool m_replicatedDeletion = false;
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename C>
void LazyUpdate::Insert(EntityHandle handle, C component) {
    m_commands.emplace_back([handle, component = std::move(component)](World& world) {
        world.Insert<C>(handle, component);
    });
}

template<typename C>
void LazyUpdate::Remove(EntityHandle handle) {
    m_commands.emplace_back([handle](World& world) {
        world.Remove<C>(handle);
    });
}

template<typename C>
C* World::Get(EntityHandle handle) {
    auto* record = m_entities.Get(handle);
    if (!record) {
        return nullptr;
    }
    auto& slot = record->Slot<C>();
    return slot ? &*slot : nullptr;
}

template<typename C>
const C* World::Get(EntityHandle handle) const {
    const auto* record = m_entities.Get(handle);
    if (!record) {
        return nullptr;
    }
    const auto& slot = record->Slot<C>();
    return slot ? &*slot : nullptr;
}

template<typename C>
bool World::Insert(EntityHandle handle, C component) {
    auto* record = m_entities.Get(handle);
    if (!record) {
        return false;
    }
    record->Slot<C>() = std::move(component);
    return true;
}

template<typename C>
bool World::Remove(EntityHandle handle) {
    auto* record = m_entities.Get(handle);
    if (!record || !record->Slot<C>()) {
        return false;
    }
    record->Slot<C>().reset();
    return true;
}

template<typename C>
void World::ClearComponent() {
    m_entities.ForEach([](EntityRecord& record, EntityHandle) {
        record.Slot<C>().reset();
    });
}

} // namespace Spacewar
