#include "World.hpp"

namespace Spacewar {

void LazyUpdate::Destroy(EntityHandle handle) {
    m_commands.emplace_back([handle](World& world) {
        world.Destroy(handle);
    });
}

EntityHandle World::Create() {
    return m_entities.Allocate();
}

bool World::Destroy(EntityHandle handle) {
    return m_entities.Deallocate(handle);
}

void World::MarkForDeletion(EntityHandle handle) {
    if (m_replicatedDeletion) {
        Insert(handle, Delete{});
    } else {
        Destroy(handle);
    }
}

std::optional<EntityHandle> World::FindByReplicatedId(uint64_t id) const {
    std::optional<EntityHandle> found;
    m_entities.ForEach([&](const EntityRecord& record, EntityHandle handle) {
        if (!found && record.replicated && record.replicated->id == id) {
            found = handle;
        }
    });
    return found;
}

void World::Maintain() {
    while (!m_lazy.m_commands.empty()) {
        std::vector<LazyUpdate::Command> commands;
        commands.swap(m_lazy.m_commands);
        for (auto& command : commands) {
            command(*this);
        }
    }
}

void World::Clear() {
    m_lazy.m_commands.clear();
    m_entities.Clear();
}

} // namespace Spacewar
