#pragma once

#include "World.hpp"

namespace Spacewar {

/**
 * @brief Creates the simulation's entity kinds
 *
 * All components are queued on the World's LazyUpdate and appear after the
 * next Maintain(); the returned handle is valid immediately. When networked,
 * every entity also gets Replicated (id assigned on first send) and Dirty.
 */
class EntityFactory {
public:
    EntityFactory(World& world, bool networked) : m_world(world), m_networked(networked) {}

    /**
     * @brief Ship at rest at the given position
     */
    EntityHandle CreateShip(const glm::vec2& pos = glm::vec2(0.0f));

    EntityHandle CreateAsteroid(const Position& position, const Velocity& velocity);

    /**
     * @brief Projectile leaving pos along rot at the type's muzzle speed
     */
    EntityHandle CreateProjectile(const glm::vec2& pos, float rot,
                                  ProjectileType kind, EntityHandle shooter);

    [[nodiscard]] bool IsNetworked() const noexcept { return m_networked; }

private:
    void MarkReplicated(EntityHandle entity);

    World& m_world;
    bool m_networked;
};

} // namespace Spacewar
