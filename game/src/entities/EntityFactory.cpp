#include "EntityFactory.hpp"
#include <cmath>

namespace Spacewar {

EntityHandle EntityFactory::CreateShip(const glm::vec2& pos) {
    EntityHandle entity = m_world.Create();
    auto& lazy = m_world.Lazy();
    lazy.Insert(entity, Position{pos, 0.0f});
    lazy.Insert(entity, Velocity{});
    lazy.Insert(entity, Ship{});
    MarkReplicated(entity);
    return entity;
}

EntityHandle EntityFactory::CreateAsteroid(const Position& position, const Velocity& velocity) {
    EntityHandle entity = m_world.Create();
    auto& lazy = m_world.Lazy();
    lazy.Insert(entity, position);
    lazy.Insert(entity, velocity);
    lazy.Insert(entity, Asteroid{});
    MarkReplicated(entity);
    return entity;
}

EntityHandle EntityFactory::CreateProjectile(const glm::vec2& pos, float rot,
                                             ProjectileType kind, EntityHandle shooter) {
    EntityHandle entity = m_world.Create();
    auto& lazy = m_world.Lazy();
    const float speed = ProjectileSpeed(kind);
    lazy.Insert(entity, Position{pos, rot});
    lazy.Insert(entity, Velocity{glm::vec2(speed * std::cos(rot), speed * std::sin(rot)), 0.0f});
    lazy.Insert(entity, Projectile{kind, shooter});
    MarkReplicated(entity);
    return entity;
}

void EntityFactory::MarkReplicated(EntityHandle entity) {
    if (m_networked) {
        m_world.Lazy().Insert(entity, Replicated{});
        m_world.Lazy().Insert(entity, Dirty{});
    }
}

} // namespace Spacewar
