#pragma once

#include "core/Pool.hpp"
#include <cstdint>
#include <glm/glm.hpp>

namespace Spacewar {

/// Handle to an entity in the World; packs to (generation << 32) | index
using EntityHandle = Vigilant::SlotHandle;

// ============================================================================
// Spatial state
// ============================================================================

struct Position {
    glm::vec2 pos{0.0f, 0.0f};
    float rot = 0.0f;
};

struct Velocity {
    glm::vec2 vel{0.0f, 0.0f};
    float rot = 0.0f;
};

// ============================================================================
// Entity kinds
// ============================================================================

/**
 * @brief A controllable ship
 *
 * The want_* fields are the pilot's intent (from local input or a client
 * control update); thrust and thrustRot are the outputs the simulation
 * derives from that intent.
 */
struct Ship {
    bool wantFire = false;
    glm::vec2 wantThrust{0.0f, 0.0f};
    float wantThrustRot = 0.0f;
    glm::vec2 wantTarget{0.0f, 0.0f};
    glm::vec2 thrust{0.0f, 0.0f};
    float thrustRot = 0.0f;
    float reload = 0.0f;
    int health = 8;
};

/**
 * @brief Ballistic body drifting through the sector
 */
struct Asteroid {};

enum class ProjectileType : uint8_t {
    Plasma = 1,
    Rail = 2
};

/**
 * @brief Muzzle speed for a projectile type
 */
[[nodiscard]] constexpr float ProjectileSpeed(ProjectileType type) noexcept {
    return type == ProjectileType::Rail ? 35.0f : 60.0f;
}

struct Projectile {
    ProjectileType kind = ProjectileType::Plasma;
    EntityHandle shooter;
};

// ============================================================================
// Replication markers
// ============================================================================

/**
 * @brief Entity mirrored over the network
 *
 * An id of 0 means the server has not assigned one yet.
 */
struct Replicated {
    uint64_t id = 0;
    uint32_t lastUpdate = 0;
};

/// Server side: the entity is driven by this client's control updates
struct ClientControlled {
    uint32_t clientId = 0;
};

/// Client side: the entity is driven by local input
struct LocalControl {};

/// State changed since the last replication pass
struct Dirty {};

/// Pending deletion; the send stage announces it and destroys the entity
struct Delete {};

} // namespace Spacewar
