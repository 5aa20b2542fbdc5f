#pragma once

#include "entities/World.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace Spacewar {

// ============================================================================
// Entity state blobs (server -> client)
// ============================================================================

/**
 * @brief Discriminant carried in the first byte of every state blob
 */
enum class EntityKind : uint8_t {
    Ship = 1,
    Asteroid = 2,
    Projectile = 3
};

/// Blob sizes including the kind byte
inline constexpr size_t SHIP_STATE_SIZE = 58;
inline constexpr size_t ASTEROID_STATE_SIZE = 25;
inline constexpr size_t PROJECTILE_STATE_SIZE = 26;

/// Ship intent-flags byte
inline constexpr uint8_t SHIP_FLAG_WANT_FIRE = 0x01;

// ============================================================================
// Control blobs (client -> server)
// ============================================================================

inline constexpr uint8_t CONTROL_FIRE = 0x01;
inline constexpr uint8_t CONTROL_THRUST_POS_X = 0x02;
inline constexpr uint8_t CONTROL_THRUST_NEG_X = 0x04;
inline constexpr uint8_t CONTROL_THRUST_POS_Y = 0x08;
inline constexpr uint8_t CONTROL_ROTATE_POS = 0x10;
inline constexpr uint8_t CONTROL_ROTATE_NEG = 0x20;

/**
 * @brief Errors from encoding, decoding or applying entity blobs
 */
enum class EntityCodecError {
    UnknownEntityKind,   ///< No recognised kind byte, or entity matches no kind
    BadLength,           ///< Blob size does not match its kind
    BadProjectileType,   ///< Projectile type byte is neither Plasma nor Rail
    KindMismatch         ///< Blob kind differs from the local entity's kind
};

[[nodiscard]] const char* EntityCodecErrorToString(EntityCodecError error) noexcept;

/**
 * @brief Fully decoded state blob
 */
struct EntityState {
    EntityKind kind = EntityKind::Asteroid;
    Position position;
    Velocity velocity;
    Ship ship;                                          ///< Meaningful for EntityKind::Ship
    ProjectileType projectileType = ProjectileType::Plasma;  ///< Meaningful for EntityKind::Projectile
};

/**
 * @brief Kind of an entity record, judged by its components
 */
[[nodiscard]] std::optional<EntityKind> KindOf(const EntityRecord& record) noexcept;

/**
 * @brief Serialize an entity's replicated state
 *
 * Fails with UnknownEntityKind when the record is not a ship, asteroid or
 * projectile, or lacks position and velocity.
 */
[[nodiscard]] std::expected<std::vector<uint8_t>, EntityCodecError>
EncodeEntityState(const EntityRecord& record);

[[nodiscard]] std::expected<EntityState, EntityCodecError>
DecodeEntityState(std::span<const uint8_t> data);

/**
 * @brief Overwrite a local entity with a state blob
 *
 * The blob's kind must match the record's kind. With preserveIntent set,
 * a ship's want_* fields are left alone so server echoes do not fight
 * local input.
 */
[[nodiscard]] std::expected<void, EntityCodecError>
ApplyEntityState(EntityRecord& record, std::span<const uint8_t> data, bool preserveIntent);

/**
 * @brief Pack a ship's control intent into the 9-byte control blob
 */
[[nodiscard]] std::vector<uint8_t> EncodeControl(const Ship& ship);

/**
 * @brief Unpack a control blob into a ship's intent fields
 */
[[nodiscard]] std::expected<void, EntityCodecError>
ApplyControl(Ship& ship, std::span<const uint8_t> data);

} // namespace Spacewar
