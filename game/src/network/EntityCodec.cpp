#include "EntityCodec.hpp"
#include "networking/ByteOrder.hpp"
#include "networking/Message.hpp"

namespace Spacewar {

using Vigilant::ByteReader;
using Vigilant::ByteWriter;

namespace {

void WriteMotion(ByteWriter& writer, const Position& pos, const Velocity& vel) {
    writer.WriteF32(pos.pos.x);
    writer.WriteF32(pos.pos.y);
    writer.WriteF32(pos.rot);
    writer.WriteF32(vel.vel.x);
    writer.WriteF32(vel.vel.y);
    writer.WriteF32(vel.rot);
}

// Callers have validated the length, so the reads cannot underflow
void ReadMotion(ByteReader& reader, Position& pos, Velocity& vel) {
    pos.pos.x = *reader.ReadF32();
    pos.pos.y = *reader.ReadF32();
    pos.rot = *reader.ReadF32();
    vel.vel.x = *reader.ReadF32();
    vel.vel.y = *reader.ReadF32();
    vel.rot = *reader.ReadF32();
}

size_t ExpectedSize(EntityKind kind) {
    switch (kind) {
        case EntityKind::Ship:       return SHIP_STATE_SIZE;
        case EntityKind::Asteroid:   return ASTEROID_STATE_SIZE;
        case EntityKind::Projectile: return PROJECTILE_STATE_SIZE;
    }
    return 0;
}

} // anonymous namespace

const char* EntityCodecErrorToString(EntityCodecError error) noexcept {
    switch (error) {
        case EntityCodecError::UnknownEntityKind: return "unknown entity kind";
        case EntityCodecError::BadLength:         return "bad blob length";
        case EntityCodecError::BadProjectileType: return "bad projectile type";
        case EntityCodecError::KindMismatch:      return "entity kind mismatch";
    }
    return "unknown error";
}

std::optional<EntityKind> KindOf(const EntityRecord& record) noexcept {
    if (record.ship) return EntityKind::Ship;
    if (record.asteroid) return EntityKind::Asteroid;
    if (record.projectile) return EntityKind::Projectile;
    return std::nullopt;
}

std::expected<std::vector<uint8_t>, EntityCodecError>
EncodeEntityState(const EntityRecord& record) {
    auto kind = KindOf(record);
    if (!kind || !record.position || !record.velocity) {
        return std::unexpected(EntityCodecError::UnknownEntityKind);
    }

    std::vector<uint8_t> data;
    data.reserve(ExpectedSize(*kind));
    ByteWriter writer(data);
    writer.WriteU8(static_cast<uint8_t>(*kind));
    WriteMotion(writer, *record.position, *record.velocity);

    switch (*kind) {
        case EntityKind::Ship: {
            const Ship& ship = *record.ship;
            writer.WriteF32(ship.wantThrust.x);
            writer.WriteF32(ship.wantThrust.y);
            writer.WriteF32(ship.wantThrustRot);
            writer.WriteF32(ship.wantTarget.x);
            writer.WriteF32(ship.wantTarget.y);
            writer.WriteF32(ship.thrust.x);
            writer.WriteF32(ship.thrust.y);
            writer.WriteF32(ship.thrustRot);
            writer.WriteU8(ship.wantFire ? SHIP_FLAG_WANT_FIRE : 0);
            break;
        }
        case EntityKind::Asteroid:
            break;
        case EntityKind::Projectile:
            writer.WriteU8(static_cast<uint8_t>(record.projectile->kind));
            break;
    }

    return data;
}

std::expected<EntityState, EntityCodecError>
DecodeEntityState(std::span<const uint8_t> data) {
    if (data.empty()) {
        return std::unexpected(EntityCodecError::BadLength);
    }

    EntityState state;
    switch (data[0]) {
        case static_cast<uint8_t>(EntityKind::Ship):       state.kind = EntityKind::Ship; break;
        case static_cast<uint8_t>(EntityKind::Asteroid):   state.kind = EntityKind::Asteroid; break;
        case static_cast<uint8_t>(EntityKind::Projectile): state.kind = EntityKind::Projectile; break;
        default:
            return std::unexpected(EntityCodecError::UnknownEntityKind);
    }

    if (data.size() != ExpectedSize(state.kind)) {
        return std::unexpected(EntityCodecError::BadLength);
    }

    ByteReader reader(data.subspan(1));
    ReadMotion(reader, state.position, state.velocity);

    if (state.kind == EntityKind::Ship) {
        Ship& ship = state.ship;
        ship.wantThrust.x = *reader.ReadF32();
        ship.wantThrust.y = *reader.ReadF32();
        ship.wantThrustRot = *reader.ReadF32();
        ship.wantTarget.x = *reader.ReadF32();
        ship.wantTarget.y = *reader.ReadF32();
        ship.thrust.x = *reader.ReadF32();
        ship.thrust.y = *reader.ReadF32();
        ship.thrustRot = *reader.ReadF32();
        ship.wantFire = (*reader.ReadU8() & SHIP_FLAG_WANT_FIRE) != 0;
    } else if (state.kind == EntityKind::Projectile) {
        switch (*reader.ReadU8()) {
            case static_cast<uint8_t>(ProjectileType::Plasma): state.projectileType = ProjectileType::Plasma; break;
            case static_cast<uint8_t>(ProjectileType::Rail):   state.projectileType = ProjectileType::Rail; break;
            default:
                return std::unexpected(EntityCodecError::BadProjectileType);
        }
    }

    return state;
}

std::expected<void, EntityCodecError>
ApplyEntityState(EntityRecord& record, std::span<const uint8_t> data, bool preserveIntent) {
    auto state = DecodeEntityState(data);
    if (!state) {
        return std::unexpected(state.error());
    }

    auto kind = KindOf(record);
    if (!kind) {
        return std::unexpected(EntityCodecError::UnknownEntityKind);
    }
    if (*kind != state->kind) {
        return std::unexpected(EntityCodecError::KindMismatch);
    }

    record.position = state->position;
    record.velocity = state->velocity;

    switch (state->kind) {
        case EntityKind::Ship: {
            Ship& ship = *record.ship;
            if (!preserveIntent) {
                ship.wantFire = state->ship.wantFire;
                ship.wantThrust = state->ship.wantThrust;
                ship.wantThrustRot = state->ship.wantThrustRot;
                ship.wantTarget = state->ship.wantTarget;
            }
            ship.thrust = state->ship.thrust;
            ship.thrustRot = state->ship.thrustRot;
            break;
        }
        case EntityKind::Asteroid:
            break;
        case EntityKind::Projectile:
            record.projectile->kind = state->projectileType;
            break;
    }
    return {};
}

std::vector<uint8_t> EncodeControl(const Ship& ship) {
    uint8_t flags = 0;
    if (ship.wantFire) {
        flags |= CONTROL_FIRE;
    }
    if (ship.wantThrust.x > 0.5f) {
        flags |= CONTROL_THRUST_POS_X;
    } else if (ship.wantThrust.x < -0.5f) {
        flags |= CONTROL_THRUST_NEG_X;
    }
    if (ship.wantThrust.y > 0.5f) {
        flags |= CONTROL_THRUST_POS_Y;
    }
    if (ship.wantThrustRot > 0.5f) {
        flags |= CONTROL_ROTATE_POS;
    } else if (ship.wantThrustRot < -0.5f) {
        flags |= CONTROL_ROTATE_NEG;
    }

    std::vector<uint8_t> data;
    data.reserve(Vigilant::CONTROL_BLOB_SIZE);
    ByteWriter writer(data);
    writer.WriteU8(flags);
    writer.WriteF32(ship.wantTarget.x);
    writer.WriteF32(ship.wantTarget.y);
    return data;
}

std::expected<void, EntityCodecError>
ApplyControl(Ship& ship, std::span<const uint8_t> data) {
    if (data.size() != Vigilant::CONTROL_BLOB_SIZE) {
        return std::unexpected(EntityCodecError::BadLength);
    }

    const uint8_t flags = data[0];
    ship.wantFire = (flags & CONTROL_FIRE) != 0;
    switch (flags & (CONTROL_THRUST_POS_X | CONTROL_THRUST_NEG_X)) {
        case CONTROL_THRUST_POS_X: ship.wantThrust.x = 1.0f; break;
        case CONTROL_THRUST_NEG_X: ship.wantThrust.x = -1.0f; break;
        default:                   ship.wantThrust.x = 0.0f; break;
    }
    ship.wantThrust.y = (flags & CONTROL_THRUST_POS_Y) != 0 ? 1.0f : 0.0f;
    switch (flags & (CONTROL_ROTATE_POS | CONTROL_ROTATE_NEG)) {
        case CONTROL_ROTATE_POS: ship.wantThrustRot = 1.0f; break;
        case CONTROL_ROTATE_NEG: ship.wantThrustRot = -1.0f; break;
        default:                 ship.wantThrustRot = 0.0f; break;
    }

    ByteReader reader(data.subspan(1));
    ship.wantTarget.x = *reader.ReadF32();
    ship.wantTarget.y = *reader.ReadF32();
    return {};
}

} // namespace Spacewar
