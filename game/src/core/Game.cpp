#include "Game.hpp"
#include "entities/EntityFactory.hpp"
#include "core/Logger.hpp"
#include <stdexcept>

namespace Spacewar {

const char* RoleToString(Role role) noexcept {
    switch (role) {
        case Role::Standalone: return "standalone";
        case Role::Server:     return "server";
        case Role::Client:     return "client";
    }
    return "unknown";
}

// ============================================================================
// GameClock
// ============================================================================

void GameClock::AdvanceFrame(double deltaTime) noexcept {
    m_timeWrapping += deltaTime;
    if (m_timeWrapping > WRAP_SECONDS) {
        m_timeWrapping -= WRAP_SECONDS;
    }
}

double GameClock::SecondsSince(const GameClock& past) const noexcept {
    double d = m_timeWrapping - past.m_timeWrapping;
    return d < 0.0 ? d + WRAP_SECONDS : d;
}

// ============================================================================
// Game
// ============================================================================

Game::Game(Role role, std::unique_ptr<INetStage> netStage)
    : m_role(role)
    , m_netStage(std::move(netStage)) {
    if (Networked(m_role) && !m_netStage) {
        throw std::invalid_argument(std::string("Role ") + RoleToString(m_role) + " needs a replication stage");
    }
    m_world.SetReplicatedDeletion(Networked(m_role) && Authoritative(m_role));
    GAME_LOG_INFO("Game created as {}", RoleToString(m_role));
}

Game::~Game() = default;

std::unique_ptr<Game> Game::CreateStandalone() {
    auto game = std::make_unique<Game>(Role::Standalone);
    World& world = game->GetWorld();

    EntityFactory factory(world, false);
    EntityHandle ship = factory.CreateShip();
    world.Lazy().Insert(ship, LocalControl{});
    world.Maintain();

    return game;
}

void Game::Tick(float deltaTime) {
    m_clock.AdvanceFrame(deltaTime);

    if (m_netStage) {
        m_netStage->Receive(m_world);
    }

    if (m_simulation) {
        m_simulation(m_world, deltaTime);
    }

    if (m_netStage) {
        m_netStage->Send(m_world);
    }

    m_world.Maintain();
    ++m_tickCount;
}

void Game::LogEntityCounts() const {
    size_t ships = 0, asteroids = 0, projectiles = 0, replicated = 0, controlled = 0, local = 0;
    m_world.ForEach([&](const EntityRecord& record, EntityHandle) {
        if (record.ship) ++ships;
        if (record.asteroid) ++asteroids;
        if (record.projectile) ++projectiles;
        if (record.replicated) ++replicated;
        if (record.clientControlled) ++controlled;
        if (record.localControl) ++local;
    });

    GAME_LOG_INFO("Entities: {} total, {} ships, {} asteroids, {} projectiles, "
                  "{} replicated, {} client-controlled, {} local",
        m_world.GetEntityCount(), ships, asteroids, projectiles, replicated, controlled, local);
}

} // namespace Spacewar
