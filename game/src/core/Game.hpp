#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "entities/World.hpp"
#include "network/NetStage.hpp"

namespace Spacewar {

/**
 * @brief What this process is in the session
 */
enum class Role : uint8_t {
    Standalone,   ///< Local single-player game, no networking
    Server,       ///< Authoritative simulation replicated to clients
    Client        ///< Mirror of a server's simulation
};

/// Whether this role runs the canonical simulation
[[nodiscard]] constexpr bool Authoritative(Role role) noexcept {
    return role != Role::Client;
}

/// Whether this role talks to peers
[[nodiscard]] constexpr bool Networked(Role role) noexcept {
    return role != Role::Standalone;
}

[[nodiscard]] const char* RoleToString(Role role) noexcept;

/**
 * @brief Wrapping game clock
 *
 * Wraps every 1024 seconds to keep float resolution; use SecondsSince() to
 * compare two readings.
 */
class GameClock {
public:
    static constexpr double WRAP_SECONDS = 1024.0;

    void AdvanceFrame(double deltaTime) noexcept;

    [[nodiscard]] double SecondsSince(const GameClock& past) const noexcept;
    [[nodiscard]] double GetTime() const noexcept { return m_timeWrapping; }

private:
    double m_timeWrapping = 0.0;
};

/**
 * @brief Tick driver
 *
 * Owns the World and, for networked roles, the replication stage. Each
 * Tick() runs the stage's Receive(), the simulation hook, the stage's
 * Send(), then World::Maintain().
 */
class Game {
public:
    using SimulationHook = std::function<void(World&, float)>;

    /**
     * @brief Construct a game for the given role
     * @param netStage Replication stage; required for Server and Client
     * @throws std::invalid_argument if a networked role has no stage
     */
    explicit Game(Role role, std::unique_ptr<INetStage> netStage = nullptr);
    ~Game();

    // Non-copyable, non-movable (owns the world)
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;
    Game(Game&&) = delete;
    Game& operator=(Game&&) = delete;

    /**
     * @brief Single-player game with one locally-controlled ship
     */
    [[nodiscard]] static std::unique_ptr<Game> CreateStandalone();

    // =========================================================================
    // Update
    // =========================================================================

    /**
     * @brief Advance the game by one tick
     * @param deltaTime Seconds simulated by this tick
     */
    void Tick(float deltaTime);

    /**
     * @brief Install the simulation step run between receive and send
     */
    void SetSimulation(SimulationHook hook) { m_simulation = std::move(hook); }

    /**
     * @brief Log the number of entities carrying each component
     */
    void LogEntityCounts() const;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] Role GetRole() const noexcept { return m_role; }
    [[nodiscard]] World& GetWorld() noexcept { return m_world; }
    [[nodiscard]] const World& GetWorld() const noexcept { return m_world; }
    [[nodiscard]] INetStage* GetNetStage() noexcept { return m_netStage.get(); }
    [[nodiscard]] const GameClock& GetClock() const noexcept { return m_clock; }
    [[nodiscard]] uint64_t GetTickCount() const noexcept { return m_tickCount; }

private:
    Role m_role;
    World m_world;
    std::unique_ptr<INetStage> m_netStage;
    SimulationHook m_simulation;
    GameClock m_clock;
    uint64_t m_tickCount = 0;
};

} // namespace Spacewar
