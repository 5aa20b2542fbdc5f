#pragma once

#include "core/Game.hpp"
#include "network/NetConfig.hpp"
#include "network/ServerReplication.hpp"
#include "networking/PingClock.hpp"
#include "networking/UdpTransport.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace Spacewar {

/**
 * @brief Server statistics
 */
struct ServerStats {
    double uptime = 0.0;           // Seconds
    uint64_t totalTicks = 0;
    uint64_t clockJumps = 0;
    size_t connectedClients = 0;
    size_t activeEntities = 0;
    float avgTickTime = 0.0f;      // Milliseconds
};

/**
 * @brief Server status
 */
enum class ServerStatus {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error
};

/**
 * @brief Server manager - fixed-step driver for the authoritative game
 *
 * Owns the server Game and its replication stage, and runs Game::Tick at a
 * fixed time step against the wall clock. A forward clock jump larger than
 * MAX_CLOCK_JUMP_SECONDS only catches up a few steps; a backward jump
 * restarts the accumulator.
 */
class ServerManager {
public:
    using Replication = ServerReplication<Vigilant::UdpAddress>;

    static constexpr double MAX_CLOCK_JUMP_SECONDS = 0.5;
    static constexpr double CATCH_UP_STEPS = 5.0;
    static constexpr uint64_t STATS_INTERVAL_TICKS = 750;

    explicit ServerManager(NetConfig config = {},
                           Vigilant::WallClock clock = Vigilant::SystemWallClock());
    ~ServerManager();

    // Prevent copying
    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // =========================================================================
    // INITIALIZATION
    // =========================================================================

    /**
     * @brief Bind the UDP server on the configured port and create the game
     * @return False if the configuration is invalid or the port cannot be bound
     */
    bool Initialize();

    /**
     * @brief Create the game on top of an existing transport
     */
    bool Initialize(std::unique_ptr<Vigilant::IServer<Vigilant::UdpAddress>> transport);

    /**
     * @brief Tell connected clients the server is going away and release the game
     */
    void Shutdown();

    bool IsInitialized() const { return m_game != nullptr; }

    // =========================================================================
    // SERVER CONTROL
    // =========================================================================

    /**
     * @brief Run the fixed-step loop until Stop() is called
     */
    void Run();

    /**
     * @brief Request the loop to exit; safe to call from a signal handler
     */
    void Stop() noexcept { m_running.store(false); }

    ServerStatus GetStatus() const { return m_status.load(); }
    bool IsRunning() const { return m_status.load() == ServerStatus::Running; }

    // =========================================================================
    // UPDATE
    // =========================================================================

    /**
     * @brief Run every step due at the given wall-clock reading
     * @return Number of ticks run
     */
    int Advance(std::chrono::system_clock::time_point now);

    /**
     * @brief Time left until the next step is due, zero when under a millisecond
     */
    std::chrono::nanoseconds GetSleepDuration() const;

    /**
     * @brief Install the simulation step of the hosted game
     */
    void SetSimulation(Game::SimulationHook hook);

    // =========================================================================
    // ACCESSORS
    // =========================================================================

    ServerStats GetStats() const;
    const NetConfig& GetConfig() const { return m_config; }
    double GetAccumulator() const { return m_timer; }

    Game* GetGame() { return m_game.get(); }
    Replication* GetReplication() { return m_replication; }

private:
    void UpdateStats(float tickMilliseconds);

    NetConfig m_config;
    Vigilant::WallClock m_clock;

    std::unique_ptr<Game> m_game;
    Replication* m_replication = nullptr;  // Owned by m_game

    std::atomic<bool> m_running{false};
    std::atomic<ServerStatus> m_status{ServerStatus::Stopped};

    std::optional<std::chrono::system_clock::time_point> m_lastTime;
    std::chrono::system_clock::time_point m_startTime;
    double m_timer = 0.0;

    mutable std::mutex m_statsMutex;
    ServerStats m_stats;
    double m_totalTickTime = 0.0;
};

} // namespace Spacewar
