#include "ServerManager.hpp"
#include "core/Logger.hpp"
#include <system_error>
#include <thread>

namespace Spacewar {

using namespace Vigilant;

ServerManager::ServerManager(NetConfig config, WallClock clock)
    : m_config(std::move(config))
    , m_clock(std::move(clock))
    , m_startTime(m_clock()) {
}

ServerManager::~ServerManager() {
    Shutdown();
}

bool ServerManager::Initialize() {
    std::unique_ptr<UdpServer> server;
    try {
        server = std::make_unique<UdpServer>(m_config.port);
    } catch (const std::system_error& e) {
        GAME_LOG_CRITICAL("Cannot listen on port {}: {}", m_config.port, e.what());
        m_status = ServerStatus::Error;
        return false;
    }

    GAME_LOG_INFO("Listening on 0.0.0.0:{}", server->GetLocalPort());
    return Initialize(std::move(server));
}

bool ServerManager::Initialize(std::unique_ptr<IServer<UdpAddress>> transport) {
    if (m_game) {
        GAME_LOG_ERROR("Server already initialized");
        return false;
    }

    std::string errorMessage;
    if (!m_config.Validate(errorMessage)) {
        GAME_LOG_ERROR("Invalid configuration: {}", errorMessage);
        m_status = ServerStatus::Error;
        return false;
    }

    auto replication = std::make_unique<Replication>(std::move(transport), m_config, m_clock);
    m_replication = replication.get();
    m_game = std::make_unique<Game>(Role::Server, std::move(replication));

    m_lastTime.reset();
    m_timer = 0.0;
    m_startTime = m_clock();
    m_status = ServerStatus::Stopped;

    GAME_LOG_INFO("Server initialized (step {:.3f}s, staleness {} ticks)",
        m_config.timeStep, m_config.stalenessTicks);
    return true;
}

void ServerManager::Shutdown() {
    if (!m_game) return;

    Stop();

    for (const auto& [address, client] : m_replication->GetClients()) {
        auto sent = m_replication->GetTransport().Send(Msg::Disconnection{}, address);
        if (!sent && !sent.error().IsNoMore()) {
            GAME_LOG_WARN("Could not notify client {}: {}", client.clientId, sent.error().message);
        }
    }

    m_replication = nullptr;
    m_game.reset();
    m_status = ServerStatus::Stopped;
    GAME_LOG_INFO("Server shut down");
}

void ServerManager::Run() {
    if (!m_game) {
        GAME_LOG_ERROR("Server not initialized");
        return;
    }

    m_status = ServerStatus::Starting;
    m_running = true;
    m_lastTime.reset();
    m_status = ServerStatus::Running;
    GAME_LOG_INFO("Server running");

    while (m_running.load()) {
        Advance(m_clock());

        auto sleep = GetSleepDuration();
        if (sleep > std::chrono::nanoseconds::zero()) {
            std::this_thread::sleep_for(sleep);
        }
    }

    m_status = ServerStatus::Stopping;
    GAME_LOG_INFO("Server stopping after {} ticks", m_game->GetTickCount());
    m_status = ServerStatus::Stopped;
}

int ServerManager::Advance(std::chrono::system_clock::time_point now) {
    if (!m_game) return 0;

    if (!m_lastTime) {
        m_lastTime = now;
    }

    const auto delta = now - *m_lastTime;
    m_lastTime = now;

    if (delta < std::chrono::system_clock::duration::zero()) {
        GAME_LOG_WARN("System clock went backwards by {:.3f}s",
            std::chrono::duration<double>(-delta).count());
        m_timer = 0.0;
        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_stats.clockJumps++;
    } else {
        const double seconds = std::chrono::duration<double>(delta).count();
        if (seconds > MAX_CLOCK_JUMP_SECONDS) {
            GAME_LOG_WARN("System clock jumped forward by {:.3f}s", seconds);
            m_timer = CATCH_UP_STEPS * m_config.timeStep;
            std::lock_guard<std::mutex> lock(m_statsMutex);
            m_stats.clockJumps++;
        } else {
            m_timer += seconds;
        }
    }

    int ticks = 0;
    while (m_timer > m_config.timeStep) {
        auto tickStart = std::chrono::steady_clock::now();
        m_game->Tick(static_cast<float>(m_config.timeStep));
        auto tickEnd = std::chrono::steady_clock::now();

        m_timer -= m_config.timeStep;
        ++ticks;
        UpdateStats(std::chrono::duration<float, std::milli>(tickEnd - tickStart).count());

        if (m_game->GetTickCount() % STATS_INTERVAL_TICKS == 0) {
            m_game->LogEntityCounts();
        }
    }
    return ticks;
}

std::chrono::nanoseconds ServerManager::GetSleepDuration() const {
    const double remaining = m_config.timeStep - m_timer;
    if (remaining > 0.001) {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(remaining));
    }
    return std::chrono::nanoseconds::zero();
}

void ServerManager::SetSimulation(Game::SimulationHook hook) {
    if (m_game) {
        m_game->SetSimulation(std::move(hook));
    }
}

ServerStats ServerManager::GetStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

void ServerManager::UpdateStats(float tickMilliseconds) {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_totalTickTime += tickMilliseconds;
    m_stats.totalTicks++;
    m_stats.avgTickTime = static_cast<float>(m_totalTickTime / static_cast<double>(m_stats.totalTicks));
    m_stats.uptime = std::chrono::duration<double>(m_clock() - m_startTime).count();
    m_stats.connectedClients = m_replication ? m_replication->GetClients().size() : 0;
    m_stats.activeEntities = m_game ? m_game->GetWorld().GetEntityCount() : 0;
}

} // namespace Spacewar
