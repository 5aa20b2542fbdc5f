#pragma once

#include "NetStage.hpp"
#include "EntityCodec.hpp"
#include "networking/Transport.hpp"
#include "networking/PingClock.hpp"
#include <chrono>
#include <memory>
#include <unordered_set>
#include <vector>

namespace Spacewar {

/**
 * @brief Replication for the client role
 *
 * Sends ClientHello on construction. Receive() drains the transport and
 * mirrors the server's entities into the local World: updates for known
 * replicated ids are applied in place, unknown ids create new entities and
 * deletions destroy them. A control grant for an entity that is already
 * mirrored hands that entity to local control. Send() reports the control
 * intent of every dirty, locally controlled ship and clears all Dirty markers.
 */
class ClientReplication final : public INetStage {
public:
    explicit ClientReplication(std::unique_ptr<Vigilant::IClient> transport,
                               Vigilant::WallClock clock = Vigilant::SystemWallClock());
    ~ClientReplication() override = default;

    ClientReplication(const ClientReplication&) = delete;
    ClientReplication& operator=(const ClientReplication&) = delete;

    void Receive(World& world) override;
    void Send(World& world) override;

    /**
     * @brief Tell the server this client is leaving
     */
    void Disconnect();

    [[nodiscard]] bool IsConnected() const noexcept { return m_connected; }
    [[nodiscard]] bool IsControlled(uint64_t id) const { return m_controlledEntities.contains(id); }
    [[nodiscard]] const std::unordered_set<uint64_t>& GetControlledEntities() const noexcept {
        return m_controlledEntities;
    }
    [[nodiscard]] const Vigilant::PingEstimator& GetPing() const noexcept { return m_ping; }
    [[nodiscard]] std::chrono::system_clock::time_point GetLastPong() const noexcept { return m_lastPong; }
    [[nodiscard]] Vigilant::IClient& GetTransport() noexcept { return *m_transport; }

private:
    struct QueuedMessage {
        Vigilant::Message message;
        bool handled = false;
    };

    void DrainTransport(std::vector<QueuedMessage>& queued);
    void AttachGrantedControl(World& world);
    void ApplyToExisting(World& world, std::vector<QueuedMessage>& queued);
    void CreateFromUnhandled(World& world, std::vector<QueuedMessage>& queued);

    void SendToServer(const Vigilant::Message& message);

    std::unique_ptr<Vigilant::IClient> m_transport;
    Vigilant::WallClock m_clock;

    std::unordered_set<uint64_t> m_controlledEntities;
    Vigilant::PingEstimator m_ping;
    std::chrono::system_clock::time_point m_lastPong;
    bool m_connected = false;
    bool m_grantsPending = false;  // New grants not yet matched against existing entities
};

} // namespace Spacewar
