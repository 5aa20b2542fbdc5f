#pragma once

#include "NetStage.hpp"
#include "NetConfig.hpp"
#include "EntityCodec.hpp"
#include "entities/EntityFactory.hpp"
#include "networking/Transport.hpp"
#include "networking/PingClock.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Spacewar {

/**
 * @brief Connection state as seen by the server
 */
enum class ConnectionState : uint8_t {
    Connected,
    Disconnected
};

/**
 * @brief Server-side record of one connected client
 */
template<typename Address>
struct ConnectedClient {
    Address address{};
    uint32_t clientId = 0;
    Vigilant::PingEstimator ping;
    std::chrono::system_clock::time_point lastPong;
    std::chrono::system_clock::time_point lastSeen;
    ConnectionState state = ConnectionState::Connected;
};

/**
 * @brief Authoritative replication for the server role
 *
 * Receive() drains the transport: it admits clients, answers pings, and
 * applies control updates from the client that owns the targeted ship.
 * Send() broadcasts state for dirty or stale replicated entities, announces
 * pending deletions and clears every Dirty marker.
 *
 * @tparam Address Transport address type
 */
template<typename Address>
class ServerReplication final : public INetStage {
public:
    using Transport = Vigilant::IServer<Address>;
    using Client = ConnectedClient<Address>;
    using ClientMap = std::unordered_map<Address, Client>;

    explicit ServerReplication(std::unique_ptr<Transport> transport,
                               NetConfig config = {},
                               Vigilant::WallClock clock = Vigilant::SystemWallClock());
    ~ServerReplication() override = default;

    ServerReplication(const ServerReplication&) = delete;
    ServerReplication& operator=(const ServerReplication&) = delete;

    void Receive(World& world) override;
    void Send(World& world) override;

    /**
     * @brief Drop a client and queue every entity it controlled for deletion
     * @return false if the address is not connected
     */
    bool DisconnectClient(World& world, const Address& address);

    [[nodiscard]] const ClientMap& GetClients() const noexcept { return m_clients; }
    [[nodiscard]] const Client* FindClient(const Address& address) const;
    [[nodiscard]] uint32_t GetFrame() const noexcept { return m_frame; }
    [[nodiscard]] uint32_t GetNextClientId() const noexcept { return m_nextClientId; }
    [[nodiscard]] Transport& GetTransport() noexcept { return *m_transport; }
    [[nodiscard]] const NetConfig& GetConfig() const noexcept { return m_config; }

private:
    void HandleMessage(World& world, Vigilant::Message& message, const Address& source);
    void HandleClientHello(World& world, const Address& source);
    void HandlePong(uint32_t payload, const Address& source);
    void HandleControlUpdate(World& world, const Vigilant::Msg::EntityUpdate& update, const Address& source);

    void EvictSilentClients(World& world);
    void SendPeriodicPings();

    void SendTo(const Vigilant::Message& message, const Address& address);
    void Broadcast(const Vigilant::Message& message);

    std::unique_ptr<Transport> m_transport;
    NetConfig m_config;
    Vigilant::WallClock m_clock;

    ClientMap m_clients;
    uint32_t m_nextClientId = 1;
    uint32_t m_frame = 0;
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename Address>
ServerReplication<Address>::ServerReplication(std::unique_ptr<Transport> transport,
                                              NetConfig config,
                                              Vigilant::WallClock clock)
    : m_transport(std::move(transport))
    , m_config(std::move(config))
    , m_clock(std::move(clock)) {}

template<typename Address>
const typename ServerReplication<Address>::Client*
ServerReplication<Address>::FindClient(const Address& address) const {
    auto it = m_clients.find(address);
    return it != m_clients.end() ? &it->second : nullptr;
}

template<typename Address>
void ServerReplication<Address>::Receive(World& world) {
    while (true) {
        auto received = m_transport->Recv();
        if (!received) {
            if (!received.error().IsNoMore()) {
                VIGILANT_LOG_WARN("Error reading from transport: {}", received.error().message);
            }
            break;
        }

        auto& [message, source] = *received;
        if (auto it = m_clients.find(source); it != m_clients.end()) {
            it->second.lastSeen = m_clock();
        }
        HandleMessage(world, message, source);
    }

    if (m_config.clientTimeoutSeconds > 0.0) {
        EvictSilentClients(world);
    }
}

template<typename Address>
void ServerReplication<Address>::HandleMessage(World& world, Vigilant::Message& message, const Address& source) {
    using namespace Vigilant;

    if (std::holds_alternative<Msg::ClientHello>(message)) {
        HandleClientHello(world, source);
    } else if (auto* ping = std::get_if<Msg::Ping>(&message)) {
        SendTo(Msg::Pong{ping->payload}, source);
    } else if (auto* pong = std::get_if<Msg::Pong>(&message)) {
        HandlePong(pong->payload, source);
    } else if (auto* update = std::get_if<Msg::EntityUpdate>(&message)) {
        HandleControlUpdate(world, *update, source);
    } else if (std::holds_alternative<Msg::Disconnection>(message)) {
        if (DisconnectClient(world, source)) {
            VIGILANT_LOG_INFO("Client {} disconnected", AddressToString(source));
        } else {
            VIGILANT_LOG_DEBUG("Disconnection from unknown address {}", AddressToString(source));
        }
    } else {
        VIGILANT_LOG_INFO("Invalid message {} from {}", MessageName(message), AddressToString(source));
    }
}

template<typename Address>
void ServerReplication<Address>::HandleClientHello(World& world, const Address& source) {
    using namespace Vigilant;

    if (auto existing = m_clients.find(source); existing != m_clients.end()) {
        VIGILANT_LOG_INFO("Repeated ClientHello from {}", AddressToString(source));
        SendTo(Msg::ServerHello{}, source);

        // Re-grant in case the first StartEntityControl was lost
        const uint32_t clientId = existing->second.clientId;
        world.ForEach([&](const EntityRecord& record, EntityHandle) {
            if (record.clientControlled && record.clientControlled->clientId == clientId
                && record.replicated && !record.pendingDelete) {
                SendTo(Msg::StartEntityControl{record.replicated->id}, source);
            }
        });
        SendTo(Msg::Ping{EncodePingTime(m_clock())}, source);
        return;
    }

    VIGILANT_LOG_INFO("Got ClientHello from {}", AddressToString(source));

    const auto now = m_clock();
    Client client;
    client.address = source;
    client.clientId = m_nextClientId++;
    client.lastPong = now;
    client.lastSeen = now;
    client.state = ConnectionState::Connected;
    const uint32_t clientId = client.clientId;
    m_clients.emplace(source, std::move(client));

    SendTo(Msg::ServerHello{}, source);

    // Ship for the new player; its id is handed out before the first send
    EntityFactory factory(world, true);
    EntityHandle ship = factory.CreateShip();
    const uint64_t shipId = ship.Pack();
    world.Lazy().Insert(ship, ClientControlled{clientId});
    world.Lazy().Insert(ship, Replicated{shipId, 0});

    SendTo(Msg::StartEntityControl{shipId}, source);
    VIGILANT_LOG_INFO("Created ship {} for new client {}", shipId, clientId);

    SendTo(Msg::Ping{EncodePingTime(now)}, source);
}

template<typename Address>
void ServerReplication<Address>::HandlePong(uint32_t payload, const Address& source) {
    auto it = m_clients.find(source);
    if (it == m_clients.end()) {
        VIGILANT_LOG_DEBUG("Pong from unknown address {}", Vigilant::AddressToString(source));
        return;
    }

    const auto now = m_clock();
    auto elapsed = Vigilant::PingElapsedSeconds(payload, now);
    if (!elapsed) {
        VIGILANT_LOG_DEBUG("Ignoring pong from the future from {}", Vigilant::AddressToString(source));
        return;
    }

    Client& client = it->second;
    client.ping.AddSample(*elapsed);
    client.lastPong = now;
    VIGILANT_LOG_TRACE("Client {} ping {:.3f}s (smoothed {:.3f}s)",
        client.clientId, *elapsed, client.ping.GetSeconds());
}

template<typename Address>
void ServerReplication<Address>::HandleControlUpdate(World& world,
                                                     const Vigilant::Msg::EntityUpdate& update,
                                                     const Address& source) {
    auto client = m_clients.find(source);
    if (client == m_clients.end()) {
        VIGILANT_LOG_INFO("Control update from unknown address {}", Vigilant::AddressToString(source));
        return;
    }

    auto entity = world.FindByReplicatedId(update.entityId);
    const ClientControlled* owner = entity ? world.Get<ClientControlled>(*entity) : nullptr;
    Ship* ship = entity ? world.Get<Ship>(*entity) : nullptr;
    if (!ship || !owner || owner->clientId != client->second.clientId) {
        VIGILANT_LOG_INFO("Client {} sent control for entity {} it does not own",
            client->second.clientId, update.entityId);
        return;
    }

    auto applied = ApplyControl(*ship, update.data);
    if (!applied) {
        VIGILANT_LOG_INFO("Invalid ship control update from client {}: {}",
            client->second.clientId, EntityCodecErrorToString(applied.error()));
        return;
    }

    world.Insert(*entity, Dirty{});
}

template<typename Address>
bool ServerReplication<Address>::DisconnectClient(World& world, const Address& address) {
    auto it = m_clients.find(address);
    if (it == m_clients.end()) {
        return false;
    }

    it->second.state = ConnectionState::Disconnected;
    const uint32_t clientId = it->second.clientId;
    m_clients.erase(it);

    std::vector<EntityHandle> owned;
    world.ForEach([&](EntityRecord& record, EntityHandle handle) {
        if (record.clientControlled && record.clientControlled->clientId == clientId) {
            owned.push_back(handle);
        }
    });
    for (EntityHandle handle : owned) {
        world.Insert(handle, Delete{});
    }

    VIGILANT_LOG_INFO("Removed client {} and {} controlled entities", clientId, owned.size());
    return true;
}

template<typename Address>
void ServerReplication<Address>::EvictSilentClients(World& world) {
    const auto now = m_clock();
    const auto timeout = std::chrono::duration<double>(m_config.clientTimeoutSeconds);

    std::vector<Address> silent;
    for (const auto& [address, client] : m_clients) {
        if (now - client.lastSeen > timeout) {
            silent.push_back(address);
        }
    }

    for (const auto& address : silent) {
        VIGILANT_LOG_INFO("Client {} timed out", Vigilant::AddressToString(address));
        DisconnectClient(world, address);
    }
}

template<typename Address>
void ServerReplication<Address>::Send(World& world) {
    ++m_frame;

    world.ForEach([&](EntityRecord& record, EntityHandle handle) {
        if (!record.replicated || record.pendingDelete) {
            return;
        }

        Replicated& repli = *record.replicated;
        if (repli.id == 0) {
            repli.id = handle.Pack();
        }

        // Send an update if dirty, or if it hasn't been updated in a while
        if (!record.dirty && m_frame - repli.lastUpdate < m_config.stalenessTicks) {
            return;
        }

        auto data = EncodeEntityState(record);
        if (!data) {
            VIGILANT_LOG_WARN("Not replicating entity {}: {}", repli.id,
                EntityCodecErrorToString(data.error()));
            return;
        }

        Broadcast(Vigilant::Msg::EntityUpdate{repli.id, std::move(*data)});
        repli.lastUpdate = m_frame;
    });

    // Announce and remove entities the simulation deleted
    std::vector<EntityHandle> deleted;
    world.ForEach([&](EntityRecord& record, EntityHandle handle) {
        if (!record.pendingDelete) {
            return;
        }
        if (record.replicated && record.replicated->id != 0) {
            Broadcast(Vigilant::Msg::EntityDelete{record.replicated->id});
        }
        deleted.push_back(handle);
    });
    for (EntityHandle handle : deleted) {
        world.Destroy(handle);
    }

    world.ClearComponent<Dirty>();

    if (m_config.pingIntervalTicks > 0 && m_frame % m_config.pingIntervalTicks == 0) {
        SendPeriodicPings();
    }
}

template<typename Address>
void ServerReplication<Address>::SendPeriodicPings() {
    const uint32_t payload = Vigilant::EncodePingTime(m_clock());
    Broadcast(Vigilant::Msg::Ping{payload});
}

template<typename Address>
void ServerReplication<Address>::SendTo(const Vigilant::Message& message, const Address& address) {
    auto sent = m_transport->Send(message, address);
    if (!sent) {
        if (sent.error().IsNoMore()) {
            VIGILANT_LOG_DEBUG("Send buffer full, dropped {} to {}",
                Vigilant::MessageName(message), Vigilant::AddressToString(address));
        } else {
            VIGILANT_LOG_WARN("Failed to send {} to {}: {}", Vigilant::MessageName(message),
                Vigilant::AddressToString(address), sent.error().message);
        }
    }
}

template<typename Address>
void ServerReplication<Address>::Broadcast(const Vigilant::Message& message) {
    for (const auto& [address, client] : m_clients) {
        SendTo(message, address);
    }
}

} // namespace Spacewar
