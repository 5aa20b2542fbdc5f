#include "ClientReplication.hpp"
#include "core/Logger.hpp"
#include <unordered_map>

namespace Spacewar {

using namespace Vigilant;

ClientReplication::ClientReplication(std::unique_ptr<IClient> transport, WallClock clock)
    : m_transport(std::move(transport))
    , m_clock(std::move(clock))
    , m_lastPong(m_clock()) {
    SendToServer(Msg::ClientHello{});
}

void ClientReplication::Receive(World& world) {
    std::vector<QueuedMessage> queued;
    DrainTransport(queued);
    if (m_grantsPending) {
        AttachGrantedControl(world);
        m_grantsPending = false;
    }
    if (queued.empty()) {
        return;
    }
    ApplyToExisting(world, queued);
    CreateFromUnhandled(world, queued);
}

void ClientReplication::DrainTransport(std::vector<QueuedMessage>& queued) {
    while (true) {
        auto received = m_transport->Recv();
        if (!received) {
            if (!received.error().IsNoMore()) {
                VIGILANT_LOG_WARN("Error reading from transport: {}", received.error().message);
            }
            break;
        }

        Message& message = *received;
        if (std::holds_alternative<Msg::ServerHello>(message)) {
            VIGILANT_LOG_INFO("Got ServerHello");
            m_connected = true;
        } else if (auto* control = std::get_if<Msg::StartEntityControl>(&message)) {
            VIGILANT_LOG_INFO("Server granted control of entity {}", control->entityId);
            if (m_controlledEntities.insert(control->entityId).second) {
                m_grantsPending = true;
            }
        } else if (auto* ping = std::get_if<Msg::Ping>(&message)) {
            SendToServer(Msg::Pong{ping->payload});
        } else if (auto* pong = std::get_if<Msg::Pong>(&message)) {
            const auto now = m_clock();
            if (auto elapsed = PingElapsedSeconds(pong->payload, now)) {
                m_ping.AddSample(*elapsed);
                m_lastPong = now;
            }
        } else if (std::holds_alternative<Msg::Disconnection>(message)) {
            VIGILANT_LOG_WARN("Server closed the connection");
            m_connected = false;
        } else if (std::holds_alternative<Msg::EntityUpdate>(message)
                || std::holds_alternative<Msg::EntityDelete>(message)) {
            queued.push_back(QueuedMessage{std::move(message), false});
        } else {
            VIGILANT_LOG_INFO("Invalid message {} from server", MessageName(message));
        }
    }
}

void ClientReplication::AttachGrantedControl(World& world) {
    world.ForEach([&](EntityRecord& record, EntityHandle handle) {
        if (!record.replicated || record.localControl
            || !m_controlledEntities.contains(record.replicated->id)) {
            return;
        }
        VIGILANT_LOG_INFO("Taking control of existing ship {}", record.replicated->id);
        world.Lazy().Insert(handle, LocalControl{});
    });
}

void ClientReplication::ApplyToExisting(World& world, std::vector<QueuedMessage>& queued) {
    std::unordered_map<uint64_t, std::vector<size_t>> byId;
    for (size_t i = 0; i < queued.size(); ++i) {
        std::visit([&](auto&& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, Msg::EntityUpdate> || std::is_same_v<T, Msg::EntityDelete>) {
                byId[msg.entityId].push_back(i);
            }
        }, queued[i].message);
    }

    world.ForEach([&](EntityRecord& record, EntityHandle handle) {
        if (!record.replicated) {
            return;
        }
        auto it = byId.find(record.replicated->id);
        if (it == byId.end()) {
            return;
        }

        // LocalControl for a fresh grant is still queued in the lazy buffer
        const bool controlled = record.localControl.has_value()
            || m_controlledEntities.contains(record.replicated->id);

        for (size_t index : it->second) {
            QueuedMessage& entry = queued[index];
            entry.handled = true;

            if (auto* update = std::get_if<Msg::EntityUpdate>(&entry.message)) {
                auto applied = ApplyEntityState(record, update->data, controlled);
                if (!applied) {
                    VIGILANT_LOG_WARN("Dropping update for entity {}: {}", update->entityId,
                        EntityCodecErrorToString(applied.error()));
                }
            } else {
                world.Lazy().Destroy(handle);
            }
        }
    });
}

void ClientReplication::CreateFromUnhandled(World& world, std::vector<QueuedMessage>& queued) {
    std::unordered_map<uint64_t, EntityHandle> created;

    for (QueuedMessage& entry : queued) {
        if (entry.handled) {
            continue;
        }
        auto* update = std::get_if<Msg::EntityUpdate>(&entry.message);
        if (!update) {
            if (auto* deletion = std::get_if<Msg::EntityDelete>(&entry.message)) {
                // Deleting an entity created earlier in this same pass
                if (auto it = created.find(deletion->entityId); it != created.end()) {
                    world.Lazy().Destroy(it->second);
                    created.erase(it);
                }
            }
            continue;
        }

        auto state = DecodeEntityState(update->data);
        if (!state) {
            VIGILANT_LOG_WARN("Cannot create entity {}: {}", update->entityId,
                EntityCodecErrorToString(state.error()));
            continue;
        }

        // A repeated update in the same pass overrides the queued components
        EntityHandle entity;
        if (auto it = created.find(update->entityId); it != created.end()) {
            entity = it->second;
        } else {
            entity = world.Create();
            created.emplace(update->entityId, entity);
        }

        auto& lazy = world.Lazy();
        lazy.Insert(entity, state->position);
        lazy.Insert(entity, state->velocity);
        switch (state->kind) {
            case EntityKind::Ship:
                lazy.Insert(entity, state->ship);
                break;
            case EntityKind::Asteroid:
                lazy.Insert(entity, Asteroid{});
                break;
            case EntityKind::Projectile:
                // The shooter is not replicated
                lazy.Insert(entity, Projectile{state->projectileType, EntityHandle{}});
                break;
        }
        lazy.Insert(entity, Replicated{update->entityId, 0});

        if (m_controlledEntities.contains(update->entityId)) {
            VIGILANT_LOG_INFO("Created locally-controlled ship {}", update->entityId);
            lazy.Insert(entity, LocalControl{});
        }
    }
}

void ClientReplication::Send(World& world) {
    world.ForEach([&](EntityRecord& record, EntityHandle) {
        if (!record.ship || !record.replicated || !record.dirty || !record.localControl) {
            return;
        }
        SendToServer(Msg::EntityUpdate{record.replicated->id, EncodeControl(*record.ship)});
    });

    world.ClearComponent<Dirty>();
}

void ClientReplication::Disconnect() {
    SendToServer(Msg::Disconnection{});
    m_connected = false;
}

void ClientReplication::SendToServer(const Message& message) {
    auto sent = m_transport->Send(message);
    if (!sent) {
        if (sent.error().IsNoMore()) {
            VIGILANT_LOG_DEBUG("Send buffer full, dropped {}", MessageName(message));
        } else {
            VIGILANT_LOG_WARN("Failed to send {}: {}", MessageName(message), sent.error().message);
        }
    }
}

} // namespace Spacewar
