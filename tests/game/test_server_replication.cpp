/**
 * @file test_server_replication.cpp
 * @brief Unit tests for the server receive and send stages
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "network/ServerReplication.hpp"
#include "networking/StubTransport.hpp"

#include "mocks/MockTransport.hpp"
#include "utils/TestHelpers.hpp"

#include <chrono>
#include <memory>
#include <vector>

using namespace Spacewar;
using namespace Vigilant;
using namespace Vigilant::Test;
using ::testing::_;
using ::testing::Return;

namespace {

using Address = uint32_t;
constexpr Address kAlice = 1;
constexpr Address kBob = 2;

std::vector<uint8_t> FireAtBlob(glm::vec2 target) {
    Ship intent;
    intent.wantFire = true;
    intent.wantTarget = target;
    return EncodeControl(intent);
}

} // anonymous namespace

// =============================================================================
// Test Fixtures
// =============================================================================

class ServerReplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        world.SetReplicatedDeletion(true);
        CreateServer(NetConfig{});
    }

    void CreateServer(const NetConfig& config) {
        auto stub = std::make_unique<StubServer<Address>>();
        transport = stub.get();
        server = std::make_unique<ServerReplication<Address>>(std::move(stub), config, clock.AsWallClock());
    }

    void Deliver(Message message, Address from) {
        ASSERT_TRUE(transport->Deliver(std::move(message), from));
    }

    void Tick() {
        server->Receive(world);
        server->Send(world);
        world.Maintain();
    }

    /// Runs the hello handshake and returns the granted entity id
    uint64_t Connect(Address address) {
        Deliver(Msg::ClientHello{}, address);
        server->Receive(world);
        world.Maintain();

        auto grants = MessagesOfTypeTo<Msg::StartEntityControl>(transport->GetSent(), address);
        EXPECT_EQ(1u, grants.size());
        return grants.empty() ? 0 : grants.back().entityId;
    }

    EntityHandle ShipOf(uint64_t id) {
        auto handle = world.FindByReplicatedId(id);
        EXPECT_TRUE(handle.has_value()) << "no entity for id " << id;
        return handle.value_or(EntityHandle{});
    }

    World world;
    ManualClock clock;
    StubServer<Address>* transport = nullptr;
    std::unique_ptr<ServerReplication<Address>> server;
};

// =============================================================================
// Handshake
// =============================================================================

TEST_F(ServerReplicationTest, ClientHelloGetsHelloControlAndPing) {
    Deliver(Msg::ClientHello{}, kAlice);
    server->Receive(world);
    world.Maintain();

    const auto& sent = transport->GetSent();
    ASSERT_EQ(3u, sent.size());
    EXPECT_TRUE(std::holds_alternative<Msg::ServerHello>(sent[0].first));
    ASSERT_TRUE(std::holds_alternative<Msg::StartEntityControl>(sent[1].first));
    ASSERT_TRUE(std::holds_alternative<Msg::Ping>(sent[2].first));
    for (const auto& [message, address] : sent) {
        EXPECT_EQ(kAlice, address);
    }

    const uint64_t id = std::get<Msg::StartEntityControl>(sent[1].first).entityId;
    EXPECT_NE(0u, id);
    EXPECT_EQ(EncodePingTime(clock.Now()), std::get<Msg::Ping>(sent[2].first).payload);

    ASSERT_EQ(1u, server->GetClients().size());
    EntityHandle ship = ShipOf(id);
    EXPECT_EQ(id, ship.Pack());
    EXPECT_TRUE(world.Has<Ship>(ship));
    ASSERT_TRUE(world.Has<ClientControlled>(ship));
    EXPECT_EQ(server->FindClient(kAlice)->clientId, world.Get<ClientControlled>(ship)->clientId);
}

TEST_F(ServerReplicationTest, RepeatedHelloRegrantsExistingShip) {
    const uint64_t alice = Connect(kAlice);
    Connect(kBob);
    (void)transport->TakeSent();

    Deliver(Msg::ClientHello{}, kAlice);
    server->Receive(world);
    world.Maintain();

    const auto& sent = transport->GetSent();
    ASSERT_EQ(3u, sent.size());
    EXPECT_TRUE(std::holds_alternative<Msg::ServerHello>(sent[0].first));
    ASSERT_TRUE(std::holds_alternative<Msg::StartEntityControl>(sent[1].first));
    EXPECT_EQ(alice, std::get<Msg::StartEntityControl>(sent[1].first).entityId);
    EXPECT_TRUE(std::holds_alternative<Msg::Ping>(sent[2].first));
    for (const auto& [message, address] : sent) {
        EXPECT_EQ(kAlice, address);
    }

    EXPECT_EQ(2u, server->GetClients().size());
    EXPECT_EQ(2u, world.GetEntityCount());
}

TEST_F(ServerReplicationTest, RepeatedHelloSkipsShipPendingDeletion) {
    const uint64_t alice = Connect(kAlice);
    world.MarkForDeletion(ShipOf(alice));
    (void)transport->TakeSent();

    Deliver(Msg::ClientHello{}, kAlice);
    server->Receive(world);

    EXPECT_TRUE(MessagesOfType<Msg::StartEntityControl>(transport->GetSent()).empty());
    EXPECT_EQ(1u, MessagesOfType<Msg::ServerHello>(transport->GetSent()).size());
}

TEST_F(ServerReplicationTest, ClientsGetDistinctIds) {
    uint64_t alice = Connect(kAlice);
    uint64_t bob = Connect(kBob);

    EXPECT_NE(alice, bob);
    EXPECT_NE(server->FindClient(kAlice)->clientId, server->FindClient(kBob)->clientId);
    EXPECT_EQ(2u, world.GetEntityCount());
}

// =============================================================================
// Control and State Broadcast
// =============================================================================

TEST_F(ServerReplicationTest, ControlUpdateIsAppliedAndBroadcast) {
    const uint64_t id = Connect(kAlice);
    Tick();
    (void)transport->TakeSent();

    Deliver(Msg::EntityUpdate{id, FireAtBlob(glm::vec2(1.0f, 0.0f))}, kAlice);
    server->Receive(world);

    EntityHandle ship = ShipOf(id);
    ASSERT_TRUE(world.Has<Ship>(ship));
    EXPECT_TRUE(world.Get<Ship>(ship)->wantFire);
    EXPECT_TRUE(world.Has<Dirty>(ship));

    server->Send(world);
    world.Maintain();

    auto updates = MessagesOfTypeTo<Msg::EntityUpdate>(transport->GetSent(), kAlice);
    ASSERT_EQ(1u, updates.size());
    EXPECT_EQ(id, updates[0].entityId);
    ASSERT_EQ(SHIP_STATE_SIZE, updates[0].data.size());
    EXPECT_EQ(static_cast<uint8_t>(EntityKind::Ship), updates[0].data[0]);
    EXPECT_EQ(SHIP_FLAG_WANT_FIRE, updates[0].data[57] & SHIP_FLAG_WANT_FIRE);

    auto state = DecodeEntityState(updates[0].data);
    ASSERT_TRUE(state.has_value());
    EXPECT_VEC2_EQ(glm::vec2(1.0f, 0.0f), state->ship.wantTarget);
    EXPECT_FALSE(world.Has<Dirty>(ship));
}

TEST_F(ServerReplicationTest, ForeignControlIsIgnored) {
    const uint64_t aliceShip = Connect(kAlice);
    Connect(kBob);
    Tick();

    Deliver(Msg::EntityUpdate{aliceShip, FireAtBlob(glm::vec2(1.0f, 1.0f))}, kBob);
    server->Receive(world);

    EntityHandle ship = ShipOf(aliceShip);
    EXPECT_FALSE(world.Get<Ship>(ship)->wantFire);
    EXPECT_FALSE(world.Has<Dirty>(ship));
}

TEST_F(ServerReplicationTest, ControlFromUnknownAddressIsIgnored) {
    const uint64_t id = Connect(kAlice);
    Tick();

    Deliver(Msg::EntityUpdate{id, FireAtBlob(glm::vec2(0.0f))}, 99);
    server->Receive(world);

    EXPECT_FALSE(world.Get<Ship>(ShipOf(id))->wantFire);
}

TEST_F(ServerReplicationTest, StateSizedUpdateFromClientIsIgnored) {
    const uint64_t id = Connect(kAlice);
    Tick();

    Deliver(Msg::EntityUpdate{id, std::vector<uint8_t>(ASTEROID_STATE_SIZE, 0xFF)}, kAlice);
    server->Receive(world);

    EXPECT_FALSE(world.Get<Ship>(ShipOf(id))->wantFire);
    EXPECT_FALSE(world.Has<Dirty>(ShipOf(id)));
}

TEST_F(ServerReplicationTest, UnassignedIdIsFilledOnSend) {
    Connect(kAlice);
    EntityFactory factory(world, true);
    EntityHandle asteroid = factory.CreateAsteroid(Position{}, Velocity{});
    world.Maintain();
    ASSERT_EQ(0u, world.Get<Replicated>(asteroid)->id);

    server->Send(world);

    EXPECT_EQ(asteroid.Pack(), world.Get<Replicated>(asteroid)->id);
    auto updates = MessagesOfType<Msg::EntityUpdate>(transport->GetSent());
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(asteroid.Pack(), updates.back().entityId);
    EXPECT_EQ(ASTEROID_STATE_SIZE, updates.back().data.size());
}

// =============================================================================
// Staleness
// =============================================================================

TEST_F(ServerReplicationTest, CleanEntityIsResentAfterStalenessWindow) {
    const uint64_t id = Connect(kAlice);
    Tick();  // Frame 1 carries the initial update
    ASSERT_EQ(1u, MessagesOfType<Msg::EntityUpdate>(transport->TakeSent()).size());

    for (int frame = 2; frame <= 200; ++frame) {
        Tick();
    }
    EXPECT_TRUE(MessagesOfType<Msg::EntityUpdate>(transport->TakeSent()).empty());

    Tick();  // Frame 201
    auto updates = MessagesOfType<Msg::EntityUpdate>(transport->TakeSent());
    ASSERT_EQ(1u, updates.size());
    EXPECT_EQ(id, updates[0].entityId);
    EXPECT_EQ(201u, world.Get<Replicated>(ShipOf(id))->lastUpdate);
}

TEST_F(ServerReplicationTest, ConfiguredStalenessWindow) {
    NetConfig config;
    config.stalenessTicks = 3;
    CreateServer(config);
    Connect(kAlice);

    int updates = 0;
    for (int frame = 1; frame <= 7; ++frame) {
        Tick();
        updates += static_cast<int>(MessagesOfType<Msg::EntityUpdate>(transport->TakeSent()).size());
    }

    // Frames 1, 4 and 7
    EXPECT_EQ(3, updates);
}

// =============================================================================
// Deletion and Disconnection
// =============================================================================

TEST_F(ServerReplicationTest, DeletionIsAnnouncedExactlyOnce) {
    const uint64_t id = Connect(kAlice);
    Tick();
    (void)transport->TakeSent();

    world.MarkForDeletion(ShipOf(id));
    Tick();

    auto sent = transport->TakeSent();
    auto deletes = MessagesOfType<Msg::EntityDelete>(sent);
    ASSERT_EQ(1u, deletes.size());
    EXPECT_EQ(id, deletes[0].entityId);
    EXPECT_TRUE(MessagesOfType<Msg::EntityUpdate>(sent).empty());
    EXPECT_FALSE(world.FindByReplicatedId(id).has_value());

    for (int i = 0; i < 250; ++i) {
        Tick();
    }
    EXPECT_TRUE(transport->GetSent().empty());
}

TEST_F(ServerReplicationTest, DeletionWithoutAssignedIdIsSilent) {
    Connect(kAlice);
    Tick();
    (void)transport->TakeSent();

    EntityHandle entity = world.Create();
    world.Insert(entity, Replicated{});
    world.MarkForDeletion(entity);
    Tick();

    EXPECT_TRUE(MessagesOfType<Msg::EntityDelete>(transport->GetSent()).empty());
    EXPECT_FALSE(world.IsAlive(entity));
}

TEST_F(ServerReplicationTest, DisconnectionRemovesClientAndShip) {
    const uint64_t aliceShip = Connect(kAlice);
    Connect(kBob);
    Tick();
    (void)transport->TakeSent();

    Deliver(Msg::Disconnection{}, kAlice);
    server->Receive(world);

    EXPECT_EQ(nullptr, server->FindClient(kAlice));
    EXPECT_NE(nullptr, server->FindClient(kBob));
    EXPECT_TRUE(world.Has<Delete>(ShipOf(aliceShip)));

    server->Send(world);
    world.Maintain();

    auto deletes = MessagesOfTypeTo<Msg::EntityDelete>(transport->GetSent(), kBob);
    ASSERT_EQ(1u, deletes.size());
    EXPECT_EQ(aliceShip, deletes[0].entityId);
    EXPECT_TRUE(MessagesOfTypeTo<Msg::EntityDelete>(transport->GetSent(), kAlice).empty());
    EXPECT_FALSE(world.FindByReplicatedId(aliceShip).has_value());
}

TEST_F(ServerReplicationTest, DisconnectUnknownClientFails) {
    EXPECT_FALSE(server->DisconnectClient(world, kAlice));
}

TEST_F(ServerReplicationTest, SilentClientIsEvictedWhenTimeoutConfigured) {
    NetConfig config;
    config.clientTimeoutSeconds = 5.0;
    CreateServer(config);

    const uint64_t aliceShip = Connect(kAlice);
    Connect(kBob);

    clock.Advance(std::chrono::seconds(4));
    Deliver(Msg::Ping{1}, kBob);
    server->Receive(world);
    EXPECT_EQ(2u, server->GetClients().size());

    clock.Advance(std::chrono::seconds(2));
    server->Receive(world);

    EXPECT_EQ(nullptr, server->FindClient(kAlice));
    EXPECT_NE(nullptr, server->FindClient(kBob));
    EXPECT_TRUE(world.Has<Delete>(ShipOf(aliceShip)));
}

TEST_F(ServerReplicationTest, NoEvictionByDefault) {
    Connect(kAlice);

    clock.Advance(std::chrono::hours(1));
    server->Receive(world);

    EXPECT_NE(nullptr, server->FindClient(kAlice));
}

// =============================================================================
// Ping
// =============================================================================

TEST_F(ServerReplicationTest, PingIsEchoed) {
    Deliver(Msg::Ping{0xCAFE}, kAlice);
    server->Receive(world);

    auto pongs = MessagesOfTypeTo<Msg::Pong>(transport->GetSent(), kAlice);
    ASSERT_EQ(1u, pongs.size());
    EXPECT_EQ(0xCAFEu, pongs[0].payload);
}

TEST_F(ServerReplicationTest, PongUpdatesRoundTrip) {
    Connect(kAlice);
    auto pings = MessagesOfTypeTo<Msg::Ping>(transport->GetSent(), kAlice);
    ASSERT_EQ(1u, pings.size());

    clock.Advance(std::chrono::milliseconds(50));
    Deliver(Msg::Pong{pings[0].payload}, kAlice);
    server->Receive(world);

    const auto* client = server->FindClient(kAlice);
    ASSERT_NE(nullptr, client);
    ASSERT_TRUE(client->ping.HasSample());
    EXPECT_GE(client->ping.GetSeconds(), 0.0);
    EXPECT_NEAR(0.050, client->ping.GetSeconds(), 0.005);
    EXPECT_EQ(clock.Now(), client->lastPong);
}

TEST_F(ServerReplicationTest, PongFromTheFutureIsIgnored) {
    Connect(kAlice);

    Deliver(Msg::Pong{EncodePingTime(clock.Now() + std::chrono::seconds(10))}, kAlice);
    server->Receive(world);

    EXPECT_FALSE(server->FindClient(kAlice)->ping.HasSample());
}

TEST_F(ServerReplicationTest, PeriodicPingWhenConfigured) {
    NetConfig config;
    config.pingIntervalTicks = 10;
    CreateServer(config);
    Connect(kAlice);
    (void)transport->TakeSent();

    for (int i = 0; i < 9; ++i) {
        Tick();
    }
    EXPECT_TRUE(MessagesOfType<Msg::Ping>(transport->GetSent()).empty());

    Tick();
    EXPECT_EQ(1u, MessagesOfTypeTo<Msg::Ping>(transport->GetSent(), kAlice).size());
}

// =============================================================================
// Protocol Violations and Transport Errors
// =============================================================================

TEST_F(ServerReplicationTest, ServerOnlyMessagesFromClientsAreDropped) {
    Connect(kAlice);
    (void)transport->TakeSent();
    const size_t entities = world.GetEntityCount();

    Deliver(Msg::ServerHello{}, kAlice);
    Deliver(Msg::StartEntityControl{5}, kAlice);
    Deliver(Msg::EntityDelete{5}, kAlice);
    server->Receive(world);
    world.Maintain();

    EXPECT_TRUE(transport->GetSent().empty());
    EXPECT_EQ(entities, world.GetEntityCount());
}

TEST_F(ServerReplicationTest, FullSendBufferDoesNotStallSend) {
    const uint64_t id = Connect(kAlice);
    transport->SetForwarder([](const Message&, const Address&) { return false; });

    Tick();

    EXPECT_EQ(1u, world.Get<Replicated>(ShipOf(id))->lastUpdate);
}

TEST(ServerReplicationMockTest, TransportErrorEndsDrainUntilNextTick) {
    World world;
    auto mock = std::make_unique<::testing::NiceMock<MockServer<Address>>>();
    auto* transport = mock.get();

    using RecvResult = MockServer<Address>::RecvResult;
    EXPECT_CALL(*transport, Recv())
        .WillOnce(Return(RecvResult{std::unexpect, NetError::Transport("connection refused")}))
        .WillOnce(Return(RecvResult{std::in_place, Message{Msg::ClientHello{}}, kAlice}))
        .WillRepeatedly(Return(RecvResult{std::unexpect, NetError::NoMore()}));
    EXPECT_CALL(*transport, Send(Message{Msg::ServerHello{}}, kAlice)).Times(1);
    EXPECT_CALL(*transport, Send(::testing::Ne(Message{Msg::ServerHello{}}), kAlice)).Times(2);

    ServerReplication<Address> server(std::move(mock));

    server.Receive(world);
    EXPECT_TRUE(server.GetClients().empty());

    server.Receive(world);
    EXPECT_EQ(1u, server.GetClients().size());
}
