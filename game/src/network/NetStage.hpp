#pragma once

namespace Spacewar {

class World;

/**
 * @brief Replication stage driven once per tick by the Game
 *
 * Receive() runs before the simulation, Send() after it. Both may queue
 * LazyUpdate commands; the Game applies them with World::Maintain() once
 * Send() returns.
 */
class INetStage {
public:
    virtual ~INetStage() = default;

    virtual void Receive(World& world) = 0;
    virtual void Send(World& world) = 0;
};

} // namespace Spacewar
