#pragma once

#include "networking/Transport.hpp"
#include "core/SpscQueue.hpp"
#include <functional>
#include <utility>
#include <vector>

namespace Vigilant {

/// Default queue depth for in-process transports
inline constexpr size_t STUB_QUEUE_CAPACITY = 1024;

/**
 * @brief In-process server transport
 *
 * Inbound messages are pushed into an SPSC queue by a single producer
 * (possibly another thread). Outbound messages are recorded and, when a
 * forwarder is installed, handed to it as well. A forwarder returning false
 * is reported as NoMore.
 */
template<typename Address>
class StubServer final : public IServer<Address> {
public:
    using Envelope = std::pair<Message, Address>;
    using Forwarder = std::function<bool(const Message&, const Address&)>;

    explicit StubServer(size_t capacity = STUB_QUEUE_CAPACITY)
        : m_inbound(capacity) {}

    std::expected<void, NetError> Send(const Message& message, const Address& address) override {
        if (m_forwarder && !m_forwarder(message, address)) {
            return std::unexpected(NetError::NoMore());
        }
        if (m_recordSent) {
            m_sent.emplace_back(message, address);
        }
        return {};
    }

    std::expected<Envelope, NetError> Recv() override {
        auto next = m_inbound.TryPop();
        if (!next) {
            return std::unexpected(NetError::NoMore());
        }
        return std::move(*next);
    }

    /**
     * @brief Producer side: queue a message as if it arrived from address
     * @return false if the inbound queue is full
     */
    [[nodiscard]] bool Deliver(Message message, Address address) {
        return m_inbound.TryPush(Envelope{std::move(message), std::move(address)});
    }

    void SetForwarder(Forwarder forwarder) { m_forwarder = std::move(forwarder); }
    void SetRecordSent(bool record) noexcept { m_recordSent = record; }

    [[nodiscard]] const std::vector<Envelope>& GetSent() const noexcept { return m_sent; }

    /**
     * @brief Move out and clear everything sent so far
     */
    [[nodiscard]] std::vector<Envelope> TakeSent() {
        std::vector<Envelope> sent;
        sent.swap(m_sent);
        return sent;
    }

    [[nodiscard]] SpscQueue<Envelope>& GetInbound() noexcept { return m_inbound; }

private:
    SpscQueue<Envelope> m_inbound;
    std::vector<Envelope> m_sent;
    Forwarder m_forwarder;
    bool m_recordSent = true;
};

/**
 * @brief In-process client transport
 *
 * Sends go through a callable (typically pushing into a StubServer); a
 * callable returning false is reported as NoMore. Inbound messages are read
 * from the client's own SPSC queue.
 */
class StubClient final : public IClient {
public:
    using Forwarder = std::function<bool(const Message&)>;

    explicit StubClient(Forwarder forwarder, size_t capacity = STUB_QUEUE_CAPACITY)
        : m_forwarder(std::move(forwarder))
        , m_inbound(capacity) {}

    std::expected<void, NetError> Send(const Message& message) override {
        if (!m_forwarder || !m_forwarder(message)) {
            return std::unexpected(NetError::NoMore());
        }
        return {};
    }

    std::expected<Message, NetError> Recv() override {
        auto next = m_inbound.TryPop();
        if (!next) {
            return std::unexpected(NetError::NoMore());
        }
        return std::move(*next);
    }

    /**
     * @brief Producer side: queue a message as if the server sent it
     * @return false if the inbound queue is full
     */
    [[nodiscard]] bool Deliver(Message message) {
        return m_inbound.TryPush(std::move(message));
    }

    [[nodiscard]] SpscQueue<Message>& GetInbound() noexcept { return m_inbound; }

private:
    Forwarder m_forwarder;
    SpscQueue<Message> m_inbound;
};

} // namespace Vigilant
