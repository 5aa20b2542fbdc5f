#pragma once

#include "networking/Transport.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Vigilant {

#ifdef _WIN32
using NativeSocket = uintptr_t;
#else
using NativeSocket = int;
#endif

/// Default server port
inline constexpr uint16_t DEFAULT_SERVER_PORT = 34244;

/// Largest datagram either side will read
inline constexpr size_t UDP_RECV_BUFFER_SIZE = 1024;

/**
 * @brief IPv4 endpoint
 *
 * Both fields are stored in host byte order.
 */
struct UdpAddress {
    uint32_t ip = 0;
    uint16_t port = 0;

    [[nodiscard]] static UdpAddress Loopback(uint16_t port) noexcept { return {0x7F000001u, port}; }

    /**
     * @brief Parse "host:port"; the host may be a dotted quad or a resolvable name
     */
    [[nodiscard]] static std::optional<UdpAddress> Parse(std::string_view text);

    /**
     * @brief Format as "a.b.c.d:port"
     */
    [[nodiscard]] std::string ToString() const;

    bool operator==(const UdpAddress&) const = default;
};

/**
 * @brief RAII wrapper around a non-blocking IPv4 datagram socket
 */
class UdpSocket {
public:
    /**
     * @brief Create a socket bound to 0.0.0.0:port (0 picks an ephemeral port)
     * @throws std::system_error if the socket cannot be created or bound
     */
    explicit UdpSocket(uint16_t port);
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    std::expected<void, NetError> SendTo(std::span<const uint8_t> data, const UdpAddress& address);

    /**
     * @brief Read one datagram into the buffer
     * @return Number of bytes read and the sender, or NoMore when nothing is pending
     */
    std::expected<std::pair<size_t, UdpAddress>, NetError> RecvFrom(std::span<uint8_t> buffer);

    [[nodiscard]] uint16_t GetLocalPort() const noexcept { return m_localPort; }

private:
    void Close() noexcept;

    NativeSocket m_socket;
    uint16_t m_localPort = 0;
};

/**
 * @brief UDP server transport
 *
 * Receives from any peer. Datagrams that fail to decode are logged and
 * skipped.
 */
class UdpServer final : public IServer<UdpAddress> {
public:
    /**
     * @throws std::system_error if the port cannot be bound
     */
    explicit UdpServer(uint16_t port = DEFAULT_SERVER_PORT);
    ~UdpServer() override = default;

    std::expected<void, NetError> Send(const Message& message, const UdpAddress& address) override;
    std::expected<std::pair<Message, UdpAddress>, NetError> Recv() override;

    [[nodiscard]] uint16_t GetLocalPort() const noexcept { return m_socket.GetLocalPort(); }

private:
    UdpSocket m_socket;
};

/**
 * @brief UDP client transport talking to one server
 *
 * Binds an ephemeral local port. Datagrams from any address other than the
 * server are dropped.
 */
class UdpClient final : public IClient {
public:
    /**
     * @throws std::system_error if no local socket can be bound
     */
    explicit UdpClient(const UdpAddress& server);

    /**
     * @throws std::invalid_argument if the address cannot be parsed or resolved
     * @throws std::system_error if no local socket can be bound
     */
    explicit UdpClient(std::string_view serverHostPort);

    ~UdpClient() override = default;

    std::expected<void, NetError> Send(const Message& message) override;
    std::expected<Message, NetError> Recv() override;

    [[nodiscard]] const UdpAddress& GetServerAddress() const noexcept { return m_server; }
    [[nodiscard]] uint16_t GetLocalPort() const noexcept { return m_socket.GetLocalPort(); }

private:
    UdpAddress m_server;
    UdpSocket m_socket;
};

} // namespace Vigilant

template<>
struct std::hash<Vigilant::UdpAddress> {
    size_t operator()(const Vigilant::UdpAddress& address) const noexcept {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(address.ip) << 16) | address.port);
    }
};
