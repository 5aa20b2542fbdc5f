#include "networking/UdpTransport.hpp"
#include "core/Logger.hpp"
#include <array>
#include <charconv>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    #define INVALID_SOCK INVALID_SOCKET
    #define SOCKET_ERROR_CODE WSAGetLastError()
    #define CLOSE_SOCKET closesocket
    #define WOULD_BLOCK(err) ((err) == WSAEWOULDBLOCK)
    using SockLen = int;
#else
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <fcntl.h>
    #include <netdb.h>
    #include <cerrno>
    #define INVALID_SOCK -1
    #define SOCKET_ERROR_CODE errno
    #define CLOSE_SOCKET close
    #define WOULD_BLOCK(err) ((err) == EWOULDBLOCK || (err) == EAGAIN)
    using SockLen = socklen_t;
#endif

namespace Vigilant {

namespace {

void InitializeSockets() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsaData;
        int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
        if (result != 0) {
            throw std::system_error(result, std::system_category(), "WSAStartup failed");
        }
        initialized = true;
    }
#endif
}

bool SetNonBlocking(NativeSocket sock) {
#ifdef _WIN32
    u_long mode = 1;
    return ioctlsocket(sock, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(sock, F_GETFL, 0);
    return flags >= 0 && fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
#endif
}

sockaddr_in ToSockaddr(const UdpAddress& address) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);
    addr.sin_addr.s_addr = htonl(address.ip);
    return addr;
}

UdpAddress FromSockaddr(const sockaddr_in& addr) {
    return UdpAddress{ntohl(addr.sin_addr.s_addr), ntohs(addr.sin_port)};
}

std::string ErrorText(int code) {
    return std::system_category().message(code);
}

UdpAddress ParseOrThrow(std::string_view text) {
    auto address = UdpAddress::Parse(text);
    if (!address) {
        throw std::invalid_argument("Invalid server address: " + std::string(text));
    }
    return *address;
}

} // anonymous namespace

// ============================================================================
// UdpAddress
// ============================================================================

std::optional<UdpAddress> UdpAddress::Parse(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return std::nullopt;
    }

    std::string host(text.substr(0, colon));
    auto portText = text.substr(colon + 1);
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (ec != std::errc{} || ptr != portText.data() + portText.size()) {
        return std::nullopt;
    }

    in_addr addr{};
    if (inet_pton(AF_INET, host.c_str(), &addr) <= 0) {
        // Try hostname resolution
        InitializeSockets();
        addrinfo hints{};
        addrinfo* result = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;

        if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
            return std::nullopt;
        }

        addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
        freeaddrinfo(result);
    }

    return UdpAddress{ntohl(addr.s_addr), port};
}

std::string UdpAddress::ToString() const {
    return std::to_string((ip >> 24) & 0xFF) + "." +
           std::to_string((ip >> 16) & 0xFF) + "." +
           std::to_string((ip >> 8) & 0xFF) + "." +
           std::to_string(ip & 0xFF) + ":" +
           std::to_string(port);
}

// ============================================================================
// UdpSocket
// ============================================================================

UdpSocket::UdpSocket(uint16_t port) {
    InitializeSockets();

    m_socket = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_socket == INVALID_SOCK) {
        throw std::system_error(SOCKET_ERROR_CODE, std::system_category(), "Failed to create socket");
    }

    if (!SetNonBlocking(m_socket)) {
        int err = SOCKET_ERROR_CODE;
        Close();
        throw std::system_error(err, std::system_category(), "Failed to make socket non-blocking");
    }

    // Allow address reuse
    int reuse = 1;
    setsockopt(m_socket, SOL_SOCKET, SO_REUSEADDR,
        reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = INADDR_ANY;

    if (bind(m_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = SOCKET_ERROR_CODE;
        Close();
        throw std::system_error(err, std::system_category(),
            "Failed to bind UDP port " + std::to_string(port));
    }

    sockaddr_in bound{};
    SockLen boundLen = sizeof(bound);
    if (getsockname(m_socket, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        m_localPort = ntohs(bound.sin_port);
    } else {
        m_localPort = port;
    }
}

UdpSocket::~UdpSocket() {
    Close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : m_socket(other.m_socket)
    , m_localPort(other.m_localPort) {
    other.m_socket = INVALID_SOCK;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        Close();
        m_socket = other.m_socket;
        m_localPort = other.m_localPort;
        other.m_socket = INVALID_SOCK;
    }
    return *this;
}

void UdpSocket::Close() noexcept {
    if (m_socket != INVALID_SOCK) {
        CLOSE_SOCKET(m_socket);
        m_socket = INVALID_SOCK;
    }
}

std::expected<void, NetError> UdpSocket::SendTo(std::span<const uint8_t> data, const UdpAddress& address) {
    sockaddr_in addr = ToSockaddr(address);
    auto sent = sendto(m_socket, reinterpret_cast<const char*>(data.data()),
        static_cast<int>(data.size()), 0,
        reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));

    if (sent < 0) {
        int err = SOCKET_ERROR_CODE;
        if (WOULD_BLOCK(err)) {
            return std::unexpected(NetError::NoMore());
        }
        return std::unexpected(NetError::Transport(
            "sendto " + address.ToString() + " failed: " + ErrorText(err)));
    }
    if (static_cast<size_t>(sent) != data.size()) {
        return std::unexpected(NetError::Transport("Short datagram write to " + address.ToString()));
    }
    return {};
}

std::expected<std::pair<size_t, UdpAddress>, NetError> UdpSocket::RecvFrom(std::span<uint8_t> buffer) {
    sockaddr_in senderAddr{};
    SockLen addrLen = sizeof(senderAddr);

    auto bytesRead = recvfrom(m_socket, reinterpret_cast<char*>(buffer.data()),
        static_cast<int>(buffer.size()), 0,
        reinterpret_cast<sockaddr*>(&senderAddr), &addrLen);

    if (bytesRead < 0) {
        int err = SOCKET_ERROR_CODE;
        if (WOULD_BLOCK(err)) {
            return std::unexpected(NetError::NoMore());
        }
        return std::unexpected(NetError::Transport("recvfrom failed: " + ErrorText(err)));
    }
    return std::make_pair(static_cast<size_t>(bytesRead), FromSockaddr(senderAddr));
}

// ============================================================================
// UdpServer
// ============================================================================

UdpServer::UdpServer(uint16_t port)
    : m_socket(port) {
    VIGILANT_LOG_INFO("UDP server listening on 0.0.0.0:{}", m_socket.GetLocalPort());
}

std::expected<void, NetError> UdpServer::Send(const Message& message, const UdpAddress& address) {
    auto bytes = EncodeMessage(message);
    return m_socket.SendTo(bytes, address);
}

std::expected<std::pair<Message, UdpAddress>, NetError> UdpServer::Recv() {
    std::array<uint8_t, UDP_RECV_BUFFER_SIZE> buffer;

    while (true) {
        auto received = m_socket.RecvFrom(buffer);
        if (!received) {
            return std::unexpected(received.error());
        }

        auto [size, sender] = *received;
        auto message = DecodeMessage(std::span<const uint8_t>(buffer.data(), size));
        if (!message) {
            VIGILANT_LOG_DEBUG("Invalid datagram from {}", sender.ToString());
            continue;
        }
        return std::make_pair(std::move(*message), sender);
    }
}

// ============================================================================
// UdpClient
// ============================================================================

UdpClient::UdpClient(const UdpAddress& server)
    : m_server(server)
    , m_socket(0) {
    VIGILANT_LOG_INFO("UDP client bound to port {}, server {}",
        m_socket.GetLocalPort(), m_server.ToString());
}

UdpClient::UdpClient(std::string_view serverHostPort)
    : UdpClient(ParseOrThrow(serverHostPort)) {}

std::expected<void, NetError> UdpClient::Send(const Message& message) {
    auto bytes = EncodeMessage(message);
    return m_socket.SendTo(bytes, m_server);
}

std::expected<Message, NetError> UdpClient::Recv() {
    std::array<uint8_t, UDP_RECV_BUFFER_SIZE> buffer;

    while (true) {
        auto received = m_socket.RecvFrom(buffer);
        if (!received) {
            return std::unexpected(received.error());
        }

        auto [size, sender] = *received;
        if (sender != m_server) {
            VIGILANT_LOG_DEBUG("Ignoring datagram from non-server address {}", sender.ToString());
            continue;
        }

        auto message = DecodeMessage(std::span<const uint8_t>(buffer.data(), size));
        if (!message) {
            VIGILANT_LOG_DEBUG("Invalid datagram from server");
            continue;
        }
        return std::move(*message);
    }
}

} // namespace Vigilant
