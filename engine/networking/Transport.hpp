#pragma once

#include "networking/Message.hpp"
#include <concepts>
#include <expected>
#include <string>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace Vigilant {

/**
 * @brief Transport error categories
 */
enum class NetErrorCode {
    NoMore,          ///< Nothing to do right now (empty inbound queue, full send buffer)
    TransportError   ///< Underlying I/O failure
};

/**
 * @brief Error returned by transport operations
 */
struct NetError {
    NetErrorCode code = NetErrorCode::NoMore;
    std::string message;

    [[nodiscard]] static NetError NoMore() { return NetError{NetErrorCode::NoMore, {}}; }
    [[nodiscard]] static NetError Transport(std::string message) {
        return NetError{NetErrorCode::TransportError, std::move(message)};
    }

    [[nodiscard]] bool IsNoMore() const noexcept { return code == NetErrorCode::NoMore; }
};

/**
 * @brief Server side of a datagram transport
 *
 * Both calls are non-blocking. Recv returns NetErrorCode::NoMore once the
 * inbound queue is drained; undecodable datagrams are skipped internally.
 *
 * @tparam Address Peer address type (equality comparable, hashable, formattable)
 */
template<typename Address>
class IServer {
public:
    using AddressType = Address;

    virtual ~IServer() = default;

    virtual std::expected<void, NetError> Send(const Message& message, const Address& address) = 0;
    virtual std::expected<std::pair<Message, Address>, NetError> Recv() = 0;
};

/**
 * @brief Client side of a datagram transport, bound to a single server
 */
class IClient {
public:
    virtual ~IClient() = default;

    virtual std::expected<void, NetError> Send(const Message& message) = 0;
    virtual std::expected<Message, NetError> Recv() = 0;
};

/**
 * @brief Render a transport address for logging
 *
 * Uses a ToString() member when the address has one, fmt otherwise.
 */
template<typename Address>
[[nodiscard]] std::string AddressToString(const Address& address) {
    if constexpr (requires { { address.ToString() } -> std::convertible_to<std::string>; }) {
        return address.ToString();
    } else {
        return fmt::format("{}", address);
    }
}

} // namespace Vigilant
