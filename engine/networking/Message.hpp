#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace Vigilant {

// ============================================================================
// Wire Protocol
// ============================================================================

/// Every datagram starts with this magic and protocol version
inline constexpr std::array<uint8_t, 6> PROTOCOL_MAGIC = {'S', 'P', 'A', 'C', 0x00, 0x01};

/// Magic plus the two-character type tag
inline constexpr size_t MESSAGE_HEADER_SIZE = 8;

/// Size of a client control blob carried by EntityUpdate
inline constexpr size_t CONTROL_BLOB_SIZE = 9;

namespace Msg {

/** @brief Client requests to join */
struct ClientHello {
    bool operator==(const ClientHello&) const = default;
};

/** @brief Server accepts the connection */
struct ServerHello {
    bool operator==(const ServerHello&) const = default;
};

/** @brief Either side tears the link down */
struct Disconnection {
    bool operator==(const Disconnection&) const = default;
};

/** @brief Latency probe carrying an opaque (usually time-encoded) value */
struct Ping {
    uint32_t payload = 0;
    bool operator==(const Ping&) const = default;
};

/** @brief Echo of a Ping payload */
struct Pong {
    uint32_t payload = 0;
    bool operator==(const Pong&) const = default;
};

/** @brief Server grants the client authority over a replicated entity */
struct StartEntityControl {
    uint64_t entityId = 0;
    bool operator==(const StartEntityControl&) const = default;
};

/** @brief Entity state (server to client) or control blob (client to server) */
struct EntityUpdate {
    uint64_t entityId = 0;
    std::vector<uint8_t> data;
    bool operator==(const EntityUpdate&) const = default;
};

/** @brief The named replicated entity no longer exists */
struct EntityDelete {
    uint64_t entityId = 0;
    bool operator==(const EntityDelete&) const = default;
};

} // namespace Msg

using Message = std::variant<
    Msg::ClientHello,
    Msg::ServerHello,
    Msg::Disconnection,
    Msg::Ping,
    Msg::Pong,
    Msg::StartEntityControl,
    Msg::EntityUpdate,
    Msg::EntityDelete
>;

/**
 * @brief Serialize a message into a datagram
 */
[[nodiscard]] std::vector<uint8_t> EncodeMessage(const Message& message);

/**
 * @brief Parse a datagram
 *
 * Returns nothing for short buffers, a foreign magic, an unknown tag, a
 * length that does not match the tag, or an EntityUpdate whose blob size
 * is not one of the known blob sizes. Never throws.
 */
[[nodiscard]] std::optional<Message> DecodeMessage(std::span<const uint8_t> data);

/**
 * @brief Whether an EntityUpdate blob of this size may appear on the wire
 */
[[nodiscard]] bool IsValidBlobSize(size_t size) noexcept;

/**
 * @brief Short human readable name ("Ping", "EntityUpdate", ...)
 */
[[nodiscard]] const char* MessageName(const Message& message) noexcept;

} // namespace Vigilant
