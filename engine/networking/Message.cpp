#include "networking/Message.hpp"
#include "networking/ByteOrder.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Vigilant {

namespace {

// Two-character type tags
constexpr std::array<uint8_t, 2> TAG_CLIENT_HELLO = {'h', 'c'};
constexpr std::array<uint8_t, 2> TAG_SERVER_HELLO = {'h', 's'};
constexpr std::array<uint8_t, 2> TAG_DISCONNECTION = {'d', 's'};
constexpr std::array<uint8_t, 2> TAG_PING = {'p', 'i'};
constexpr std::array<uint8_t, 2> TAG_PONG = {'p', 'o'};
constexpr std::array<uint8_t, 2> TAG_START_CONTROL = {'e', 'c'};
constexpr std::array<uint8_t, 2> TAG_ENTITY_UPDATE = {'e', 'u'};
constexpr std::array<uint8_t, 2> TAG_ENTITY_DELETE = {'e', 'r'};

// Blob sizes: control, asteroid state, projectile state, ship state
constexpr std::array<size_t, 4> VALID_BLOB_SIZES = {CONTROL_BLOB_SIZE, 25, 26, 58};

void WriteHeader(std::vector<uint8_t>& out, const std::array<uint8_t, 2>& tag) {
    out.insert(out.end(), PROTOCOL_MAGIC.begin(), PROTOCOL_MAGIC.end());
    out.insert(out.end(), tag.begin(), tag.end());
}

bool TagIs(std::span<const uint8_t> data, const std::array<uint8_t, 2>& tag) {
    return data[6] == tag[0] && data[7] == tag[1];
}

std::optional<Message> Reject(const char* reason, size_t size) {
    VIGILANT_LOG_DEBUG("Dropping datagram ({} bytes): {}", size, reason);
    return std::nullopt;
}

} // anonymous namespace

bool IsValidBlobSize(size_t size) noexcept {
    return std::find(VALID_BLOB_SIZES.begin(), VALID_BLOB_SIZES.end(), size) != VALID_BLOB_SIZES.end();
}

std::vector<uint8_t> EncodeMessage(const Message& message) {
    std::vector<uint8_t> out;
    out.reserve(16);
    ByteWriter writer(out);

    std::visit([&](auto&& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, Msg::ClientHello>) {
            WriteHeader(out, TAG_CLIENT_HELLO);
        } else if constexpr (std::is_same_v<T, Msg::ServerHello>) {
            WriteHeader(out, TAG_SERVER_HELLO);
        } else if constexpr (std::is_same_v<T, Msg::Disconnection>) {
            WriteHeader(out, TAG_DISCONNECTION);
        } else if constexpr (std::is_same_v<T, Msg::Ping>) {
            WriteHeader(out, TAG_PING);
            writer.WriteU32(msg.payload);
        } else if constexpr (std::is_same_v<T, Msg::Pong>) {
            WriteHeader(out, TAG_PONG);
            writer.WriteU32(msg.payload);
        } else if constexpr (std::is_same_v<T, Msg::StartEntityControl>) {
            WriteHeader(out, TAG_START_CONTROL);
            writer.WriteU64(msg.entityId);
        } else if constexpr (std::is_same_v<T, Msg::EntityUpdate>) {
            out.reserve(MESSAGE_HEADER_SIZE + 8 + msg.data.size());
            WriteHeader(out, TAG_ENTITY_UPDATE);
            writer.WriteU64(msg.entityId);
            writer.WriteBytes(msg.data);
        } else if constexpr (std::is_same_v<T, Msg::EntityDelete>) {
            WriteHeader(out, TAG_ENTITY_DELETE);
            writer.WriteU64(msg.entityId);
        }
    }, message);

    return out;
}

std::optional<Message> DecodeMessage(std::span<const uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        return Reject("shorter than header", data.size());
    }
    if (!std::equal(PROTOCOL_MAGIC.begin(), PROTOCOL_MAGIC.end(), data.begin())) {
        return Reject("bad magic", data.size());
    }

    ByteReader reader(data.subspan(MESSAGE_HEADER_SIZE));
    const size_t size = data.size();

    if (TagIs(data, TAG_CLIENT_HELLO)) {
        if (size != 8) return Reject("bad ClientHello length", size);
        return Msg::ClientHello{};
    }
    if (TagIs(data, TAG_SERVER_HELLO)) {
        if (size != 8) return Reject("bad ServerHello length", size);
        return Msg::ServerHello{};
    }
    if (TagIs(data, TAG_DISCONNECTION)) {
        if (size != 8) return Reject("bad Disconnection length", size);
        return Msg::Disconnection{};
    }
    if (TagIs(data, TAG_PING)) {
        if (size != 12) return Reject("bad Ping length", size);
        return Msg::Ping{*reader.ReadU32()};
    }
    if (TagIs(data, TAG_PONG)) {
        if (size != 12) return Reject("bad Pong length", size);
        return Msg::Pong{*reader.ReadU32()};
    }
    if (TagIs(data, TAG_START_CONTROL)) {
        if (size != 16) return Reject("bad StartEntityControl length", size);
        return Msg::StartEntityControl{*reader.ReadU64()};
    }
    if (TagIs(data, TAG_ENTITY_UPDATE)) {
        if (size < 16 || !IsValidBlobSize(size - 16)) {
            return Reject("bad EntityUpdate length", size);
        }
        Msg::EntityUpdate update;
        update.entityId = *reader.ReadU64();
        auto blob = reader.ReadRest();
        update.data.assign(blob.begin(), blob.end());
        return update;
    }
    if (TagIs(data, TAG_ENTITY_DELETE)) {
        if (size != 16) return Reject("bad EntityDelete length", size);
        return Msg::EntityDelete{*reader.ReadU64()};
    }

    return Reject("unknown tag", size);
}

const char* MessageName(const Message& message) noexcept {
    switch (message.index()) {
        case 0: return "ClientHello";
        case 1: return "ServerHello";
        case 2: return "Disconnection";
        case 3: return "Ping";
        case 4: return "Pong";
        case 5: return "StartEntityControl";
        case 6: return "EntityUpdate";
        case 7: return "EntityDelete";
    }
    return "Unknown";
}

} // namespace Vigilant
