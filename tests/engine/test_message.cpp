/**
 * @file test_message.cpp
 * @brief Unit tests for the datagram codec
 */

#include <gtest/gtest.h>

#include "networking/Message.hpp"

#include <string>
#include <vector>

using namespace Vigilant;

namespace {

std::vector<uint8_t> Header(char a, char b) {
    return {'S', 'P', 'A', 'C', 0x00, 0x01, static_cast<uint8_t>(a), static_cast<uint8_t>(b)};
}

} // anonymous namespace

// =============================================================================
// Encoding
// =============================================================================

TEST(MessageEncodeTest, ClientHelloIsBareHeader) {
    EXPECT_EQ(Header('h', 'c'), EncodeMessage(Msg::ClientHello{}));
}

TEST(MessageEncodeTest, PingPayloadIsBigEndian) {
    auto expected = Header('p', 'i');
    expected.insert(expected.end(), {0x12, 0x34, 0x56, 0x78});

    EXPECT_EQ(expected, EncodeMessage(Msg::Ping{0x12345678}));
}

TEST(MessageEncodeTest, EntityUpdateCarriesIdThenBlob) {
    std::vector<uint8_t> blob(25, 0xAB);
    auto encoded = EncodeMessage(Msg::EntityUpdate{0x0102030405060708ull, blob});

    ASSERT_EQ(16u + 25u, encoded.size());
    EXPECT_EQ('e', encoded[6]);
    EXPECT_EQ('u', encoded[7]);
    for (size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(i + 1, encoded[8 + i]);
    }
    EXPECT_EQ(0xAB, encoded.back());
}

TEST(MessageEncodeTest, TagsMatchWireFormat) {
    const std::vector<std::pair<Message, std::string>> cases = {
        {Msg::ClientHello{}, "hc"},
        {Msg::ServerHello{}, "hs"},
        {Msg::Disconnection{}, "ds"},
        {Msg::Ping{1}, "pi"},
        {Msg::Pong{1}, "po"},
        {Msg::StartEntityControl{1}, "ec"},
        {Msg::EntityUpdate{1, std::vector<uint8_t>(CONTROL_BLOB_SIZE)}, "eu"},
        {Msg::EntityDelete{1}, "er"},
    };

    for (const auto& [message, tag] : cases) {
        auto encoded = EncodeMessage(message);
        ASSERT_GE(encoded.size(), MESSAGE_HEADER_SIZE);
        EXPECT_EQ(tag, std::string(encoded.begin() + 6, encoded.begin() + 8)) << MessageName(message);
    }
}

// =============================================================================
// Round Trip
// =============================================================================

TEST(MessageRoundTripTest, EveryVariantSurvives) {
    const std::vector<Message> messages = {
        Msg::ClientHello{},
        Msg::ServerHello{},
        Msg::Disconnection{},
        Msg::Ping{0xDEADBEEF},
        Msg::Pong{42},
        Msg::StartEntityControl{0x100000002ull},
        Msg::EntityUpdate{7, std::vector<uint8_t>(9, 1)},
        Msg::EntityUpdate{8, std::vector<uint8_t>(25, 2)},
        Msg::EntityUpdate{9, std::vector<uint8_t>(26, 3)},
        Msg::EntityUpdate{10, std::vector<uint8_t>(58, 4)},
        Msg::EntityDelete{~uint64_t{0}},
    };

    for (const auto& message : messages) {
        auto decoded = DecodeMessage(EncodeMessage(message));
        ASSERT_TRUE(decoded.has_value()) << MessageName(message);
        EXPECT_EQ(message, *decoded) << MessageName(message);
    }
}

// =============================================================================
// Rejection
// =============================================================================

TEST(MessageDecodeTest, RejectsShortBuffers) {
    auto encoded = EncodeMessage(Msg::ClientHello{});

    for (size_t length = 0; length < MESSAGE_HEADER_SIZE; ++length) {
        EXPECT_FALSE(DecodeMessage(std::span<const uint8_t>(encoded.data(), length)).has_value())
            << "length " << length;
    }
}

TEST(MessageDecodeTest, RejectsCorruptedMagic) {
    auto encoded = EncodeMessage(Msg::ServerHello{});
    encoded[0] = 'X';
    EXPECT_FALSE(DecodeMessage(encoded).has_value());

    encoded = EncodeMessage(Msg::ServerHello{});
    encoded[5] = 0x02;  // Protocol version
    EXPECT_FALSE(DecodeMessage(encoded).has_value());
}

TEST(MessageDecodeTest, RejectsUnknownTag) {
    EXPECT_FALSE(DecodeMessage(Header('z', 'z')).has_value());
}

TEST(MessageDecodeTest, RejectsLengthMismatch) {
    auto hello = EncodeMessage(Msg::ClientHello{});
    hello.push_back(0);
    EXPECT_FALSE(DecodeMessage(hello).has_value());

    auto ping = EncodeMessage(Msg::Ping{1});
    ping.pop_back();
    EXPECT_FALSE(DecodeMessage(ping).has_value());

    auto control = EncodeMessage(Msg::StartEntityControl{1});
    control.push_back(0);
    EXPECT_FALSE(DecodeMessage(control).has_value());

    auto deletion = EncodeMessage(Msg::EntityDelete{1});
    deletion.pop_back();
    EXPECT_FALSE(DecodeMessage(deletion).has_value());
}

TEST(MessageDecodeTest, RejectsUnknownBlobSizes) {
    for (size_t blob : {0u, 1u, 8u, 10u, 24u, 27u, 57u, 59u, 200u}) {
        auto encoded = EncodeMessage(Msg::EntityUpdate{1, std::vector<uint8_t>(blob)});
        EXPECT_FALSE(DecodeMessage(encoded).has_value()) << "blob size " << blob;
    }
}

TEST(MessageDecodeTest, KnownBlobSizes) {
    EXPECT_TRUE(IsValidBlobSize(9));
    EXPECT_TRUE(IsValidBlobSize(25));
    EXPECT_TRUE(IsValidBlobSize(26));
    EXPECT_TRUE(IsValidBlobSize(58));
    EXPECT_FALSE(IsValidBlobSize(57));
}

TEST(MessageDecodeTest, EntityUpdateShorterThanIdIsRejected) {
    auto encoded = Header('e', 'u');
    encoded.insert(encoded.end(), {0, 0, 0, 1});

    EXPECT_FALSE(DecodeMessage(encoded).has_value());
}
