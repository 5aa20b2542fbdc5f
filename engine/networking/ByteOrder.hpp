#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

namespace Vigilant {

// ============================================================================
// Big-endian (network order) primitives
// ============================================================================

/**
 * @brief Appends big-endian integers and IEEE-754 floats to a byte vector
 */
class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) : m_out(out) {}

    void WriteU8(uint8_t v) { m_out.push_back(v); }

    void WriteU32(uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            m_out.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void WriteU64(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            m_out.push_back(static_cast<uint8_t>(v >> shift));
        }
    }

    void WriteF32(float v) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        WriteU32(bits);
    }

    void WriteBytes(std::span<const uint8_t> bytes) {
        m_out.insert(m_out.end(), bytes.begin(), bytes.end());
    }

private:
    std::vector<uint8_t>& m_out;
};

/**
 * @brief Reads big-endian values from a byte span, failing on underflow
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : m_data(data) {}

    [[nodiscard]] std::optional<uint8_t> ReadU8() {
        if (Remaining() < 1) return std::nullopt;
        return m_data[m_offset++];
    }

    [[nodiscard]] std::optional<uint32_t> ReadU32() {
        if (Remaining() < 4) return std::nullopt;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v = (v << 8) | m_data[m_offset++];
        }
        return v;
    }

    [[nodiscard]] std::optional<uint64_t> ReadU64() {
        if (Remaining() < 8) return std::nullopt;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | m_data[m_offset++];
        }
        return v;
    }

    [[nodiscard]] std::optional<float> ReadF32() {
        auto bits = ReadU32();
        if (!bits) return std::nullopt;
        float v;
        std::memcpy(&v, &*bits, sizeof(v));
        return v;
    }

    [[nodiscard]] std::span<const uint8_t> ReadRest() {
        auto rest = m_data.subspan(m_offset);
        m_offset = m_data.size();
        return rest;
    }

    [[nodiscard]] size_t Remaining() const noexcept { return m_data.size() - m_offset; }

private:
    std::span<const uint8_t> m_data;
    size_t m_offset = 0;
};

} // namespace Vigilant
