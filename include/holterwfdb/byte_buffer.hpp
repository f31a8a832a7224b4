/**
 * @file byte_buffer.hpp
 * @brief Growing little-endian byte buffer for building output files.
 *
 * Counterpart of ByteReader. Every multi-byte value is appended least
 * significant byte first, except the explicit PDP-11 ordered 32-bit
 * writer used by MIT SKIP records.
 */

#ifndef HOLTERWFDB_BYTE_BUFFER_HPP
#define HOLTERWFDB_BYTE_BUFFER_HPP

#include "config.hpp"

#include <utility>
#include <vector>

namespace holterwfdb {

/**
 * @brief Store an unsigned 16-bit value little-endian.
 * @param out Destination, at least 2 bytes
 */
inline void write_u16_le(std::uint8_t* out, std::uint16_t value) noexcept {
    out[0] = static_cast<std::uint8_t>(value & 0xFFU);
    out[1] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
}

/**
 * @brief Store the low 24 bits of a value little-endian.
 *
 * The fourth byte of the 32-bit word is dropped.
 *
 * @param out Destination, at least 3 bytes
 */
inline void write_u24_le(std::uint8_t* out, std::uint32_t value) noexcept {
    out[0] = static_cast<std::uint8_t>(value & 0xFFU);
    out[1] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
    out[2] = static_cast<std::uint8_t>((value >> 16U) & 0xFFU);
}

/**
 * @brief Append-only byte buffer.
 */
class ByteBuffer {
public:
    ByteBuffer() = default;

    /**
     * @brief Pre-allocate capacity.
     * @param bytes Expected final size
     */
    void reserve(std::size_t bytes) {
        data_.reserve(bytes);
    }

    void clear() noexcept {
        data_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return data_.size();
    }

    [[nodiscard]] const std::uint8_t* data() const noexcept {
        return data_.data();
    }

    void append_u8(std::uint8_t value) {
        data_.push_back(value);
    }

    void append_u16(std::uint16_t value) {
        std::uint8_t bytes[2];
        write_u16_le(bytes, value);
        data_.insert(data_.end(), bytes, bytes + 2);
    }

    /**
     * @brief Append the low 3 bytes of a packed 24-bit unit.
     */
    void append_u24(std::uint32_t value) {
        std::uint8_t bytes[3];
        write_u24_le(bytes, value);
        data_.insert(data_.end(), bytes, bytes + 3);
    }

    /**
     * @brief Append a 32-bit value as high 16 bits then low 16 bits,
     * each little-endian.
     */
    void append_i32_pdp(std::int32_t value) {
        auto stored = static_cast<std::uint32_t>(value);
        append_u16(static_cast<std::uint16_t>(stored >> 16U));
        append_u16(static_cast<std::uint16_t>(stored & 0xFFFFU));
    }

    void append_bytes(const std::uint8_t* bytes, std::size_t count) {
        data_.insert(data_.end(), bytes, bytes + count);
    }

    /**
     * @brief Release the accumulated bytes.
     */
    std::vector<std::uint8_t> take() noexcept {
        return std::move(data_);
    }

private:
    std::vector<std::uint8_t> data_;
};

} // namespace holterwfdb

#endif // HOLTERWFDB_BYTE_BUFFER_HPP
