/**
 * @file byte_reader.hpp
 * @brief Little-endian field decoding from raw byte buffers.
 *
 * The binary Holter layout and the MIT annotation format are both
 * little-endian. Fields are decoded explicitly byte by byte so behaviour
 * does not depend on host endianness or on aliasing the buffer as a
 * typed array.
 */

#ifndef HOLTERWFDB_BYTE_READER_HPP
#define HOLTERWFDB_BYTE_READER_HPP

#include "config.hpp"

namespace holterwfdb {

/**
 * @brief Decode an unsigned 16-bit little-endian value.
 * @param data Pointer to at least 2 bytes
 */
[[nodiscard]] inline std::uint16_t read_u16_le(const std::uint8_t* data) noexcept {
    return static_cast<std::uint16_t>(static_cast<std::uint16_t>(data[0]) |
                                      (static_cast<std::uint16_t>(data[1]) << 8U));
}

/**
 * @brief Decode a signed 16-bit little-endian (two's complement) value.
 * @param data Pointer to at least 2 bytes
 */
[[nodiscard]] inline std::int16_t read_i16_le(const std::uint8_t* data) noexcept {
    return static_cast<std::int16_t>(read_u16_le(data));
}

/**
 * @brief Sequential little-endian reader.
 *
 * Tracks a byte position within a borrowed buffer. Reads past the end
 * return 0 without advancing; callers check remaining() first when a
 * short buffer must be reported.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read one byte.
     */
    std::uint8_t read_u8() noexcept {
        if (pos_ + 1 > size_) [[unlikely]] {
            return 0;
        }
        return data_[pos_++];
    }

    /**
     * @brief Read an unsigned 16-bit little-endian value.
     */
    std::uint16_t read_u16() noexcept {
        if (pos_ + 2 > size_) [[unlikely]] {
            return 0;
        }
        std::uint16_t value = read_u16_le(&data_[pos_]);
        pos_ += 2;
        return value;
    }

    /**
     * @brief Read a signed 16-bit little-endian value.
     */
    std::int16_t read_i16() noexcept {
        return static_cast<std::int16_t>(read_u16());
    }

    /**
     * @brief Read a 32-bit value stored as two little-endian 16-bit
     * halves, high half first (PDP-11 order, used by MIT SKIP records).
     */
    std::int32_t read_i32_pdp() noexcept {
        if (pos_ + 4 > size_) [[unlikely]] {
            return 0;
        }
        std::uint32_t high = read_u16();
        std::uint32_t low = read_u16();
        return static_cast<std::int32_t>((high << 16U) | low);
    }

    /**
     * @brief Advance without decoding.
     * @param count Number of bytes to skip (clamped to the end)
     */
    void skip(std::size_t count) noexcept {
        pos_ = (count > remaining()) ? size_ : pos_ + count;
    }

    /**
     * @brief Pointer to the current position.
     */
    [[nodiscard]] const std::uint8_t* current() const noexcept {
        return data_ + pos_;
    }

    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace holterwfdb

#endif // HOLTERWFDB_BYTE_READER_HPP
