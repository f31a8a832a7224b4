/**
 * @file pack212.hpp
 * @brief 12-bit pair packing of multi-channel frames.
 *
 * Two 12-bit codes of the same channel, taken from consecutive frames,
 * share one 24-bit unit:
 *
 *     packed = ((odd & 0xFFF) << 12) | (even & 0xFFF)
 *
 * stored as its low 3 bytes, least significant first:
 *
 *     byte 0 = even[7:0]
 *     byte 1 = odd[3:0] << 4 | even[11:8]
 *     byte 2 = odd[11:4]
 *
 * Units are emitted pair-major and channel-major within a pair:
 * for frame pair k, channel 0's unit, then channel 1's, then channel 2's.
 *
 * Codes outside [-2048, 2047] wrap modulo 4096; they are never clamped.
 */

#ifndef HOLTERWFDB_PACK212_HPP
#define HOLTERWFDB_PACK212_HPP

#include "config.hpp"

#include <vector>

namespace holterwfdb {

inline constexpr std::uint32_t MASK_12BIT = 0x0FFFU;

/**
 * @brief Codes recovered from one packed unit.
 */
struct SamplePair {
    std::int16_t even;
    std::int16_t odd;

    constexpr bool operator==(const SamplePair& other) const noexcept {
        return even == other.even && odd == other.odd;
    }
};

/**
 * @brief Pack two codes into one 24-bit unit.
 *
 * Each code is reduced to its low 12 bits (two's complement masking), so
 * 2048 packs like -2048 and 4095 like -1.
 *
 * @param even Code from frame 2k
 * @param odd Code from frame 2k+1
 * @return 24-bit unit in the low bits of a 32-bit word
 */
[[nodiscard]] constexpr std::uint32_t pack12(std::int32_t even, std::int32_t odd) noexcept {
    return ((static_cast<std::uint32_t>(odd) & MASK_12BIT) << 12U) |
           (static_cast<std::uint32_t>(even) & MASK_12BIT);
}

/**
 * @brief Sign-extend a 12-bit two's complement value.
 */
[[nodiscard]] constexpr std::int16_t sign_extend12(std::uint32_t value) noexcept {
    auto masked = static_cast<std::int32_t>(value & MASK_12BIT);
    if ((masked & 0x0800) != 0) {
        masked -= 0x1000;
    }
    return static_cast<std::int16_t>(masked);
}

/**
 * @brief Split a 24-bit unit back into its two signed codes.
 */
[[nodiscard]] constexpr SamplePair unpack12(std::uint32_t packed) noexcept {
    return SamplePair{sign_extend12(packed), sign_extend12(packed >> 12U)};
}

/**
 * @brief Number of frames kept for a given raw sample count.
 *
 * 1. An odd count is padded to even by repeating the last sample.
 * 2. The padded count is truncated to a multiple of @p channels.
 * 3. The frame count is truncated to even so every frame has a partner.
 *
 * Anything left over is dropped.
 *
 * @param num_samples Raw sample count
 * @param channels Channels per frame
 * @return Even frame count
 */
[[nodiscard]] constexpr std::size_t normalize_frame_count(std::size_t num_samples,
                                                          std::size_t channels = NUM_CHANNELS) noexcept {
    if (channels == 0) {
        return 0;
    }
    std::size_t padded = num_samples + (num_samples & 1U);
    std::size_t frames = padded / channels;
    return frames - (frames & 1U);
}

/**
 * @brief Samples kept after normalization (frames * channels).
 */
[[nodiscard]] constexpr std::size_t retained_sample_count(std::size_t num_samples,
                                                          std::size_t channels = NUM_CHANNELS) noexcept {
    return normalize_frame_count(num_samples, channels) * channels;
}

/**
 * @brief Size of the packed signal for a given frame count.
 */
[[nodiscard]] constexpr std::size_t packed_size(std::size_t num_frames,
                                                std::size_t channels = NUM_CHANNELS) noexcept {
    return (num_frames / 2U) * channels * PACKED_UNIT_BYTES;
}

/**
 * @brief Normalize and pack a flat, frame-major code sequence.
 *
 * @param codes Interleaved codes (frame 0 channel 0, frame 0 channel 1, ...)
 * @param channels Channels per frame
 * @return Packed bytes, packed_size(normalize_frame_count(codes.size()))
 */
[[nodiscard]] std::vector<std::uint8_t> pack_frames(const std::vector<std::int16_t>& codes,
                                                    std::size_t channels = NUM_CHANNELS);

/**
 * @brief Unpack a signal file back into frame-major codes.
 *
 * @param data Packed bytes
 * @param size Byte count, a multiple of 3 * channels
 * @param channels Channels per frame
 * @return Interleaved codes, two frames per packed pair
 * @throws InvalidDataException if @p size is not a whole number of pairs
 */
[[nodiscard]] std::vector<std::int16_t> unpack_frames(const std::uint8_t* data, std::size_t size,
                                                      std::size_t channels = NUM_CHANNELS);

} // namespace holterwfdb

#endif // HOLTERWFDB_PACK212_HPP
