/**
 * @file pack212.cpp
 * @brief Frame packing and unpacking.
 *
 * The scalar pack12()/unpack12() primitives live in pack212.hpp as
 * constexpr functions; this unit holds the buffer-level loops.
 */

#include <holterwfdb/pack212.hpp>

#include <holterwfdb/byte_buffer.hpp>
#include <holterwfdb/byte_reader.hpp>
#include <holterwfdb/error.hpp>

#include <string>

namespace holterwfdb {

std::vector<std::uint8_t> pack_frames(const std::vector<std::int16_t>& codes, std::size_t channels) {
    const std::size_t num_samples = codes.size();
    const std::size_t num_frames = normalize_frame_count(num_samples, channels);
    const std::size_t num_pairs = num_frames / 2U;

    // Index num_samples only exists as the duplicate of the last sample
    // when the raw count is odd.
    auto sample_at = [&codes, num_samples](std::size_t index) -> std::int32_t {
        return (index < num_samples) ? codes[index] : codes[num_samples - 1U];
    };

    ByteBuffer output;
    output.reserve(packed_size(num_frames, channels));

    for (std::size_t pair = 0; pair < num_pairs; ++pair) {
        const std::size_t even_frame = (2U * pair) * channels;
        const std::size_t odd_frame = even_frame + channels;
        for (std::size_t ch = 0; ch < channels; ++ch) {
            output.append_u24(pack12(sample_at(even_frame + ch), sample_at(odd_frame + ch)));
        }
    }

    return output.take();
}

std::vector<std::int16_t> unpack_frames(const std::uint8_t* data, std::size_t size,
                                        std::size_t channels) {
    const std::size_t pair_bytes = channels * PACKED_UNIT_BYTES;
    if (pair_bytes == 0 || (size % pair_bytes) != 0) {
        throw InvalidDataException("Signal size " + std::to_string(size) +
                                   " is not a whole number of " + std::to_string(channels) +
                                   "-channel frame pairs");
    }

    const std::size_t num_pairs = size / pair_bytes;
    std::vector<std::int16_t> codes(num_pairs * 2U * channels);

    ByteReader reader(data, size);
    for (std::size_t pair = 0; pair < num_pairs; ++pair) {
        const std::size_t even_frame = (2U * pair) * channels;
        const std::size_t odd_frame = even_frame + channels;
        for (std::size_t ch = 0; ch < channels; ++ch) {
            const std::uint8_t* unit = reader.current();
            std::uint32_t packed = static_cast<std::uint32_t>(unit[0]) |
                                   (static_cast<std::uint32_t>(unit[1]) << 8U) |
                                   (static_cast<std::uint32_t>(unit[2]) << 16U);
            reader.skip(PACKED_UNIT_BYTES);

            SamplePair samples = unpack12(packed);
            codes[even_frame + ch] = samples.even;
            codes[odd_frame + ch] = samples.odd;
        }
    }

    return codes;
}

} // namespace holterwfdb
