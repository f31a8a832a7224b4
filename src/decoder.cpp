/**
 * @file decoder.cpp
 * @brief Binary Holter recording decoder.
 */

#include <holterwfdb/decoder.hpp>

#include <holterwfdb/byte_reader.hpp>
#include <holterwfdb/error.hpp>
#include <holterwfdb/file_io.hpp>

namespace holterwfdb {

Recording BinaryHolterDecoder::decode(std::vector<std::uint8_t> raw) const {
    const std::size_t min_size = config_.header_size + config_.footer_size;
    if (raw.size() < min_size) {
        throw FormatException("Recording too small: " + std::to_string(raw.size()) +
                              " bytes, need at least " + std::to_string(min_size));
    }

    std::uint16_t declared = 0;
    if (config_.sample_rate_offset + 2U <= config_.header_size) {
        declared = read_u16_le(&raw[config_.sample_rate_offset]);
    }

    const std::size_t region_size = raw.size() - min_size;
    std::vector<float> signal = decode_samples(raw.data() + config_.header_size, region_size);

    const std::size_t header_size = config_.header_size;
    const std::size_t footer_size = config_.footer_size;
    return Recording(std::move(raw), header_size, footer_size, std::move(signal), declared,
                     resolve_sample_rate(declared));
}

Recording BinaryHolterDecoder::decode_file(const std::string& path) const {
    return decode(read_file(path));
}

std::uint16_t BinaryHolterDecoder::resolve_sample_rate(std::uint16_t declared) const noexcept {
    if (declared >= config_.min_sample_rate && declared <= config_.max_sample_rate) {
        return declared;
    }
    return config_.default_sample_rate;
}

std::vector<float> BinaryHolterDecoder::decode_samples(const std::uint8_t* data,
                                                       std::size_t size) const {
    const std::size_t num_samples = size / 2U;
    std::vector<float> signal(num_samples);

    ByteReader reader(data, num_samples * 2U);
    for (std::size_t i = 0; i < num_samples; ++i) {
        signal[i] = static_cast<float>(reader.read_i16()) * config_.adc_scale;
    }

    return signal;
}

} // namespace holterwfdb
