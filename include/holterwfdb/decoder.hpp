/**
 * @file decoder.hpp
 * @brief Binary Holter recording decoder.
 *
 * Layout of a recording of L bytes:
 *
 *     [0, 512)          vendor header, u16 LE sample rate at offset 2
 *     [512, L - 1024)   int16 LE ADC codes (1 LSB = 1 uV)
 *     [L - 1024, L)     annotation footer
 *
 * The header is kept verbatim and otherwise uninterpreted. The sample
 * region is not validated: a well-sized but malformed file decodes to a
 * meaningless signal rather than an error.
 */

#ifndef HOLTERWFDB_DECODER_HPP
#define HOLTERWFDB_DECODER_HPP

#include "config.hpp"

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace holterwfdb {

/**
 * @brief One decoded recording.
 *
 * Owns the raw byte buffer; header() and footer() are views into it.
 */
class Recording {
public:
    Recording(std::vector<std::uint8_t> raw, std::size_t header_size, std::size_t footer_size,
              std::vector<float> signal, std::uint16_t declared_rate, std::uint16_t sample_rate)
        : raw_(std::move(raw)), header_size_(header_size), footer_size_(footer_size),
          signal_(std::move(signal)), declared_rate_(declared_rate), sample_rate_(sample_rate) {}

    [[nodiscard]] std::span<const std::uint8_t> header() const noexcept {
        return {raw_.data(), header_size_};
    }

    [[nodiscard]] std::span<const std::uint8_t> footer() const noexcept {
        return {raw_.data() + (raw_.size() - footer_size_), footer_size_};
    }

    /// Physical samples in mV
    [[nodiscard]] const std::vector<float>& signal() const noexcept {
        return signal_;
    }

    /// Rate field as stored in the header
    [[nodiscard]] std::uint16_t declared_rate() const noexcept {
        return declared_rate_;
    }

    /// Rate used for the output
    [[nodiscard]] std::uint16_t sample_rate() const noexcept {
        return sample_rate_;
    }

    [[nodiscard]] std::size_t file_size() const noexcept {
        return raw_.size();
    }

private:
    std::vector<std::uint8_t> raw_;
    std::size_t header_size_;
    std::size_t footer_size_;
    std::vector<float> signal_;
    std::uint16_t declared_rate_;
    std::uint16_t sample_rate_;
};

/**
 * @brief Decoder for the fixed-layout binary Holter format.
 */
class BinaryHolterDecoder {
public:
    explicit BinaryHolterDecoder(const DecoderConfig& config = DecoderConfig{}) noexcept
        : config_(config) {}

    /**
     * @brief Decode a recording held in memory.
     *
     * @param raw Whole file contents; ownership moves into the Recording
     * @return Decoded recording
     * @throws FormatException if raw is smaller than header + footer
     */
    [[nodiscard]] Recording decode(std::vector<std::uint8_t> raw) const;

    /**
     * @brief Read and decode a recording file.
     *
     * @throws ReadException if the file cannot be read
     * @throws FormatException if the file is smaller than header + footer
     */
    [[nodiscard]] Recording decode_file(const std::string& path) const;

    /**
     * @brief Apply the plausibility guard to a declared rate.
     *
     * @return @p declared if within [min_sample_rate, max_sample_rate],
     *         otherwise default_sample_rate
     */
    [[nodiscard]] std::uint16_t resolve_sample_rate(std::uint16_t declared) const noexcept;

    /**
     * @brief Convert int16 LE ADC codes to physical units.
     *
     * A trailing odd byte is ignored.
     */
    [[nodiscard]] std::vector<float> decode_samples(const std::uint8_t* data,
                                                    std::size_t size) const;

    [[nodiscard]] const DecoderConfig& config() const noexcept {
        return config_;
    }

private:
    DecoderConfig config_;
};

} // namespace holterwfdb

#endif // HOLTERWFDB_DECODER_HPP
