/**
 * @file encoder.hpp
 * @brief Interchange record encoder (.dat, .hea, .atr).
 *
 * Pipeline for one recording:
 *
 * 1. Quantize mV samples to int16 codes: round(value * gain).
 * 2. Normalize the sample count to an even number of 3-channel frames
 *    (see normalize_frame_count()).
 * 3. Pack frame pairs per channel with pack12() into <base>.dat.
 * 4. Write the text header <base>.hea.
 * 5. Write <base>.atr when there is at least one annotation.
 */

#ifndef HOLTERWFDB_ENCODER_HPP
#define HOLTERWFDB_ENCODER_HPP

#include "annotations.hpp"
#include "config.hpp"

#include <string>
#include <vector>

namespace holterwfdb {

/**
 * @brief Files written for one record.
 */
struct InterchangeArtifacts {
    std::string signal_path;
    std::size_t signal_bytes = 0;
    std::string header_path;
    std::size_t header_bytes = 0;
    std::string annotation_path; ///< Empty when no annotation file was written
    std::size_t annotation_bytes = 0;
    std::size_t num_frames = 0;
    std::size_t num_annotations = 0;

    [[nodiscard]] bool has_annotations() const noexcept {
        return !annotation_path.empty();
    }
};

/**
 * @brief Writes a physical signal and its annotations as an interchange
 * record.
 */
class InterchangeEncoder {
public:
    explicit InterchangeEncoder(const EncoderConfig& config = EncoderConfig{}) noexcept
        : config_(config) {}

    /**
     * @brief Quantize physical samples to storage codes.
     *
     * Rounds to nearest (ties to even). A result outside the int16 range
     * wraps; it is not clamped.
     */
    [[nodiscard]] std::vector<std::int16_t> quantize(const std::vector<float>& signal) const;

    /**
     * @brief Frames that survive normalization for @p num_samples samples.
     */
    [[nodiscard]] std::size_t frame_count(std::size_t num_samples) const noexcept;

    /**
     * @brief Quantize, normalize and pack a signal.
     * @return Contents of the signal file
     */
    [[nodiscard]] std::vector<std::uint8_t> encode_signal(const std::vector<float>& signal) const;

    /**
     * @brief Write the record files.
     *
     * @param signal Physical samples in mV, frame-major
     * @param sample_rate Effective sample rate
     * @param annotations Monotone annotation stream, possibly empty
     * @param out_dir Output directory, created if missing
     * @param base Record name
     * @return Paths and sizes of the written files
     * @throws WriteException if the directory or any file cannot be written
     */
    InterchangeArtifacts encode(const std::vector<float>& signal, std::uint16_t sample_rate,
                                const AnnotationStream& annotations, const std::string& out_dir,
                                const std::string& base) const;

    [[nodiscard]] const EncoderConfig& config() const noexcept {
        return config_;
    }

private:
    EncoderConfig config_;
};

} // namespace holterwfdb

#endif // HOLTERWFDB_ENCODER_HPP
