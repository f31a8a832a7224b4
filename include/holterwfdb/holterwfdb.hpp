/**
 * @file holterwfdb.hpp
 * @brief High-level binary Holter to interchange record conversion.
 *
 * Runs the whole pipeline for one recording: BinaryHolterDecoder, then
 * AnnotationExtractor on the footer and InterchangeEncoder on the signal.
 * Each call owns its buffers and touches no shared state, so independent
 * conversions may run concurrently as long as they write to different
 * output directories.
 */

#ifndef HOLTERWFDB_HPP
#define HOLTERWFDB_HPP

#include "annotations.hpp"
#include "byte_buffer.hpp"
#include "byte_reader.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "mit_annotations.hpp"
#include "pack212.hpp"
#include "record.hpp"

#include <string>
#include <vector>

namespace holterwfdb {

/**
 * @brief Settings for every stage of a conversion.
 */
struct ConverterConfig {
    DecoderConfig decoder;
    ExtractorConfig extractor;
    EncoderConfig encoder;
};

/**
 * @brief Outcome of one conversion.
 */
struct ConversionReport {
    std::string record;
    std::size_t input_bytes = 0;
    std::uint16_t declared_rate = 0;
    std::uint16_t sample_rate = 0;
    std::size_t raw_samples = 0;
    std::size_t padded_samples = 0;  ///< 1 when the last sample was duplicated
    std::size_t dropped_samples = 0; ///< Samples discarded by normalization
    InterchangeArtifacts artifacts;
};

/**
 * @brief Convert a recording held in memory.
 *
 * @param raw Whole recording
 * @param base Record name for the output files
 * @param output_dir Output directory, created if missing
 * @param config Stage settings
 * @throws FormatException if raw is smaller than header + footer
 * @throws WriteException on output failure
 */
ConversionReport convert(std::vector<std::uint8_t> raw, const std::string& base,
                         const std::string& output_dir,
                         const ConverterConfig& config = ConverterConfig{});

/**
 * @brief Convert a recording file.
 *
 * The record name is the input file name without its extension.
 *
 * @throws ReadException if the input cannot be read
 * @throws FormatException if the input is smaller than header + footer
 * @throws WriteException on output failure
 */
ConversionReport convert_file(const std::string& input_path, const std::string& output_dir,
                              const ConverterConfig& config = ConverterConfig{});

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace holterwfdb

#endif // HOLTERWFDB_HPP
