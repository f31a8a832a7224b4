/**
 * @file holterwfdb.cpp
 * @brief High-level conversion.
 */

#include <holterwfdb/holterwfdb.hpp>

#include <holterwfdb/file_io.hpp>

#include <utility>

namespace holterwfdb {

ConversionReport convert(std::vector<std::uint8_t> raw, const std::string& base,
                         const std::string& output_dir, const ConverterConfig& config) {
    BinaryHolterDecoder decoder(config.decoder);
    AnnotationExtractor extractor(config.extractor);
    InterchangeEncoder encoder(config.encoder);

    ConversionReport report;
    report.record = base;
    report.input_bytes = raw.size();

    Recording recording = decoder.decode(std::move(raw));
    report.declared_rate = recording.declared_rate();
    report.sample_rate = recording.sample_rate();

    const std::size_t num_samples = recording.signal().size();
    report.raw_samples = num_samples;
    report.padded_samples = num_samples & 1U;

    AnnotationStream annotations = extractor.extract(recording.footer());
    report.artifacts = encoder.encode(recording.signal(), recording.sample_rate(), annotations,
                                      output_dir, base);

    const std::size_t retained = report.artifacts.num_frames * config.encoder.channels;
    report.dropped_samples = num_samples + report.padded_samples - retained;
    return report;
}

ConversionReport convert_file(const std::string& input_path, const std::string& output_dir,
                              const ConverterConfig& config) {
    return convert(read_file(input_path), record_name(input_path), output_dir, config);
}

} // namespace holterwfdb
