/**
 * @file encoder.cpp
 * @brief Interchange record encoder.
 */

#include <holterwfdb/encoder.hpp>

#include <holterwfdb/file_io.hpp>
#include <holterwfdb/mit_annotations.hpp>
#include <holterwfdb/pack212.hpp>
#include <holterwfdb/record.hpp>

#include <cmath>

namespace holterwfdb {

std::vector<std::int16_t> InterchangeEncoder::quantize(const std::vector<float>& signal) const {
    std::vector<std::int16_t> codes(signal.size());
    const auto gain = static_cast<float>(config_.counts_per_mv);
    for (std::size_t i = 0; i < signal.size(); ++i) {
        codes[i] = static_cast<std::int16_t>(std::lrint(signal[i] * gain));
    }
    return codes;
}

std::size_t InterchangeEncoder::frame_count(std::size_t num_samples) const noexcept {
    return normalize_frame_count(num_samples, config_.channels);
}

std::vector<std::uint8_t> InterchangeEncoder::encode_signal(const std::vector<float>& signal) const {
    return pack_frames(quantize(signal), config_.channels);
}

InterchangeArtifacts InterchangeEncoder::encode(const std::vector<float>& signal,
                                                std::uint16_t sample_rate,
                                                const AnnotationStream& annotations,
                                                const std::string& out_dir,
                                                const std::string& base) const {
    ensure_directory(out_dir);

    InterchangeArtifacts artifacts;
    artifacts.num_frames = frame_count(signal.size());

    std::vector<std::uint8_t> packed = encode_signal(signal);
    artifacts.signal_path = artifact_path(out_dir, base, FileType::Data);
    write_file(artifacts.signal_path, packed.data(), packed.size());
    artifacts.signal_bytes = packed.size();

    std::string header = format_header(base, artifacts.num_frames, sample_rate, config_.channels,
                                       config_.counts_per_mv);
    artifacts.header_path = artifact_path(out_dir, base, FileType::Header);
    write_file(artifacts.header_path, header);
    artifacts.header_bytes = header.size();

    if (!annotations.empty()) {
        artifacts.annotation_path = artifact_path(out_dir, base, FileType::Annotation);
        artifacts.annotation_bytes =
            write_annotation_file(artifacts.annotation_path, annotations, sample_rate);
        artifacts.num_annotations = annotations.size();
    }

    return artifacts;
}

} // namespace holterwfdb
