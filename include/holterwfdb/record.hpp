/**
 * @file record.hpp
 * @brief Interchange record naming and the text header (.hea).
 *
 * A record is three files sharing a base name in one directory:
 * <base>.hea (text header), <base>.dat (packed signal) and, when the
 * recording has annotations, <base>.atr.
 *
 * Header layout:
 *
 *     <base> <channels> <frames> <rate>
 *     ECG 212 1 0 <channel * 3> <gain> 0 mV      (one line per channel)
 */

#ifndef HOLTERWFDB_RECORD_HPP
#define HOLTERWFDB_RECORD_HPP

#include "config.hpp"

#include <string>
#include <vector>

namespace holterwfdb {

/**
 * @brief Files making up one interchange record.
 */
enum class FileType {
    Header = 1,
    Data = 2,
    Annotation = 3
};

/**
 * @brief File extension, including the dot.
 */
[[nodiscard]] const char* extension(FileType type) noexcept;

/**
 * @brief Path of one record file: <dir>/<base><extension>.
 */
[[nodiscard]] std::string artifact_path(const std::string& dir, const std::string& base,
                                        FileType type);

/**
 * @brief Record base name for an input path: file name without its last
 * extension.
 */
[[nodiscard]] std::string record_name(const std::string& input_path);

/**
 * @brief Names of the records in @p dir that have a header file, sorted.
 *
 * A missing or unreadable directory yields an empty list.
 */
[[nodiscard]] std::vector<std::string> list_records(const std::string& dir);

/**
 * @brief One channel line of the header.
 */
struct SignalSpec {
    std::string label = "ECG";
    int format = SIGNAL_FORMAT;
    int samples_per_frame = 1;
    int skew = 0;
    std::size_t byte_offset = 0;
    int gain = COUNTS_PER_MV;
    int baseline = 0;
    std::string units = "mV";
};

/**
 * @brief Parsed header file.
 */
struct HeaderInfo {
    std::string record;
    std::size_t channels = 0;
    std::size_t frames = 0;
    std::uint16_t sample_rate = 0;
    std::vector<SignalSpec> signals;
};

/**
 * @brief Render the header text.
 *
 * @param base Record name
 * @param num_frames Frames per channel in the signal file
 * @param sample_rate Effective sample rate
 * @param channels Channel count
 * @param gain Counts per mV, must match the encoder's quantization
 */
[[nodiscard]] std::string format_header(const std::string& base, std::size_t num_frames,
                                        std::uint16_t sample_rate,
                                        std::size_t channels = NUM_CHANNELS,
                                        int gain = COUNTS_PER_MV);

/**
 * @brief Parse header text produced by format_header().
 *
 * @throws InvalidDataException on a malformed record line, a malformed
 *         channel line, or a channel count that does not match the lines
 */
[[nodiscard]] HeaderInfo parse_header(const std::string& text);

/**
 * @brief Read and parse a header file.
 *
 * @throws ReadException if the file cannot be read
 * @throws InvalidDataException if the contents are malformed
 */
[[nodiscard]] HeaderInfo read_header_file(const std::string& path);

} // namespace holterwfdb

#endif // HOLTERWFDB_RECORD_HPP
