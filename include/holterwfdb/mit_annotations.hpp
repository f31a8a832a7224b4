/**
 * @file mit_annotations.hpp
 * @brief MIT-format annotation file (.atr) encoding.
 *
 * An MIT annotation file is a sequence of 16-bit little-endian words:
 *
 *     bits 15..10  annotation code (0-63)
 *     bits  9..0   samples since the previous annotation
 *
 * Codes 59-63 are pseudo-annotations that modify the current record:
 *
 *     59 SKIP  followed by a 32-bit interval, high 16 bits first
 *     60 NUM   10-bit annotation number
 *     61 SUB   10-bit subtype
 *     62 CHAN  10-bit channel
 *     63 AUX   low 8 bits give the length of a byte string that follows,
 *              padded to an even length
 *
 * A zero word ends the file. The sampling frequency is recorded as a NOTE
 * annotation at sample 0 carrying "## time resolution: <rate>".
 */

#ifndef HOLTERWFDB_MIT_ANNOTATIONS_HPP
#define HOLTERWFDB_MIT_ANNOTATIONS_HPP

#include "annotations.hpp"
#include "config.hpp"

#include <string>
#include <vector>

namespace holterwfdb {

namespace mit {
inline constexpr int CODE_SHIFT = 10;
inline constexpr std::uint16_t DATA_MASK = 0x03FFU;
inline constexpr std::uint32_t MAX_INTERVAL = 0x03FFU;
inline constexpr std::uint32_t MAX_SKIP_INTERVAL = 0x7FFFFFFFU;
inline constexpr int NOTE = 22;
inline constexpr int SKIP = 59;
inline constexpr int NUM = 60;
inline constexpr int SUB = 61;
inline constexpr int CHAN = 62;
inline constexpr int AUX = 63;
inline constexpr std::size_t MAX_AUX_LENGTH = 255U;
inline constexpr const char* TIME_RESOLUTION_PREFIX = "## time resolution: ";
} // namespace mit

/**
 * @brief Standard annotation code for a symbol.
 *
 * Covers the beat and non-beat symbols of the MIT code table
 * (N=1, L=2, R=3, ..., r=41).
 *
 * @return Code in 1-41, or 0 if the symbol is not in the table
 */
[[nodiscard]] int annotation_code(char symbol) noexcept;

/**
 * @brief Symbol for a standard annotation code.
 *
 * @return Symbol, or '\0' for unassigned and pseudo codes
 */
[[nodiscard]] char annotation_symbol(int code) noexcept;

/**
 * @brief Contents of a decoded annotation file.
 */
struct MitAnnotations {
    std::uint16_t sample_rate = 0; ///< 0 when the file has no time resolution note
    AnnotationStream annotations;
};

/**
 * @brief Encode an annotation stream as an MIT annotation file.
 *
 * Symbols outside the code table are written as NOTE annotations whose
 * AUX string is the symbol itself, so decoding recovers them.
 *
 * @param stream Annotations with strictly increasing positions
 * @param sample_rate Rate written to the time resolution note
 * @return File contents, including the terminating zero word
 * @throws InvalidArgumentException if positions decrease or two
 *         consecutive positions are more than 2^31 - 1 samples apart
 */
[[nodiscard]] std::vector<std::uint8_t> encode_mit_annotations(const AnnotationStream& stream,
                                                               std::uint16_t sample_rate);

/**
 * @brief Decode an MIT annotation file.
 *
 * Inverse of encode_mit_annotations(). NUM, SUB and CHAN fields are read
 * and discarded.
 *
 * @throws InvalidDataException on truncated records or unknown codes
 */
[[nodiscard]] MitAnnotations decode_mit_annotations(const std::uint8_t* data, std::size_t size);

/**
 * @brief Encode and write an annotation file.
 *
 * @return Bytes written
 * @throws WriteException on I/O failure
 */
std::size_t write_annotation_file(const std::string& path, const AnnotationStream& stream,
                                  std::uint16_t sample_rate);

/**
 * @brief Read and decode an annotation file.
 *
 * @throws ReadException if the file cannot be read
 * @throws InvalidDataException if the contents are malformed
 */
[[nodiscard]] MitAnnotations read_annotation_file(const std::string& path);

} // namespace holterwfdb

#endif // HOLTERWFDB_MIT_ANNOTATIONS_HPP
