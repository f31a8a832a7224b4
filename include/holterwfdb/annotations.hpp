/**
 * @file annotations.hpp
 * @brief Footer annotation extraction.
 *
 * The footer is a table of 4-byte slots:
 *
 *     [0, 2)  u16 LE sample position (0 = empty slot)
 *     [2]     symbol code
 *     [3]     unused
 *
 * The device's symbol vocabulary is unknown, so decoding is best-effort:
 * printable Latin-1 codes are taken literally and anything else becomes the
 * default symbol.
 */

#ifndef HOLTERWFDB_ANNOTATIONS_HPP
#define HOLTERWFDB_ANNOTATIONS_HPP

#include "config.hpp"

#include <span>
#include <vector>

namespace holterwfdb {

/**
 * @brief One annotation: sample position and beat/event symbol.
 */
struct Annotation {
    std::uint32_t position;
    char symbol;

    bool operator==(const Annotation& other) const noexcept {
        return position == other.position && symbol == other.symbol;
    }
};

/// Annotations with strictly increasing positions
using AnnotationStream = std::vector<Annotation>;

/**
 * @brief Decodes footer slots into a monotone annotation stream.
 */
class AnnotationExtractor {
public:
    explicit AnnotationExtractor(const ExtractorConfig& config = ExtractorConfig{}) noexcept
        : config_(config) {}

    /**
     * @brief Extract the annotation stream from a footer.
     *
     * Slots are decoded in order, empty slots skipped, the records stably
     * sorted by position and then scanned forward keeping only positions
     * strictly greater than the last kept one. Duplicates and regressions
     * are dropped, never merged.
     *
     * @param footer Footer bytes; a trailing partial slot is ignored
     * @return Possibly empty stream
     */
    [[nodiscard]] AnnotationStream extract(std::span<const std::uint8_t> footer) const;

    /**
     * @brief Map a symbol code to a symbol character.
     *
     * @return The code itself for printable, non-whitespace Latin-1
     *         characters (0x21-0x7E, 0xA1-0xFF except 0xAD), otherwise
     *         the default symbol
     */
    [[nodiscard]] char decode_symbol(std::uint8_t code) const noexcept;

private:
    ExtractorConfig config_;
};

} // namespace holterwfdb

#endif // HOLTERWFDB_ANNOTATIONS_HPP
