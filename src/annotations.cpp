/**
 * @file annotations.cpp
 * @brief Footer annotation extraction.
 */

#include <holterwfdb/annotations.hpp>

#include <holterwfdb/byte_reader.hpp>

#include <algorithm>

namespace holterwfdb {

AnnotationStream AnnotationExtractor::extract(std::span<const std::uint8_t> footer) const {
    AnnotationStream records;
    if (config_.slot_size < 3U) {
        return records;
    }

    const std::size_t num_slots = footer.size() / config_.slot_size;
    records.reserve(num_slots);

    for (std::size_t i = 0; i < num_slots; ++i) {
        const std::uint8_t* slot = footer.data() + i * config_.slot_size;
        std::uint16_t position = read_u16_le(slot);
        if (position == 0) {
            continue;
        }
        records.push_back(Annotation{position, decode_symbol(slot[2])});
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const Annotation& a, const Annotation& b) {
                         return a.position < b.position;
                     });

    AnnotationStream stream;
    stream.reserve(records.size());
    for (const Annotation& record : records) {
        if (stream.empty() || record.position > stream.back().position) {
            stream.push_back(record);
        }
    }

    return stream;
}

char AnnotationExtractor::decode_symbol(std::uint8_t code) const noexcept {
    // Printable Latin-1 other than space, NBSP and soft hyphen
    if ((code > 0x20U && code < 0x7FU) || (code > 0xA0U && code != 0xADU)) {
        return static_cast<char>(code);
    }
    return config_.default_symbol;
}

} // namespace holterwfdb
