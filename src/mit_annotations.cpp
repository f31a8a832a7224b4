/**
 * @file mit_annotations.cpp
 * @brief MIT-format annotation file encoding and decoding.
 */

#include <holterwfdb/mit_annotations.hpp>

#include <holterwfdb/byte_buffer.hpp>
#include <holterwfdb/byte_reader.hpp>
#include <holterwfdb/error.hpp>
#include <holterwfdb/file_io.hpp>

#include <cstdlib>
#include <cstring>
#include <string>

namespace holterwfdb {

namespace detail {
// Index is the annotation code; '\0' marks unassigned codes.
inline constexpr char CODE_SYMBOLS[42] = {
    '\0', 'N', 'L', 'R', 'a', 'V', 'F', 'J', 'A', 'S',  // 0-9
    'E',  'j', '/', 'Q', '~', '\0', '|', '\0', 's', 'T', // 10-19
    '*',  'D', '"', '=', 'p', 'B', '^', 't', '+', 'u',  // 20-29
    '?',  '!', '[', ']', 'e', 'n', '@', 'x', 'f', '(',  // 30-39
    ')',  'r'                                           // 40-41
};

struct Entry {
    std::int64_t time;
    int code;
    std::string aux;
};

void append_aux(ByteBuffer& out, const std::string& aux) {
    if (aux.size() > mit::MAX_AUX_LENGTH) {
        throw InvalidArgumentException("AUX string longer than 255 bytes");
    }
    out.append_u16(static_cast<std::uint16_t>((mit::AUX << mit::CODE_SHIFT) | aux.size()));
    out.append_bytes(reinterpret_cast<const std::uint8_t*>(aux.data()), aux.size());
    if ((aux.size() & 1U) != 0) {
        out.append_u8(0);
    }
}
} // namespace detail

int annotation_code(char symbol) noexcept {
    if (symbol == '\0') {
        return 0;
    }
    for (int code = 1; code < static_cast<int>(sizeof(detail::CODE_SYMBOLS)); ++code) {
        if (detail::CODE_SYMBOLS[code] == symbol) {
            return code;
        }
    }
    return 0;
}

char annotation_symbol(int code) noexcept {
    if (code < 0 || code >= static_cast<int>(sizeof(detail::CODE_SYMBOLS))) {
        return '\0';
    }
    return detail::CODE_SYMBOLS[code];
}

std::vector<std::uint8_t> encode_mit_annotations(const AnnotationStream& stream,
                                                 std::uint16_t sample_rate) {
    ByteBuffer out;
    out.reserve(32U + stream.size() * 4U);

    out.append_u16(static_cast<std::uint16_t>(mit::NOTE << mit::CODE_SHIFT));
    detail::append_aux(out, mit::TIME_RESOLUTION_PREFIX + std::to_string(sample_rate));

    std::uint32_t previous = 0;
    for (const Annotation& annotation : stream) {
        if (annotation.position < previous ||
            annotation.position - previous > mit::MAX_SKIP_INTERVAL) {
            throw InvalidArgumentException("Annotation at " + std::to_string(annotation.position) +
                                           " is not within a SKIP interval after " +
                                           std::to_string(previous));
        }

        std::uint32_t delta = annotation.position - previous;
        if (delta > mit::MAX_INTERVAL) {
            out.append_u16(static_cast<std::uint16_t>(mit::SKIP << mit::CODE_SHIFT));
            out.append_i32_pdp(static_cast<std::int32_t>(delta));
            delta = 0;
        }

        int code = annotation_code(annotation.symbol);
        bool carry_symbol = (code == 0);
        if (carry_symbol) {
            code = mit::NOTE;
        }

        out.append_u16(static_cast<std::uint16_t>((code << mit::CODE_SHIFT) |
                                                  (delta & mit::DATA_MASK)));
        if (carry_symbol) {
            detail::append_aux(out, std::string(1, annotation.symbol));
        }
        previous = annotation.position;
    }

    out.append_u16(0);
    return out.take();
}

MitAnnotations decode_mit_annotations(const std::uint8_t* data, std::size_t size) {
    std::vector<detail::Entry> entries;
    ByteReader reader(data, size);
    std::int64_t time = 0;

    while (reader.remaining() >= 2U) {
        std::uint16_t word = reader.read_u16();
        if (word == 0) {
            break;
        }

        int code = word >> mit::CODE_SHIFT;
        switch (code) {
        case mit::SKIP:
            if (reader.remaining() < 4U) {
                throw InvalidDataException("Annotation file ended inside a SKIP record");
            }
            time += reader.read_i32_pdp();
            break;
        case mit::NUM:
        case mit::SUB:
        case mit::CHAN:
            break;
        case mit::AUX: {
            std::size_t length = word & 0xFFU;
            std::size_t padded = length + (length & 1U);
            if (reader.remaining() < padded) {
                throw InvalidDataException("Annotation file ended inside an AUX string");
            }
            if (entries.empty()) {
                throw InvalidDataException("AUX string without a preceding annotation");
            }
            entries.back().aux.assign(reinterpret_cast<const char*>(reader.current()), length);
            reader.skip(padded);
            break;
        }
        default:
            time += word & mit::DATA_MASK;
            entries.push_back(detail::Entry{time, code, std::string()});
            break;
        }
    }

    if (reader.remaining() == 1U) {
        throw InvalidDataException("Annotation file has a trailing odd byte");
    }

    MitAnnotations result;
    const std::size_t prefix_length = std::strlen(mit::TIME_RESOLUTION_PREFIX);
    for (const detail::Entry& entry : entries) {
        if (entry.code == mit::NOTE && entry.aux.compare(0, prefix_length,
                                                         mit::TIME_RESOLUTION_PREFIX) == 0) {
            double rate = std::strtod(entry.aux.c_str() + prefix_length, nullptr);
            result.sample_rate = static_cast<std::uint16_t>(rate);
            continue;
        }

        char symbol = annotation_symbol(entry.code);
        if (entry.code == mit::NOTE && entry.aux.size() == 1U) {
            symbol = entry.aux[0];
        }
        if (symbol == '\0') {
            throw InvalidDataException("Unknown annotation code " + std::to_string(entry.code));
        }
        if (entry.time < 0 || entry.time > 0xFFFFFFFFLL) {
            throw InvalidDataException("Annotation position out of range: " +
                                       std::to_string(entry.time));
        }
        result.annotations.push_back(Annotation{static_cast<std::uint32_t>(entry.time), symbol});
    }

    return result;
}

std::size_t write_annotation_file(const std::string& path, const AnnotationStream& stream,
                                  std::uint16_t sample_rate) {
    std::vector<std::uint8_t> bytes = encode_mit_annotations(stream, sample_rate);
    write_file(path, bytes.data(), bytes.size());
    return bytes.size();
}

MitAnnotations read_annotation_file(const std::string& path) {
    std::vector<std::uint8_t> bytes = read_file(path);
    return decode_mit_annotations(bytes.data(), bytes.size());
}

} // namespace holterwfdb
