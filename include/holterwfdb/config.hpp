/**
 * @file config.hpp
 * @brief holterwfdb compile-time configuration.
 *
 * Fixed layout of the binary Holter recording and the assumed scale
 * constants of the WFDB-style output. The values below are reverse
 * engineered from device captures, not taken from a published device
 * specification, so each can be overridden at build time with the
 * corresponding HOLTERWFDB_* macro, or at run time through the config
 * structs passed to the decoder, extractor and encoder.
 */

#ifndef HOLTERWFDB_CONFIG_HPP
#define HOLTERWFDB_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace holterwfdb {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup layout Binary Holter Layout
 * @{
 */

/// Size of the leading vendor header in bytes
#ifndef HOLTERWFDB_HEADER_SIZE
#define HOLTERWFDB_HEADER_SIZE 512U
#endif

/// Size of the trailing annotation footer in bytes
#ifndef HOLTERWFDB_FOOTER_SIZE
#define HOLTERWFDB_FOOTER_SIZE 1024U
#endif

inline constexpr std::size_t HEADER_SIZE = HOLTERWFDB_HEADER_SIZE;
inline constexpr std::size_t FOOTER_SIZE = HOLTERWFDB_FOOTER_SIZE;
inline constexpr std::size_t MIN_FILE_SIZE = HEADER_SIZE + FOOTER_SIZE;

/// Header offset of the little-endian u16 sample rate field
inline constexpr std::size_t SAMPLE_RATE_OFFSET = 2U;

/// Footer slot: u16 position, u8 symbol code, u8 unused
inline constexpr std::size_t ANNOTATION_SLOT_SIZE = 4U;

/** @} */

/**
 * @defgroup scale Signal Scale Assumptions
 * @{
 */

#ifndef HOLTERWFDB_DEFAULT_SAMPLE_RATE
#define HOLTERWFDB_DEFAULT_SAMPLE_RATE 256U
#endif

inline constexpr std::uint16_t DEFAULT_SAMPLE_RATE = HOLTERWFDB_DEFAULT_SAMPLE_RATE;
inline constexpr std::uint16_t MIN_SAMPLE_RATE = 100U;
inline constexpr std::uint16_t MAX_SAMPLE_RATE = 1000U;

/// Physical units per ADC code (1 LSB = 1 uV, expressed in mV)
#ifndef HOLTERWFDB_ADC_SCALE
#define HOLTERWFDB_ADC_SCALE 0.001F
#endif

inline constexpr float ADC_SCALE = HOLTERWFDB_ADC_SCALE;

/// Storage codes per mV in the output signal file
#ifndef HOLTERWFDB_COUNTS_PER_MV
#define HOLTERWFDB_COUNTS_PER_MV 200
#endif

inline constexpr int COUNTS_PER_MV = HOLTERWFDB_COUNTS_PER_MV;

/** @} */

/**
 * @defgroup output Interchange Output
 * @{
 */
inline constexpr std::size_t NUM_CHANNELS = 3U;
inline constexpr int SIGNAL_FORMAT = 212;
inline constexpr std::size_t PACKED_UNIT_BYTES = 3U;
inline constexpr char DEFAULT_SYMBOL = 'N';
/** @} */

/**
 * @brief Decoder settings.
 */
struct DecoderConfig {
    std::size_t header_size = HEADER_SIZE;
    std::size_t footer_size = FOOTER_SIZE;
    std::size_t sample_rate_offset = SAMPLE_RATE_OFFSET;
    std::uint16_t default_sample_rate = DEFAULT_SAMPLE_RATE;
    std::uint16_t min_sample_rate = MIN_SAMPLE_RATE;
    std::uint16_t max_sample_rate = MAX_SAMPLE_RATE;
    float adc_scale = ADC_SCALE;
};

/**
 * @brief Annotation extractor settings.
 */
struct ExtractorConfig {
    std::size_t slot_size = ANNOTATION_SLOT_SIZE;
    char default_symbol = DEFAULT_SYMBOL;
};

/**
 * @brief Interchange encoder settings.
 */
struct EncoderConfig {
    int counts_per_mv = COUNTS_PER_MV;
    std::size_t channels = NUM_CHANNELS;
};

} // namespace holterwfdb

#endif // HOLTERWFDB_CONFIG_HPP
