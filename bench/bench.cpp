/**
 * @file bench.cpp
 * @brief Performance benchmarks for holterwfdb conversion.
 *
 * Measures decode and pack throughput on synthetic recordings, plus one
 * full conversion to disk, for regression testing during development.
 *
 * Usage:
 *   ./build/holterwfdb_bench              # Run with default 10 iterations
 *   ./build/holterwfdb_bench 100          # Run with custom iteration count
 */

#include <holterwfdb/holterwfdb.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

using namespace holterwfdb;

static constexpr int DEFAULT_ITERATIONS = 10;

/**
 * @brief Build a recording of @p hours at 256 Hz, 3 interleaved channels.
 */
static std::vector<std::uint8_t> make_recording(double hours) {
    auto samples = static_cast<std::size_t>(hours * 3600.0 * 256.0 * 3.0);
    std::vector<std::uint8_t> raw(HEADER_SIZE + samples * 2U + FOOTER_SIZE, 0);
    write_u16_le(&raw[SAMPLE_RATE_OFFSET], 256U);

    std::uint8_t* region = raw.data() + HEADER_SIZE;
    for (std::size_t i = 0; i < samples; ++i) {
        auto code = static_cast<std::int16_t>(static_cast<int>((i * 37U) % 4001U) - 2000);
        write_u16_le(region + i * 2U, static_cast<std::uint16_t>(code));
    }

    std::uint8_t* footer = raw.data() + raw.size() - FOOTER_SIZE;
    for (std::size_t slot = 0; slot < FOOTER_SIZE / ANNOTATION_SLOT_SIZE; ++slot) {
        write_u16_le(footer + slot * ANNOTATION_SLOT_SIZE, static_cast<std::uint16_t>(slot * 200U + 1U));
        footer[slot * ANNOTATION_SLOT_SIZE + 2U] = (slot % 10U == 0U) ? 'V' : 'N';
    }
    return raw;
}

static void bench_pipeline(const char* name, double hours, int iterations) {
    std::vector<std::uint8_t> raw = make_recording(hours);
    BinaryHolterDecoder decoder;
    InterchangeEncoder encoder;

    std::size_t packed_bytes = 0;

    // Warmup run
    {
        Recording recording = decoder.decode(raw);
        packed_bytes = encoder.encode_signal(recording.signal()).size();
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        Recording recording = decoder.decode(raw);
        packed_bytes = encoder.encode_signal(recording.signal()).size();
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ms = std::chrono::duration<double, std::milli>(end - start).count();
    double per_iter_ms = total_ms / static_cast<double>(iterations);
    double throughput_mbs =
        (static_cast<double>(raw.size()) / (1024.0 * 1024.0)) / (per_iter_ms / 1000.0);

    std::printf("%-20s %10.2f ms/iter  %8.1f MiB/s  (%zu -> %zu bytes)\n", name, per_iter_ms,
                throughput_mbs, raw.size(), packed_bytes);
}

static void bench_convert(const char* name, double hours) {
    std::vector<std::uint8_t> raw = make_recording(hours);
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "holterwfdb_bench";
    std::size_t input_bytes = raw.size();

    auto start = std::chrono::high_resolution_clock::now();
    ConversionReport report;
    try {
        report = convert(std::move(raw), "bench", dir.string());
    } catch (const HolterException& e) {
        std::printf("%-20s FAILED (%s)\n", name, e.what());
        return;
    }
    auto end = std::chrono::high_resolution_clock::now();

    double ms = std::chrono::duration<double, std::milli>(end - start).count();
    std::printf("%-20s %10.2f ms       (%zu -> %zu bytes, %zu annotations)\n", name, ms,
                input_bytes, report.artifacts.signal_bytes, report.artifacts.num_annotations);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("holterwfdb Benchmarks\n");
    std::printf("=====================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("Decode + pack:\n");
    bench_pipeline("1 minute", 1.0 / 60.0, iterations);
    bench_pipeline("1 hour", 1.0, iterations);
    bench_pipeline("24 hours", 24.0, 1);

    std::printf("\nFull conversion to disk:\n");
    bench_convert("24 hours", 24.0);

    return 0;
}
