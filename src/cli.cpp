/**
 * @file cli.cpp
 * @brief holterwfdb command line interface.
 *
 * Converts a binary Holter recording into an interchange record
 * (.dat/.hea/.atr), or lists the records present in a directory.
 */

#include <holterwfdb/holterwfdb.hpp>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace holterwfdb;

static void print_version() {
    std::printf("holterwfdb %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nBinary Holter to WFDB-style record converter (v%s)\n", version());
    std::printf("=====================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <input.bin> <output_dir>\n", prog_name);
    std::printf("  %s -l <dir>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -l             List records (*.hea) in a directory\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Input layout:\n");
    std::printf("  %zu-byte header (u16 LE sample rate at offset %zu)\n", HEADER_SIZE,
                SAMPLE_RATE_OFFSET);
    std::printf("  int16 LE samples, 1 LSB = %g mV\n", static_cast<double>(ADC_SCALE));
    std::printf("  %zu-byte annotation footer (%zu-byte slots)\n\n", FOOTER_SIZE,
                ANNOTATION_SLOT_SIZE);
    std::printf("Output:\n");
    std::printf("  <output_dir>/<base>.dat  %zu channels, format %d, %d counts/mV\n", NUM_CHANNELS,
                SIGNAL_FORMAT, COUNTS_PER_MV);
    std::printf("  <output_dir>/<base>.hea  text header\n");
    std::printf("  <output_dir>/<base>.atr  annotations (only if any are valid)\n\n");
    std::printf("Examples:\n");
    std::printf("  %s holter.bin records/        # convert\n", prog_name);
    std::printf("  %s -l records/                # list\n\n", prog_name);
}

static int do_convert(const char* input_path, const char* output_dir) {
    ConversionReport report;
    try {
        report = convert_file(input_path, output_dir);
    } catch (const HolterException& e) {
        std::fprintf(stderr, "Error: %s (%s)\n", e.what(), error_string(e.code()));
        return 1;
    }

    const InterchangeArtifacts& out = report.artifacts;
    std::printf("Input:       %s (%zu bytes, %zu samples)\n", input_path, report.input_bytes,
                report.raw_samples);
    if (report.declared_rate != report.sample_rate) {
        std::printf("Rate:        %u Hz (declared %u Hz out of range)\n",
                    static_cast<unsigned>(report.sample_rate),
                    static_cast<unsigned>(report.declared_rate));
    } else {
        std::printf("Rate:        %u Hz\n", static_cast<unsigned>(report.sample_rate));
    }
    std::printf("Frames:      %zu (%zu padded, %zu dropped)\n", out.num_frames,
                report.padded_samples, report.dropped_samples);
    std::printf("Output:      %s\n", output_dir);
    std::printf("- %s (%.1f MiB)\n", out.signal_path.c_str(),
                static_cast<double>(out.signal_bytes) / (1024.0 * 1024.0));
    std::printf("- %s\n", out.header_path.c_str());
    if (out.has_annotations()) {
        std::printf("- %s (%zu annotations)\n", out.annotation_path.c_str(), out.num_annotations);
    } else {
        std::printf("No valid annotations; annotation file not written\n");
    }

    return 0;
}

static int do_list(const char* dir) {
    std::vector<std::string> records = list_records(dir);
    for (const std::string& name : records) {
        std::printf("%s\n", name.c_str());
    }
    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "-l") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Error: -l requires a directory\n");
            std::fprintf(stderr, "Usage: %s -l <dir>\n", argv[0]);
            return 1;
        }
        return do_list(argv[2]);
    }

    if (argc != 3) {
        std::fprintf(stderr, "Error: Convert requires 2 arguments\n");
        std::fprintf(stderr, "Usage: %s <input.bin> <output_dir>\n", argv[0]);
        return 1;
    }

    return do_convert(argv[1], argv[2]);
}
