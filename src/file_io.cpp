/**
 * @file file_io.cpp
 * @brief Whole-file reads and writes.
 */

#include <holterwfdb/file_io.hpp>

#include <holterwfdb/error.hpp>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace holterwfdb {

std::vector<std::uint8_t> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw ReadException("Cannot open input file: " + path);
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        throw ReadException("Cannot determine size of input file: " + path);
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw ReadException("Cannot read input file: " + path);
    }

    return buffer;
}

void write_file(const std::string& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw WriteException("Cannot open output file: " + path);
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    file.flush();
    if (!file.good()) {
        throw WriteException("Cannot write output file: " + path);
    }
}

void write_file(const std::string& path, const std::string& text) {
    write_file(path, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

void ensure_directory(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw WriteException("Cannot create output directory " + path + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(path, ec)) {
        throw WriteException("Output path is not a directory: " + path);
    }
}

} // namespace holterwfdb
