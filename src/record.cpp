/**
 * @file record.cpp
 * @brief Interchange record naming and header text.
 */

#include <holterwfdb/record.hpp>

#include <holterwfdb/error.hpp>
#include <holterwfdb/file_io.hpp>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace holterwfdb {

const char* extension(FileType type) noexcept {
    switch (type) {
    case FileType::Header:
        return ".hea";
    case FileType::Data:
        return ".dat";
    case FileType::Annotation:
        return ".atr";
    default:
        return "";
    }
}

std::string artifact_path(const std::string& dir, const std::string& base, FileType type) {
    return (std::filesystem::path(dir) / (base + extension(type))).string();
}

std::string record_name(const std::string& input_path) {
    return std::filesystem::path(input_path).stem().string();
}

std::vector<std::string> list_records(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return names;
    }

    for (; it != std::filesystem::directory_iterator() && !ec; it.increment(ec)) {
        const std::filesystem::path& path = it->path();
        if (path.extension() == extension(FileType::Header)) {
            names.push_back(path.stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string format_header(const std::string& base, std::size_t num_frames,
                          std::uint16_t sample_rate, std::size_t channels, int gain) {
    std::ostringstream out;
    out << base << ' ' << channels << ' ' << num_frames << ' ' << sample_rate << '\n';

    SignalSpec spec;
    spec.gain = gain;
    for (std::size_t ch = 0; ch < channels; ++ch) {
        spec.byte_offset = ch * PACKED_UNIT_BYTES;
        out << spec.label << ' ' << spec.format << ' ' << spec.samples_per_frame << ' '
            << spec.skew << ' ' << spec.byte_offset << ' ' << spec.gain << ' ' << spec.baseline
            << ' ' << spec.units << '\n';
    }
    return out.str();
}

HeaderInfo parse_header(const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    HeaderInfo info;

    if (!std::getline(lines, line)) {
        throw InvalidDataException("Header is empty");
    }
    {
        std::istringstream fields(line);
        unsigned long rate = 0;
        if (!(fields >> info.record >> info.channels >> info.frames >> rate) || rate > 0xFFFFUL) {
            throw InvalidDataException("Malformed record line: " + line);
        }
        info.sample_rate = static_cast<std::uint16_t>(rate);
    }

    while (std::getline(lines, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        std::istringstream fields(line);
        SignalSpec spec;
        if (!(fields >> spec.label >> spec.format >> spec.samples_per_frame >> spec.skew >>
              spec.byte_offset >> spec.gain >> spec.baseline >> spec.units)) {
            throw InvalidDataException("Malformed signal line: " + line);
        }
        info.signals.push_back(spec);
    }

    if (info.signals.size() != info.channels) {
        throw InvalidDataException("Header declares " + std::to_string(info.channels) +
                                   " channels but has " + std::to_string(info.signals.size()) +
                                   " signal lines");
    }
    return info;
}

HeaderInfo read_header_file(const std::string& path) {
    std::vector<std::uint8_t> bytes = read_file(path);
    return parse_header(std::string(bytes.begin(), bytes.end()));
}

} // namespace holterwfdb
