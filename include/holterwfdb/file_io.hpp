/**
 * @file file_io.hpp
 * @brief Whole-file reads and writes for recordings and artifacts.
 */

#ifndef HOLTERWFDB_FILE_IO_HPP
#define HOLTERWFDB_FILE_IO_HPP

#include "config.hpp"

#include <string>
#include <vector>

namespace holterwfdb {

/**
 * @brief Read a whole file.
 * @throws ReadException if the file cannot be opened or read
 */
[[nodiscard]] std::vector<std::uint8_t> read_file(const std::string& path);

/**
 * @brief Create or truncate @p path and write @p size bytes.
 * @throws WriteException on any open or write failure
 */
void write_file(const std::string& path, const std::uint8_t* data, std::size_t size);

/**
 * @brief Text variant of write_file().
 */
void write_file(const std::string& path, const std::string& text);

/**
 * @brief Create @p path and any missing parents.
 * @throws WriteException if the directory cannot be created
 */
void ensure_directory(const std::string& path);

} // namespace holterwfdb

#endif // HOLTERWFDB_FILE_IO_HPP
