/**
 * @file io_util.h
 * @brief Loading CSV text from files and stdin.
 *
 * The loader itself works on an in-memory buffer; these helpers produce that
 * buffer. Both strip a leading UTF-8 byte order mark.
 */

#ifndef TYPEDCSV_IO_UTIL_H
#define TYPEDCSV_IO_UTIL_H

#include <string>

namespace typedcsv {

/**
 * @brief Read an entire file.
 *
 * @throws std::runtime_error "could not load file: <path>" when the file
 *         cannot be opened, "could not read the data" on a short read
 */
std::string read_text_file(const std::string& filename);

/**
 * @brief Read all of standard input.
 *
 * @throws std::runtime_error "could not read from stdin" on a read error
 */
std::string read_text_stdin();

/// File name without directory and last extension ("data/items.csv" -> "items").
std::string file_stem(const std::string& path);

} // namespace typedcsv

#endif // TYPEDCSV_IO_UTIL_H
