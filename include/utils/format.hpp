#ifndef PDFSHELF_UTILS_FORMAT_HPP
#define PDFSHELF_UTILS_FORMAT_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace pdfshelf::utils {

// "0 KB", "1.5 KB", "2.0 MB": KB below 1024 KB, MB above, one decimal
std::string format_size(std::uintmax_t size_bytes);

// Short US date in local time, e.g. "Oct 18, 2026"
std::string format_date(std::chrono::system_clock::time_point time);

} // namespace pdfshelf::utils

#endif // PDFSHELF_UTILS_FORMAT_HPP
