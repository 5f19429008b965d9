#ifndef PDFSHELF_STORE_DOCUMENT_HPP
#define PDFSHELF_STORE_DOCUMENT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pdfshelf::store {

// Metadata snapshot read from the filesystem, never cached
struct DocumentInfo {
    std::uintmax_t size_bytes{0};
    std::filesystem::file_time_type modified_at{};
};

// One artifact inside the managed directory
struct StoredDocument {
    std::string name;
    std::filesystem::path path;
    std::uintmax_t size_bytes{0};
    std::filesystem::file_time_type modified_at{};

    // Stable key for list views: "<name>_<modified time in epoch ms>"
    std::string id() const;
};

// file_time_type has no portable epoch in C++17, so convert through a clock
// offset measured once per process
std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type time);

} // namespace pdfshelf::store

#endif // PDFSHELF_STORE_DOCUMENT_HPP
