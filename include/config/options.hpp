#ifndef PDFSHELF_CONFIG_OPTIONS_HPP
#define PDFSHELF_CONFIG_OPTIONS_HPP

#include <filesystem>
#include <ostream>
#include <string>
#include "logger/logger.hpp"

namespace pdfshelf::config {

struct ProgramOptions {
    std::filesystem::path directory;
    std::string log_file{"pdfshelf.log"};
    logging::severity_level verbosity{boost::log::trivial::info};
    bool show_help{false};
    bool valid{false};
    std::string error;
};

// -d/--dir, -l/--log, -v/--verbosity, --help. Without --dir the managed
// directory comes from default_document_directory().
ProgramOptions parse_command_line(int argc, const char* const argv[]);

// $PDFSHELF_DIR, else $XDG_DATA_HOME/pdfshelf/documents,
// else $HOME/.local/share/pdfshelf/documents, else ./documents
std::filesystem::path default_document_directory();

void print_usage(std::ostream& out, const std::string& program_name);

} // namespace pdfshelf::config

#endif // PDFSHELF_CONFIG_OPTIONS_HPP
