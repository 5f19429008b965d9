#include "config/options.hpp"
#include <cstdlib>

namespace pdfshelf::config {

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

ProgramOptions invalid(ProgramOptions options, const std::string& message) {
    options.valid = false;
    options.error = message;
    return options;
}

} // namespace

std::filesystem::path default_document_directory() {
    if (const auto dir = env_or_empty("PDFSHELF_DIR"); !dir.empty()) {
        return dir;
    }
    if (const auto data_home = env_or_empty("XDG_DATA_HOME"); !data_home.empty()) {
        return std::filesystem::path(data_home) / "pdfshelf" / "documents";
    }
    if (const auto home = env_or_empty("HOME"); !home.empty()) {
        return std::filesystem::path(home) / ".local" / "share" / "pdfshelf" / "documents";
    }
    return std::filesystem::path("documents");
}

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
    ProgramOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string flag(argv[i]);

        if (flag == "--help") {
            options.show_help = true;
            continue;
        }

        if (flag != "-d" && flag != "--dir" && flag != "-l" && flag != "--log" &&
            flag != "-v" && flag != "--verbosity") {
            return invalid(options, "Unknown argument: " + flag);
        }
        if (i + 1 >= argc) {
            return invalid(options, "Missing value for " + flag);
        }
        const std::string value(argv[++i]);

        if (flag == "-d" || flag == "--dir") {
            options.directory = value;
        } else if (flag == "-l" || flag == "--log") {
            options.log_file = value;
        } else {
            const auto level = logging::parse_severity(value);
            if (!level) {
                return invalid(options, "Invalid verbosity: " + value);
            }
            options.verbosity = *level;
        }
    }

    if (options.directory.empty()) {
        options.directory = default_document_directory();
    }

    options.valid = true;
    return options;
}

void print_usage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " [-d <dir>] [-l <file>] [-v <level>]\n"
        << "Optional arguments:\n"
        << "  -d, --dir        Document directory (default: $PDFSHELF_DIR or ~/.local/share/pdfshelf/documents)\n"
        << "  -l, --log        Log file, '-' for the console (default: pdfshelf.log)\n"
        << "  -v, --verbosity  trace, debug, info, warning, error or fatal (default: info)\n"
        << "      --help       Show this message\n"
        << "Example: " << program_name << " -d ~/Documents/pdfs -v debug\n";
}

} // namespace pdfshelf::config
