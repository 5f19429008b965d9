#ifndef PDFSHELF_LOGGER_HPP
#define PDFSHELF_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace pdfshelf::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a text file sink: "<timestamp> [<severity>] <message>"
void init_logging(const std::string& log_file = "pdfshelf.log",
                  severity_level min_level = boost::log::trivial::info);

// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = boost::log::trivial::info);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Accepts trivial's names: trace, debug, info, warning, error, fatal
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace pdfshelf::logging

#endif // PDFSHELF_LOGGER_HPP
