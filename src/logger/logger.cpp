#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace pdfshelf::logging {

namespace {

namespace expr = boost::log::expressions;

auto make_formatter() {
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
        const std::filesystem::path log_path = std::filesystem::absolute(log_file);
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);
        sink->set_formatter(make_formatter());

        boost::log::core::get()->add_sink(sink);
        boost::log::add_common_attributes();
        set_log_level(min_level);
        enable_logging();

        BOOST_LOG_TRIVIAL(info) << "Logging system initialized with file: " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void init_console_logging(severity_level min_level) {
    boost::log::core::get()->remove_all_sinks();

    auto sink = boost::log::add_console_log(std::clog, boost::log::keywords::auto_flush = true);
    sink->set_formatter(make_formatter());

    boost::log::add_common_attributes();
    set_log_level(min_level);
    enable_logging();
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

std::optional<severity_level> parse_severity(const std::string& name) {
    if (name == "trace") return boost::log::trivial::trace;
    if (name == "debug") return boost::log::trivial::debug;
    if (name == "info") return boost::log::trivial::info;
    if (name == "warning") return boost::log::trivial::warning;
    if (name == "error") return boost::log::trivial::error;
    if (name == "fatal") return boost::log::trivial::fatal;
    return std::nullopt;
}

} // namespace pdfshelf::logging
