#include "utils/format.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pdfshelf::utils {

std::string format_size(std::uintmax_t size_bytes) {
    if (size_bytes == 0) {
        return "0 KB";
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    const double size_kb = static_cast<double>(size_bytes) / 1024.0;
    if (size_kb < 1024.0) {
        out << size_kb << " KB";
    } else {
        out << size_kb / 1024.0 << " MB";
    }
    return out.str();
}

std::string format_date(std::chrono::system_clock::time_point time) {
    static const char* const kMonths[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };

    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << kMonths[local.tm_mon] << " " << local.tm_mday << ", " << (local.tm_year + 1900);
    return out.str();
}

} // namespace pdfshelf::utils
