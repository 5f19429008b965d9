#include "store/document.hpp"

namespace pdfshelf::store {

namespace {

// Distance between the filesystem clock and the system clock, sampled once
// so repeated conversions of one timestamp agree
std::chrono::nanoseconds file_clock_offset() {
    using namespace std::chrono;
    static const nanoseconds offset =
        duration_cast<nanoseconds>(std::filesystem::file_time_type::clock::now().time_since_epoch()) -
        duration_cast<nanoseconds>(system_clock::now().time_since_epoch());
    return offset;
}

} // namespace

std::string StoredDocument::id() const {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        to_system_time(modified_at).time_since_epoch()).count();
    return name + "_" + std::to_string(millis);
}

std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type time) {
    using namespace std::chrono;
    const auto since_epoch = duration_cast<nanoseconds>(time.time_since_epoch()) - file_clock_offset();
    return system_clock::time_point(duration_cast<system_clock::duration>(since_epoch));
}

} // namespace pdfshelf::store
