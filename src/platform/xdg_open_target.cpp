#include "platform/share_target.hpp"
#include <cstdlib>
#include <boost/log/trivial.hpp>

namespace pdfshelf {
namespace platform {

std::string shell_quote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

bool XdgOpenTarget::is_available() const {
  return std::system("command -v xdg-open >/dev/null 2>&1") == 0;
}

void XdgOpenTarget::share(const std::filesystem::path& path, const std::string& dialog_title,
  const std::string& mime_type) {
  BOOST_LOG_TRIVIAL(info) << "XdgOpenTarget: " << dialog_title << " (" << mime_type << ")";
  launch(path);
}

void XdgOpenTarget::open(const std::filesystem::path& path, const std::string& mime_type) {
  BOOST_LOG_TRIVIAL(info) << "XdgOpenTarget: Opening " << path.string() << " (" << mime_type << ")";
  launch(path);
}

void XdgOpenTarget::launch(const std::filesystem::path& path) const {
  const std::string command = "xdg-open " + shell_quote(path.string()) + " >/dev/null 2>&1";
  const int result = std::system(command.c_str());
  if (result != 0) {
    BOOST_LOG_TRIVIAL(error) << "XdgOpenTarget: xdg-open exited with " << result
                             << " for " << path.string();
    throw ShareError("xdg-open failed for " + path.string());
  }
}

} // namespace platform
} // namespace pdfshelf
