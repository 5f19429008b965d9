#include "platform/renderer.hpp"
#include <algorithm>
#include <cctype>

namespace pdfshelf {
namespace platform {

std::string ImageSource::mime_type() const {
  const std::string data_prefix = "data:";
  if (uri.compare(0, data_prefix.size(), data_prefix) == 0) {
    const auto end = uri.find_first_of(";,", data_prefix.size());
    if (end != std::string::npos && end > data_prefix.size()) {
      return uri.substr(data_prefix.size(), end - data_prefix.size());
    }
  }

  std::string lower = uri;
  std::transform(lower.begin(), lower.end(), lower.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto ends_with = [&lower](const std::string& suffix) {
    return lower.size() >= suffix.size() &&
           lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0;
  };

  if (ends_with(".png")) return "image/png";
  if (ends_with(".gif")) return "image/gif";
  if (ends_with(".webp")) return "image/webp";
  return "image/jpeg";
}

} // namespace platform
} // namespace pdfshelf
