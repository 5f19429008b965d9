#include "store/document_name.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>
#include <boost/log/trivial.hpp>

namespace pdfshelf {
namespace store {

namespace {

// Characters that are not allowed in a file name on any mainstream filesystem
constexpr const char* kReservedCharacters = "<>:\"/\\|?*";

bool is_blank(unsigned char c) {
  return std::isspace(c) != 0;
}

void trim_whitespace(std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(),
    [](char c) { return is_blank(static_cast<unsigned char>(c)); });
  auto end = std::find_if_not(value.rbegin(), value.rend(),
    [](char c) { return is_blank(static_cast<unsigned char>(c)); }).base();
  value = (begin < end) ? std::string(begin, end) : std::string();
}

void trim_dots(std::string& value) {
  const auto first = value.find_first_not_of('.');
  if (first == std::string::npos) {
    value.clear();
    return;
  }
  const auto last = value.find_last_not_of('.');
  value = value.substr(first, last - first + 1);
}

// Drops trailing whitespace and dots, leaving a leading "." intact
void trim_trailing(std::string& value) {
  while (!value.empty() && (is_blank(static_cast<unsigned char>(value.back())) || value.back() == '.')) {
    value.pop_back();
  }
}

// Alternates whitespace and dot trimming until neither changes the value
void trim_edges(std::string& value) {
  std::string previous;
  do {
    previous = value;
    trim_whitespace(value);
    trim_dots(value);
  } while (value != previous);
}

std::string replace_reserved(const std::string& raw) {
  std::string cleaned;
  cleaned.reserve(raw.size());
  for (char c : raw) {
    const auto code = static_cast<unsigned char>(c);
    if (code < 32 || std::strchr(kReservedCharacters, c) != nullptr) {
      cleaned.push_back('_');
    } else {
      cleaned.push_back(c);
    }
  }
  return cleaned;
}

// Cuts to at most max_bytes without splitting a UTF-8 sequence
void truncate_utf8(std::string& value, std::size_t max_bytes) {
  if (value.size() <= max_bytes) {
    return;
  }
  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  value.resize(cut);
}

} // namespace


//==============================================
// DOCUMENT NAME
//==============================================

DocumentName::DocumentName(std::string value, bool synthesized)
  : value_(std::move(value))
  , synthesized_(synthesized) {
}

std::string DocumentName::stem() const {
  if (!has_document_extension(value_)) {
    return value_;
  }
  return value_.substr(0, value_.size() - std::strlen(kDocumentExtension));
}


//==============================================
// NAME SANITIZATION
//==============================================

bool has_document_extension(const std::string& name) {
  const std::size_t ext_len = std::strlen(kDocumentExtension);
  if (name.size() < ext_len) {
    return false;
  }
  return std::equal(name.end() - ext_len, name.end(), kDocumentExtension,
    [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string fit_document_stem(std::string stem, std::size_t max_bytes) {
  if (stem.size() <= max_bytes) {
    return stem;
  }
  truncate_utf8(stem, max_bytes);
  trim_edges(stem);
  return stem;
}

std::string synthesize_default_name(int image_count, std::chrono::system_clock::time_point now) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream name;
  name << "Document-" << std::put_time(&local, "%Y-%m-%d-%H%M%S")
       << "-" << std::max(image_count, 0) << "images" << kDocumentExtension;
  return name.str();
}

DocumentName sanitize_document_name(const std::string& raw_name, int fallback_image_count) {
  return sanitize_document_name(raw_name, fallback_image_count, std::chrono::system_clock::now());
}

DocumentName sanitize_document_name(const std::string& raw_name, int fallback_image_count,
  std::chrono::system_clock::time_point now) {
  auto fallback = [&]() {
    DocumentName name(synthesize_default_name(fallback_image_count, now), true);
    BOOST_LOG_TRIVIAL(info) << "NameSanitizer: Input \"" << raw_name
                            << "\" unusable, synthesized: " << name.value();
    return name;
  };

  // Whitespace goes first so tabs and newlines at the edges are not turned into '_'
  std::string candidate = raw_name;
  trim_whitespace(candidate);
  candidate = replace_reserved(candidate);
  // Leading dots stay until the extension is split off, so ".pdf" is seen as extension-only
  trim_trailing(candidate);

  std::string stem;
  std::string extension = kDocumentExtension;
  if (has_document_extension(candidate)) {
    const std::size_t ext_len = std::strlen(kDocumentExtension);
    stem = candidate.substr(0, candidate.size() - ext_len);
    extension = candidate.substr(candidate.size() - ext_len);  // keeps the user's casing
  } else {
    stem = candidate;
  }

  trim_edges(stem);
  if (stem.empty()) {
    return fallback();
  }

  if (stem.size() + extension.size() > kMaxDocumentNameLength) {
    stem = fit_document_stem(std::move(stem), kMaxDocumentNameLength - extension.size());
    if (stem.empty()) {
      return fallback();
    }
  }

  DocumentName name(stem + extension, false);
  BOOST_LOG_TRIVIAL(debug) << "NameSanitizer: \"" << raw_name << "\" -> " << name.value();
  return name;
}

} // namespace store
} // namespace pdfshelf
