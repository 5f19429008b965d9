#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace pdfshelf {
namespace store {

// Canonical suffix of every stored document
inline constexpr const char* kDocumentExtension = ".pdf";
// Upper bound on a sanitized name, extension included
inline constexpr std::size_t kMaxDocumentNameLength = 100;

class DocumentName {
public:
  // ---- CONSTRUCTOR ----
  DocumentName(std::string value, bool synthesized);


  // ---- GETTERS ----
  const std::string& value() const { return value_; }
  // Name without the trailing extension
  std::string stem() const;
  // True when the raw input collapsed and a default name was generated
  bool synthesized() const { return synthesized_; }

  bool operator==(const DocumentName& other) const { return value_ == other.value_; }
  bool operator!=(const DocumentName& other) const { return !(*this == other); }

private:
  std::string value_;
  bool synthesized_;
};


// ---- NAME SANITIZATION ----
// Turns any user string into a filesystem-safe "*.pdf" name. Never throws.
// Reserved characters and control characters become '_', surrounding
// whitespace and dots are trimmed, the extension is enforced and the result
// is capped at kMaxDocumentNameLength. Input that collapses to nothing is
// replaced by Document-YYYY-MM-DD-HHMMSS-<n>images.pdf.
DocumentName sanitize_document_name(const std::string& raw_name, int fallback_image_count);
DocumentName sanitize_document_name(const std::string& raw_name, int fallback_image_count,
  std::chrono::system_clock::time_point now);

// Default name used when sanitization leaves nothing usable
std::string synthesize_default_name(int image_count, std::chrono::system_clock::time_point now);

// Case-insensitive check for the canonical extension
bool has_document_extension(const std::string& name);

// Cuts stem to at most max_bytes without splitting a UTF-8 sequence, then
// trims whitespace and dots left at the edges. May return an empty string.
std::string fit_document_stem(std::string stem, std::size_t max_bytes);

} // namespace store
} // namespace pdfshelf
