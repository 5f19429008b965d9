#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include "store/document_name.hpp"

namespace pdfshelf {
namespace store {

class CollisionResolver {
public:
  // Millisecond epoch source, sampled once per retry
  using Clock = std::function<std::int64_t()>;

  static constexpr int kMaxRetries = 5;


  // ---- CONSTRUCTOR ----
  CollisionResolver();
  explicit CollisionResolver(Clock clock);


  // ---- RESOLUTION ----
  // Returns a name that does not exist in directory at the time of the check.
  // On collision the candidate gets "_<epoch ms>" before its extension and is
  // checked again; suffixes accumulate across retries and the stem is cut so
  // the name stays within kMaxDocumentNameLength. Throws
  // CollisionUnresolvedError after kMaxRetries attempts.
  DocumentName resolve(const std::filesystem::path& directory, const DocumentName& desired) const;

  static std::int64_t system_clock_millis();

private:
  Clock clock_;

  // True when directory/name exists; probe errors count as absent
  static bool occupied(const std::filesystem::path& directory, const std::string& name);
  // Appends a fresh "_<epoch ms>" to suffix and fits desired's stem around it
  std::string next_candidate(const DocumentName& desired, std::string& suffix) const;
};

} // namespace store
} // namespace pdfshelf
