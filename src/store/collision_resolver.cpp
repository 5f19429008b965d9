#include "store/collision_resolver.hpp"
#include "store/store_error.hpp"
#include <chrono>
#include <cstring>
#include <system_error>
#include <utility>
#include <boost/log/trivial.hpp>

namespace pdfshelf {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

CollisionResolver::CollisionResolver() : clock_(&CollisionResolver::system_clock_millis) {
}

CollisionResolver::CollisionResolver(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = &CollisionResolver::system_clock_millis;
  }
}


//==============================================
// RESOLUTION
//==============================================

DocumentName CollisionResolver::resolve(const std::filesystem::path& directory,
  const DocumentName& desired) const {
  BOOST_LOG_TRIVIAL(debug) << "CollisionResolver: Resolving " << desired.value()
                           << " in " << directory.string();

  if (!occupied(directory, desired.value())) {
    return desired;
  }

  // Suffixes accumulate so a repeated clock tick still changes the name
  std::string suffix;
  for (int attempt = 1; attempt <= kMaxRetries; ++attempt) {
    const DocumentName candidate(next_candidate(desired, suffix), desired.synthesized());
    BOOST_LOG_TRIVIAL(debug) << "CollisionResolver: Attempt " << attempt
                             << " trying " << candidate.value();
    if (!occupied(directory, candidate.value())) {
      BOOST_LOG_TRIVIAL(info) << "CollisionResolver: " << desired.value()
                              << " exists, using unique name: " << candidate.value();
      return candidate;
    }
  }

  BOOST_LOG_TRIVIAL(error) << "CollisionResolver: Gave up on " << desired.value()
                           << " after " << kMaxRetries << " retries";
  throw CollisionUnresolvedError("no free name for " + desired.value() + " after " +
    std::to_string(kMaxRetries) + " retries");
}

std::int64_t CollisionResolver::system_clock_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}


//==============================================
// UTILITY METHODS
//==============================================

bool CollisionResolver::occupied(const std::filesystem::path& directory, const std::string& name) {
  std::error_code ec;
  const bool found = std::filesystem::exists(directory / name, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "CollisionResolver: Could not probe " << name
                               << ": " << ec.message();
    return false;
  }
  return found;
}

std::string CollisionResolver::next_candidate(const DocumentName& desired, std::string& suffix) const {
  suffix += "_" + std::to_string(clock_());
  const std::size_t reserved = suffix.size() + std::strlen(kDocumentExtension);
  const std::size_t room = kMaxDocumentNameLength > reserved ? kMaxDocumentNameLength - reserved : 0;
  return fit_document_stem(desired.stem(), room) + suffix + kDocumentExtension;
}

} // namespace store
} // namespace pdfshelf
