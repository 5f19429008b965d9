#include "store/document_store.hpp"
#include <algorithm>
#include <system_error>
#include <utility>
#include <boost/log/trivial.hpp>

namespace pdfshelf {
namespace store {

const char* commit_state_to_string(CommitState state) {
  switch (state) {
    case CommitState::PENDING: return "Pending";
    case CommitState::RESOLVING: return "Resolving";
    case CommitState::RELOCATED: return "Relocated";
    case CommitState::SOURCE_CLEANED: return "SourceCleaned";
    case CommitState::SOURCE_CLEANUP_FAILED: return "SourceCleanupFailed";
    default: return "Unknown";
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DocumentStore::DocumentStore(std::filesystem::path directory, CollisionResolver resolver)
  : directory_(std::move(directory))
  , resolver_(std::move(resolver)) {
  BOOST_LOG_TRIVIAL(info) << "DocumentStore: Initializing with directory: " << directory_.string();

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec || !std::filesystem::is_directory(directory_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "DocumentStore: Cannot use directory " << directory_.string()
                             << (ec ? ": " + ec.message() : std::string());
    throw DestinationUnwritableError("managed directory unavailable: " + directory_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "DocumentStore: Directory created/verified at: " << directory_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

StoredDocument DocumentStore::commit(const std::filesystem::path& source_path,
  const std::string& desired_display_name, int image_count) {
  BOOST_LOG_TRIVIAL(info) << "DocumentStore: Committing " << source_path.string()
                          << " as \"" << desired_display_name << "\"";
  log_transition(CommitState::PENDING, source_path.string());

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "DocumentStore: Source not found: " << source_path.string();
    throw SourceNotFoundError(source_path.string());
  }

  log_transition(CommitState::RESOLVING, desired_display_name);
  const DocumentName desired = sanitize_document_name(desired_display_name, image_count);
  if (desired.synthesized()) {
    BOOST_LOG_TRIVIAL(info) << "DocumentStore: Sanitization fallback used: " << desired.value();
  }

  DocumentName final_name = resolver_.resolve(directory_, desired);
  std::filesystem::path destination = directory_ / final_name.value();

  if (!copy_exclusive(source_path, destination)) {
    // Another writer took the name between resolution and copy
    BOOST_LOG_TRIVIAL(warning) << "DocumentStore: " << final_name.value()
                               << " appeared during commit, resolving again";
    final_name = resolver_.resolve(directory_, desired);
    destination = directory_ / final_name.value();
    if (!copy_exclusive(source_path, destination)) {
      BOOST_LOG_TRIVIAL(error) << "DocumentStore: Lost the race for " << final_name.value() << " twice";
      throw CollisionUnresolvedError("destination taken twice during commit: " + final_name.value());
    }
  }
  log_transition(CommitState::RELOCATED, destination.string());

  log_transition(remove_source(source_path), source_path.string());

  auto stored = read_document(final_name.value());
  if (!stored) {
    BOOST_LOG_TRIVIAL(error) << "DocumentStore: Committed document vanished: " << destination.string();
    throw DocumentNotFoundError(final_name.value());
  }

  BOOST_LOG_TRIVIAL(info) << "DocumentStore: Stored " << stored->size_bytes
                          << " bytes as " << stored->name;
  return *stored;
}

bool DocumentStore::remove(const StoredDocument& document) {
  return remove(document.name);
}

bool DocumentStore::remove(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "DocumentStore: Deleting document: " << name;

  const auto path = managed_path(name);
  if (!path) {
    BOOST_LOG_TRIVIAL(warning) << "DocumentStore: Refusing to delete unmanaged entry: " << name;
    return false;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(*path, ec)) {
    BOOST_LOG_TRIVIAL(info) << "DocumentStore: Document not found, nothing to delete: " << name;
    return false;
  }

  const bool removed = std::filesystem::remove(*path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "DocumentStore: Failed to delete " << name << ": " << ec.message();
    throw DestinationUnwritableError("cannot delete " + name + ": " + ec.message());
  }

  if (removed) {
    BOOST_LOG_TRIVIAL(info) << "DocumentStore: Successfully deleted document: " << name;
  } else {
    BOOST_LOG_TRIVIAL(info) << "DocumentStore: Document vanished before delete: " << name;
  }
  return removed;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<StoredDocument> DocumentStore::list() const {
  BOOST_LOG_TRIVIAL(debug) << "DocumentStore: Listing contents of " << directory_.string();

  std::vector<StoredDocument> documents;
  std::error_code ec;
  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "DocumentStore: Cannot read directory " << directory_.string()
                             << ": " << ec.message();
    return documents;
  }

  const std::filesystem::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (!has_document_extension(name)) {
      continue;
    }

    auto document = read_document(name);
    if (!document) {
      BOOST_LOG_TRIVIAL(debug) << "DocumentStore: Skipping unreadable entry: " << name;
      continue;
    }
    documents.push_back(std::move(*document));
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "DocumentStore: Listing stopped early: " << ec.message();
  }

  std::sort(documents.begin(), documents.end(),
    [](const StoredDocument& a, const StoredDocument& b) {
      if (a.modified_at != b.modified_at) {
        return a.modified_at > b.modified_at;
      }
      return a.name < b.name;
    });

  BOOST_LOG_TRIVIAL(debug) << "DocumentStore: Listed " << documents.size() << " documents";
  return documents;
}

DocumentInfo DocumentStore::info(const StoredDocument& document) const {
  return info(document.name);
}

DocumentInfo DocumentStore::info(const std::string& name) const {
  const auto document = find(name);
  if (!document) {
    BOOST_LOG_TRIVIAL(error) << "DocumentStore: Document not found: " << name;
    throw DocumentNotFoundError(name);
  }
  return DocumentInfo{document->size_bytes, document->modified_at};
}

std::optional<StoredDocument> DocumentStore::find(const std::string& name) const {
  if (!managed_path(name)) {
    return std::nullopt;
  }
  return read_document(name);
}


//==============================================
// UTILITY METHODS
//==============================================

bool DocumentStore::copy_exclusive(const std::filesystem::path& source,
  const std::filesystem::path& destination) const {
  BOOST_LOG_TRIVIAL(debug) << "DocumentStore: Copying " << source.string()
                           << " to " << destination.string();

  std::error_code ec;
  std::filesystem::copy_file(source, destination, std::filesystem::copy_options::none, ec);
  if (!ec) {
    return true;
  }
  if (ec == std::errc::file_exists) {
    return false;
  }

  BOOST_LOG_TRIVIAL(error) << "DocumentStore: Copy to " << destination.string()
                           << " failed: " << ec.message();

  // A partially written destination must not show up in listings
  std::error_code cleanup_ec;
  std::filesystem::remove(destination, cleanup_ec);
  if (cleanup_ec) {
    BOOST_LOG_TRIVIAL(warning) << "DocumentStore: Could not remove partial file "
                               << destination.string() << ": " << cleanup_ec.message();
  }

  std::error_code source_ec;
  if (!std::filesystem::exists(source, source_ec)) {
    throw SourceNotFoundError(source.string() + " disappeared during copy");
  }
  throw DestinationUnwritableError(destination.string() + ": " + ec.message());
}

CommitState DocumentStore::remove_source(const std::filesystem::path& source) const {
  std::error_code ec;
  std::filesystem::remove(source, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "DocumentStore: Could not delete source file "
                               << source.string() << ": " << ec.message();
    return CommitState::SOURCE_CLEANUP_FAILED;
  }
  return CommitState::SOURCE_CLEANED;
}

void DocumentStore::log_transition(CommitState state, const std::string& subject) const {
  BOOST_LOG_TRIVIAL(debug) << "DocumentStore: Commit state " << commit_state_to_string(state)
                           << " (" << subject << ")";
}

std::optional<std::filesystem::path> DocumentStore::managed_path(const std::string& name) const {
  const std::filesystem::path candidate(name);
  if (name.empty() || name == "." || name == ".." || candidate.filename() != candidate ||
      !has_document_extension(name)) {
    return std::nullopt;
  }
  return directory_ / candidate;
}

std::optional<StoredDocument> DocumentStore::read_document(const std::string& name) const {
  const std::filesystem::path path = directory_ / name;
  std::error_code ec;

  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::nullopt;
  }
  const auto modified = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }

  return StoredDocument{name, path, size, modified};
}

} // namespace store
} // namespace pdfshelf
