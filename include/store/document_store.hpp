#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "store/collision_resolver.hpp"
#include "store/document.hpp"
#include "store/document_name.hpp"
#include "store/store_error.hpp"

namespace pdfshelf {
namespace store {

// Progress of a single commit, logged on every transition
enum class CommitState {
  PENDING,
  RESOLVING,
  RELOCATED,
  SOURCE_CLEANED,
  SOURCE_CLEANUP_FAILED
};

const char* commit_state_to_string(CommitState state);

class DocumentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the managed directory if needed, throws DestinationUnwritableError
  // when it cannot be created
  explicit DocumentStore(std::filesystem::path directory,
    CollisionResolver resolver = CollisionResolver());


  // ---- CORE STORAGE OPERATIONS ----
  // Copies source_path into the managed directory under a sanitized,
  // collision-free name and removes the source afterwards (best effort).
  // Never overwrites an existing document: the copy is create-exclusive and
  // a destination that appears after resolution triggers one more resolution.
  StoredDocument commit(const std::filesystem::path& source_path,
    const std::string& desired_display_name, int image_count = 0);
  // Removes a document, false when it was already gone or is not a *.pdf entry
  bool remove(const StoredDocument& document);
  bool remove(const std::string& name);


  // ---- QUERY OPERATIONS ----
  // All *.pdf entries, newest first, ties by name. Unreadable entries are skipped.
  std::vector<StoredDocument> list() const;
  // Fresh size and modification time, throws DocumentNotFoundError when gone
  DocumentInfo info(const StoredDocument& document) const;
  DocumentInfo info(const std::string& name) const;
  std::optional<StoredDocument> find(const std::string& name) const;

  const std::filesystem::path& directory() const { return directory_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path directory_;
  CollisionResolver resolver_;


  // ---- COMMIT SUPPORT ----
  // False when the destination already exists, throws on any other failure
  bool copy_exclusive(const std::filesystem::path& source,
    const std::filesystem::path& destination) const;
  CommitState remove_source(const std::filesystem::path& source) const;
  void log_transition(CommitState state, const std::string& subject) const;


  // ---- QUERY SUPPORT ----
  // Maps a bare *.pdf file name into the managed directory, rejects anything
  // with a path component or another extension
  std::optional<std::filesystem::path> managed_path(const std::string& name) const;
  std::optional<StoredDocument> read_document(const std::string& name) const;
};

} // namespace store
} // namespace pdfshelf
