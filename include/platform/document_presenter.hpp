#pragma once

#include "platform/share_target.hpp"
#include "store/document_store.hpp"

namespace pdfshelf {
namespace platform {

// Hands stored documents to the OS share/open facility
class DocumentPresenter {
public:
  DocumentPresenter(const store::DocumentStore& store, ShareTarget& target);

  // Both throw DocumentNotFoundError when the file is gone and
  // ShareUnavailableError when the target cannot be used
  void share(const store::StoredDocument& document);
  void open(const store::StoredDocument& document);

private:
  const store::DocumentStore& store_;
  ShareTarget& target_;

  void ensure_presentable(const store::StoredDocument& document) const;
};

} // namespace platform
} // namespace pdfshelf
