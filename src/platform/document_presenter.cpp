#include "platform/document_presenter.hpp"
#include <boost/log/trivial.hpp>

namespace pdfshelf {
namespace platform {

DocumentPresenter::DocumentPresenter(const store::DocumentStore& store, ShareTarget& target)
  : store_(store)
  , target_(target) {
}

void DocumentPresenter::share(const store::StoredDocument& document) {
  BOOST_LOG_TRIVIAL(info) << "DocumentPresenter: Sharing " << document.name;
  ensure_presentable(document);
  target_.share(store_.directory() / document.name, "Share " + document.name, kPdfMimeType);
}

void DocumentPresenter::open(const store::StoredDocument& document) {
  BOOST_LOG_TRIVIAL(info) << "DocumentPresenter: Opening " << document.name;
  ensure_presentable(document);
  target_.open(store_.directory() / document.name, kPdfMimeType);
}

void DocumentPresenter::ensure_presentable(const store::StoredDocument& document) const {
  // Fresh read, the entry may have been deleted since it was listed
  const store::DocumentInfo info = store_.info(document);
  BOOST_LOG_TRIVIAL(debug) << "DocumentPresenter: " << document.name << " is "
                           << info.size_bytes << " bytes";

  if (!target_.is_available()) {
    BOOST_LOG_TRIVIAL(error) << "DocumentPresenter: Share target unavailable";
    throw ShareUnavailableError("no share target on this system");
  }
}

} // namespace platform
} // namespace pdfshelf
