#include "assembler/document_assembler.hpp"
#include <boost/log/trivial.hpp>

namespace pdfshelf {
namespace assembler {

DocumentAssembler::DocumentAssembler(platform::Renderer& renderer, store::DocumentStore& store)
  : renderer_(renderer)
  , store_(store) {
}

store::StoredDocument DocumentAssembler::assemble(const std::vector<platform::ImageSource>& images,
  const std::string& desired_name) {
  if (images.empty()) {
    BOOST_LOG_TRIVIAL(error) << "DocumentAssembler: No images supplied";
    throw AssemblyError("No images to generate PDF");
  }

  BOOST_LOG_TRIVIAL(info) << "DocumentAssembler: Generating PDF with " << images.size() << " images";
  for (const auto& image : images) {
    BOOST_LOG_TRIVIAL(trace) << "DocumentAssembler: Page " << image.mime_type() << " " << image.uri;
  }

  const std::filesystem::path rendered = renderer_.render(images);
  BOOST_LOG_TRIVIAL(debug) << "DocumentAssembler: Renderer produced " << rendered.string();

  return store_.commit(rendered, desired_name, static_cast<int>(images.size()));
}

} // namespace assembler
} // namespace pdfshelf
