#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "platform/renderer.hpp"
#include "store/document_store.hpp"

namespace pdfshelf {
namespace assembler {

class AssemblyError : public std::runtime_error {
public:
  explicit AssemblyError(const std::string& message) : std::runtime_error(message) {}
};

// Renders a set of images into one PDF and commits it to the store
class DocumentAssembler {
public:
  DocumentAssembler(platform::Renderer& renderer, store::DocumentStore& store);

  // Throws AssemblyError for an empty image list; store errors propagate.
  // The image count seeds the default name when desired_name is unusable.
  store::StoredDocument assemble(const std::vector<platform::ImageSource>& images,
    const std::string& desired_name);

private:
  platform::Renderer& renderer_;
  store::DocumentStore& store_;
};

} // namespace assembler
} // namespace pdfshelf
