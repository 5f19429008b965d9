#ifndef PDFSHELF_PLATFORM_RENDERER_HPP
#define PDFSHELF_PLATFORM_RENDERER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace pdfshelf {
namespace platform {

// One picked image, referenced by file path or data URI
struct ImageSource {
    std::string uri;

    // "image/png", "image/gif", "image/webp", otherwise "image/jpeg".
    // Data URIs report their embedded type.
    std::string mime_type() const;
};

// External HTML-to-PDF facility. Produces a temporary PDF the caller then owns.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual std::filesystem::path render(const std::vector<ImageSource>& images) = 0;

protected:
    Renderer() = default;
};

} // namespace platform
} // namespace pdfshelf

#endif // PDFSHELF_PLATFORM_RENDERER_HPP
