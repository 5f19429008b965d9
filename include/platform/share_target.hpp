#ifndef PDFSHELF_PLATFORM_SHARE_TARGET_HPP
#define PDFSHELF_PLATFORM_SHARE_TARGET_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace pdfshelf {
namespace platform {

inline constexpr const char* kPdfMimeType = "application/pdf";

class ShareError : public std::runtime_error {
public:
    explicit ShareError(const std::string& message)
        : std::runtime_error(message) {}
};

class ShareUnavailableError : public ShareError {
public:
    explicit ShareUnavailableError(const std::string& message)
        : ShareError("Sharing unavailable: " + message) {}
};

// OS facility that shows a share sheet or hands a file to an external viewer
class ShareTarget {
public:
    virtual ~ShareTarget() = default;

    virtual bool is_available() const = 0;
    virtual void share(const std::filesystem::path& path, const std::string& dialog_title,
                       const std::string& mime_type) = 0;
    virtual void open(const std::filesystem::path& path, const std::string& mime_type) = 0;

protected:
    ShareTarget() = default;
};

// Desktop Linux target, both actions go through xdg-open
class XdgOpenTarget : public ShareTarget {
public:
    bool is_available() const override;
    void share(const std::filesystem::path& path, const std::string& dialog_title,
               const std::string& mime_type) override;
    void open(const std::filesystem::path& path, const std::string& mime_type) override;

private:
    void launch(const std::filesystem::path& path) const;
};

// Single-quotes a value for /bin/sh
std::string shell_quote(const std::string& value);

} // namespace platform
} // namespace pdfshelf

#endif // PDFSHELF_PLATFORM_SHARE_TARGET_HPP
