#ifndef PDFSHELF_STORE_ERROR_HPP
#define PDFSHELF_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pdfshelf::store {

enum class StoreErrorCode {
    SOURCE_NOT_FOUND,
    DESTINATION_UNWRITABLE,
    NOT_FOUND,
    COLLISION_UNRESOLVED
};

inline const char* store_error_to_string(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::SOURCE_NOT_FOUND: return "Source not found";
        case StoreErrorCode::DESTINATION_UNWRITABLE: return "Destination unwritable";
        case StoreErrorCode::NOT_FOUND: return "Document not found";
        case StoreErrorCode::COLLISION_UNRESOLVED: return "Collision unresolved";
        default: return "Undefined error";
    }
}

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorCode code, const std::string& message)
        : std::runtime_error(std::string(store_error_to_string(code)) + ": " + message)
        , code_(code) {}

    StoreErrorCode code() const { return code_; }

private:
    StoreErrorCode code_;
};

class SourceNotFoundError : public StoreError {
public:
    explicit SourceNotFoundError(const std::string& message)
        : StoreError(StoreErrorCode::SOURCE_NOT_FOUND, message) {}
};

class DestinationUnwritableError : public StoreError {
public:
    explicit DestinationUnwritableError(const std::string& message)
        : StoreError(StoreErrorCode::DESTINATION_UNWRITABLE, message) {}
};

class DocumentNotFoundError : public StoreError {
public:
    explicit DocumentNotFoundError(const std::string& message)
        : StoreError(StoreErrorCode::NOT_FOUND, message) {}
};

class CollisionUnresolvedError : public StoreError {
public:
    explicit CollisionUnresolvedError(const std::string& message)
        : StoreError(StoreErrorCode::COLLISION_UNRESOLVED, message) {}
};

} // namespace pdfshelf::store

#endif // PDFSHELF_STORE_ERROR_HPP
