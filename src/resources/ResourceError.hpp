#pragma once
#include <string>
#include <utility>

namespace MdResource {

enum class ResourceErrorKind {
    // The handler does not deal with this URL; another handler may.
    Unsupported,
    NotFound,
    PermissionDenied,
    InvalidData,
    TooLarge,
    Io
};

const char* ToString(ResourceErrorKind kind);

struct ResourceError {
    ResourceErrorKind kind = ResourceErrorKind::Io;
    std::string message;

    bool IsUnsupported() const { return kind == ResourceErrorKind::Unsupported; }
    std::string ToString() const;

    static ResourceError Unsupported(std::string message) {
        return ResourceError{ResourceErrorKind::Unsupported, std::move(message)};
    }
};

}
