#include "ResourceError.hpp"

namespace MdResource {

const char* ToString(ResourceErrorKind kind) {
    switch (kind) {
        case ResourceErrorKind::Unsupported:      return "unsupported";
        case ResourceErrorKind::NotFound:         return "not found";
        case ResourceErrorKind::PermissionDenied: return "permission denied";
        case ResourceErrorKind::InvalidData:      return "invalid data";
        case ResourceErrorKind::TooLarge:         return "too large";
        case ResourceErrorKind::Io:               return "i/o error";
    }
    return "unknown";
}

std::string ResourceError::ToString() const {
    return std::string(MdResource::ToString(kind)) + ": " + message;
}

}
