#pragma once
#include <variant>
#include <utility>
#include "MimeData.hpp"
#include "ResourceError.hpp"

namespace MdResource {

// Outcome of IResourceUrlHandler::ReadResource: either the resource or an error.
class ReadResult {
public:
    ReadResult(MimeData data) : value_(std::move(data)) {}
    ReadResult(ResourceError error) : value_(std::move(error)) {}

    bool Ok() const { return std::holds_alternative<MimeData>(value_); }
    bool IsUnsupported() const { return !Ok() && Error().IsUnsupported(); }

    // Throws std::bad_variant_access when called on the other alternative.
    const MimeData& Data() const { return std::get<MimeData>(value_); }
    MimeData& Data() { return std::get<MimeData>(value_); }
    const ResourceError& Error() const { return std::get<ResourceError>(value_); }

private:
    std::variant<MimeData, ResourceError> value_;
};

}
