#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../utils/MimeType.hpp"

namespace MdResource {

// Bytes of a resource together with its media type, if the handler could tell.
struct MimeData {
    std::optional<MimeType> mime_type;
    std::vector<std::uint8_t> data;

    // Media type without parameters, e.g. "image/png".
    std::optional<std::string> MimeTypeEssence() const {
        if (!mime_type) return std::nullopt;
        return mime_type->Essence();
    }
};

}
