#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../interfaces/IResourceUrlHandler.hpp"

namespace MdResource {

// Decodes data: URLs (RFC 2397), e.g. "data:image/png;base64,iVBORw0...".
class DataUrlHandler : public IResourceUrlHandler {
public:
    ReadResult ReadResource(const Url& url) const override;
    std::string Describe() const override { return "DataUrlHandler"; }
};

namespace DataUrlUtil {

// Forgiving base64 decoding: ASCII whitespace is ignored and padding is optional.
// Returns std::nullopt on characters outside the base64 alphabet or a bad length.
std::optional<std::vector<std::uint8_t>> DecodeBase64(const std::string& input);

}

}
