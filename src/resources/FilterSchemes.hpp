#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ResourceError.hpp"
#include "../utils/Url.hpp"

namespace MdResource {

// Accept only URLs whose scheme is one of schemes.
// Returns std::nullopt if the scheme matches, otherwise an Unsupported error
// naming the URL and the accepted schemes.
std::optional<ResourceError> FilterSchemes(const std::vector<std::string>& schemes, const Url& url);

}
