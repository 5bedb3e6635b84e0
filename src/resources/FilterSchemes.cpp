#include "FilterSchemes.hpp"
#include <algorithm>

namespace MdResource {

std::optional<ResourceError> FilterSchemes(const std::vector<std::string>& schemes, const Url& url) {
    if (std::find(schemes.begin(), schemes.end(), url.Scheme()) != schemes.end()) {
        return std::nullopt;
    }

    std::string expected = "[";
    for (size_t i = 0; i < schemes.size(); ++i) {
        if (i > 0) expected += ", ";
        expected += "\"" + schemes[i] + "\"";
    }
    expected += "]";
    return ResourceError::Unsupported("Unsupported scheme in " + url.ToString() + ", expected one of " + expected);
}

}
