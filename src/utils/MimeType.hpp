#pragma once
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <filesystem>

namespace MdResource {

// A media type such as "image/svg+xml; charset=utf-8".
struct MimeType {
    std::string type;
    std::string subtype;
    std::vector<std::pair<std::string, std::string>> params;

    // Lowercases type, subtype and parameter names; strips quotes from parameter values.
    static std::optional<MimeType> Parse(const std::string& text);

    // "type/subtype" without parameters.
    std::string Essence() const { return type + "/" + subtype; }

    std::optional<std::string> Param(const std::string& name) const;
    std::string ToString() const;
};

namespace MimeUtil {

// Guess a media type from the extension of a local file name.
std::optional<MimeType> GuessFromPath(const std::filesystem::path& path);

}

}
