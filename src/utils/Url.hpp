#pragma once
#include <string>
#include <optional>
#include <filesystem>

namespace MdResource {

// An absolute URL split into its RFC 3986 components.
// Components are stored as they appear in the input (no percent-decoding),
// except for the scheme and host which are lowercased.
class Url {
public:
    // Returns std::nullopt unless text is an absolute URL (scheme ":" ...).
    static std::optional<Url> Parse(const std::string& text);

    // Builds a file:// URL for an absolute local path.
    // Returns std::nullopt for relative paths.
    static std::optional<Url> FromFilePath(const std::filesystem::path& path);

    const std::string& Scheme() const { return scheme_; }
    bool HasAuthority() const { return has_authority_; }
    const std::string& Authority() const { return authority_; }
    const std::string& Host() const { return host_; }
    std::optional<int> Port() const { return port_; }
    const std::string& Path() const { return path_; }
    const std::optional<std::string>& Query() const { return query_; }
    const std::optional<std::string>& Fragment() const { return fragment_; }

    // Local path for file URLs on this host (empty host or "localhost").
    std::optional<std::filesystem::path> ToFilePath() const;

    std::string ToString() const;

    bool operator==(const Url& other) const { return ToString() == other.ToString(); }
    bool operator!=(const Url& other) const { return !(*this == other); }

private:
    Url() = default;

    std::string scheme_;
    bool has_authority_ = false;
    std::string authority_;
    std::string host_;
    std::optional<int> port_;
    std::string path_;
    std::optional<std::string> query_;
    std::optional<std::string> fragment_;
};

namespace UrlUtil {

// Decode %XX escapes; malformed escapes are copied through unchanged.
std::string PercentDecode(const std::string& s);

// Escape everything outside the RFC 3986 path character set.
std::string PercentEncodePath(const std::string& s);

}

}
