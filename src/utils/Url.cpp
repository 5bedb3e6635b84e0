#include "Url.hpp"
#include <algorithm>
#include <cctype>

namespace {

static inline char ascii_tolower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

static inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ascii_tolower);
    return s;
}

static inline bool is_scheme_char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

static inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Splits "userinfo@host:port" and returns false on an invalid port.
bool split_authority(const std::string& authority, std::string& host, std::optional<int>& port) {
    std::string hostport = authority;
    auto at = hostport.rfind('@');
    if (at != std::string::npos) hostport = hostport.substr(at + 1);

    size_t port_sep = std::string::npos;
    if (!hostport.empty() && hostport[0] == '[') {
        // IPv6 literal
        auto close = hostport.find(']');
        if (close == std::string::npos) return false;
        if (close + 1 < hostport.size()) {
            if (hostport[close + 1] != ':') return false;
            port_sep = close + 1;
        }
    } else {
        port_sep = hostport.rfind(':');
    }

    if (port_sep == std::string::npos) {
        host = to_lower(hostport);
        return true;
    }

    std::string port_str = hostport.substr(port_sep + 1);
    host = to_lower(hostport.substr(0, port_sep));
    if (port_str.empty()) return true;
    if (port_str.size() > 5) return false;
    int value = 0;
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    if (value > 65535) return false;
    port = value;
    return true;
}

} // anonymous namespace

namespace MdResource {

std::optional<Url> Url::Parse(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (unsigned char c : text) {
        if (c <= 0x20 || c == 0x7f) return std::nullopt;
    }

    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0) return std::nullopt;
    if (!std::isalpha(static_cast<unsigned char>(text[0]))) return std::nullopt;
    for (size_t i = 1; i < colon; ++i) {
        if (!is_scheme_char(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }

    Url url;
    url.scheme_ = to_lower(text.substr(0, colon));

    std::string rest = text.substr(colon + 1);

    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        url.fragment_ = rest.substr(hash + 1);
        rest.erase(hash);
    }

    if (rest.compare(0, 2, "//") == 0) {
        url.has_authority_ = true;
        auto end = rest.find_first_of("/?", 2);
        if (end == std::string::npos) end = rest.size();
        url.authority_ = rest.substr(2, end - 2);
        if (!split_authority(url.authority_, url.host_, url.port_)) return std::nullopt;
        rest.erase(0, end);
    }

    auto question = rest.find('?');
    if (question != std::string::npos) {
        url.query_ = rest.substr(question + 1);
        rest.erase(question);
    }
    url.path_ = rest;

    return url;
}

std::optional<Url> Url::FromFilePath(const std::filesystem::path& path) {
    if (!path.is_absolute()) return std::nullopt;
    Url url;
    url.scheme_ = "file";
    url.has_authority_ = true;
    url.path_ = UrlUtil::PercentEncodePath(path.generic_string());
    if (url.path_.empty() || url.path_[0] != '/') url.path_.insert(0, "/");
    return url;
}

std::optional<std::filesystem::path> Url::ToFilePath() const {
    if (scheme_ != "file") return std::nullopt;
    if (!host_.empty() && host_ != "localhost") return std::nullopt;
    if (path_.empty() || path_[0] != '/') return std::nullopt;

    std::string decoded = UrlUtil::PercentDecode(path_);
    if (decoded.find('\0') != std::string::npos) return std::nullopt;
    return std::filesystem::path(decoded);
}

std::string Url::ToString() const {
    std::string out = scheme_ + ":";
    if (has_authority_) out += "//" + authority_;
    out += path_;
    if (query_) out += "?" + *query_;
    if (fragment_) out += "#" + *fragment_;
    return out;
}

namespace UrlUtil {

std::string PercentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string PercentEncodePath(const std::string& s) {
    auto is_path_char = [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || c == '/'
            || c == '!' || c == '$' || c == '&' || c == '\'' || c == '(' || c == ')'
            || c == '*' || c == '+' || c == ',' || c == ';' || c == '=' || c == ':' || c == '@';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_path_char(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

}

}
