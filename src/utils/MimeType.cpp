#include "MimeType.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

static inline void ascii_tolower_inplace(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
}

static inline std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// RFC 2045 token characters
static inline bool is_token(const std::string& s) {
    if (s.empty()) return false;
    static const std::string tspecials = "()<>@,;:\\\"/[]?=";
    for (unsigned char c : s) {
        if (c <= 0x20 || c >= 0x7f || tspecials.find(static_cast<char>(c)) != std::string::npos) return false;
    }
    return true;
}

} // anonymous namespace

namespace MdResource {

std::optional<MimeType> MimeType::Parse(const std::string& text) {
    auto semi = text.find(';');
    std::string essence = trim(text.substr(0, semi));
    auto slash = essence.find('/');
    if (slash == std::string::npos) return std::nullopt;

    MimeType mime;
    mime.type = essence.substr(0, slash);
    mime.subtype = essence.substr(slash + 1);
    if (!is_token(mime.type) || !is_token(mime.subtype)) return std::nullopt;
    ascii_tolower_inplace(mime.type);
    ascii_tolower_inplace(mime.subtype);

    // Parameters: name=token or name="quoted string" (RFC 2045), separated by ';'.
    size_t pos = semi;
    while (pos != std::string::npos && pos < text.size()) {
        ++pos;
        auto name_end = text.find_first_of("=;", pos);
        if (name_end == std::string::npos || text[name_end] == ';') {
            if (!trim(text.substr(pos, name_end == std::string::npos ? std::string::npos : name_end - pos)).empty()) {
                return std::nullopt;
            }
            pos = name_end;
            continue;
        }
        std::string name = trim(text.substr(pos, name_end - pos));
        if (!is_token(name)) return std::nullopt;

        pos = text.find_first_not_of(" \t", name_end + 1);
        std::string value;
        if (pos != std::string::npos && text[pos] == '"') {
            bool closed = false;
            for (++pos; pos < text.size(); ++pos) {
                char c = text[pos];
                if (c == '\\' && pos + 1 < text.size()) {
                    value.push_back(text[++pos]);
                } else if (c == '"') {
                    closed = true;
                    ++pos;
                    break;
                } else {
                    value.push_back(c);
                }
            }
            if (!closed) return std::nullopt;
            pos = text.find_first_not_of(" \t", pos);
            if (pos != std::string::npos && text[pos] != ';') return std::nullopt;
        } else if (pos != std::string::npos) {
            auto next = text.find(';', pos);
            value = trim(text.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
            pos = next;
        }

        ascii_tolower_inplace(name);
        mime.params.emplace_back(std::move(name), std::move(value));
    }
    return mime;
}

std::optional<std::string> MimeType::Param(const std::string& name) const {
    std::string key = name;
    ascii_tolower_inplace(key);
    for (const auto& p : params) {
        if (p.first == key) return p.second;
    }
    return std::nullopt;
}

std::string MimeType::ToString() const {
    std::string out = Essence();
    for (const auto& p : params) {
        out += "; " + p.first + "=";
        if (is_token(p.second)) {
            out += p.second;
            continue;
        }
        out += '"';
        for (char c : p.second) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    return out;
}

namespace MimeUtil {

std::optional<MimeType> GuessFromPath(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, const char*> by_extension = {
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"svgz", "image/svg+xml"},
        {"webp", "image/webp"},
        {"bmp", "image/bmp"},
        {"ico", "image/x-icon"},
        {"tif", "image/tiff"},
        {"tiff", "image/tiff"},
        {"avif", "image/avif"},
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"markdown", "text/markdown"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"js", "text/javascript"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"pdf", "application/pdf"},
    };

    std::string ext = path.extension().string();
    if (ext.size() < 2) return std::nullopt;
    ext.erase(0, 1);
    ascii_tolower_inplace(ext);

    auto it = by_extension.find(ext);
    if (it == by_extension.end()) return std::nullopt;
    return MimeType::Parse(it->second);
}

}

}
