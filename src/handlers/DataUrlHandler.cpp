#include "DataUrlHandler.hpp"
#include <algorithm>
#include <utility>
#include "../resources/FilterSchemes.hpp"
#include "../utils/Logger.hpp"

namespace {

constexpr const char* kDefaultMediaType = "text/plain;charset=US-ASCII";

static inline std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n\f");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n\f");
    return s.substr(begin, end - begin + 1);
}

static inline bool iends_with(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return std::equal(suffix.rbegin(), suffix.rend(), s.rbegin(), [](char a, char b) {
        auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c; };
        return lower(a) == lower(b);
    });
}

static inline int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

namespace MdResource {

namespace DataUrlUtil {

std::optional<std::vector<std::uint8_t>> DecodeBase64(const std::string& input) {
    std::string s;
    s.reserve(input.size());
    for (char c : input) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r') continue;
        s.push_back(c);
    }

    if (s.size() % 4 == 0 && !s.empty() && s.back() == '=') {
        s.pop_back();
        if (s.back() == '=') s.pop_back();
    }
    if (s.size() % 4 == 1) return std::nullopt;

    std::vector<std::uint8_t> out;
    out.reserve(s.size() * 3 / 4);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : s) {
        int v = base64_value(c);
        if (v < 0) return std::nullopt;
        buffer = (buffer << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

}

ReadResult DataUrlHandler::ReadResource(const Url& url) const {
    if (auto rejected = FilterSchemes({"data"}, url)) {
        return *rejected;
    }

    // Everything after "data:" up to the fragment.
    std::string body = url.ToString().substr(url.Scheme().size() + 1);
    if (url.Fragment()) {
        body.erase(body.size() - url.Fragment()->size() - 1);
    }

    auto comma = body.find(',');
    if (comma == std::string::npos) {
        return ResourceError{ResourceErrorKind::InvalidData, "Missing ',' in data URL " + url.ToString()};
    }

    std::string header = trim(UrlUtil::PercentDecode(body.substr(0, comma)));
    std::string payload = UrlUtil::PercentDecode(body.substr(comma + 1));

    bool is_base64 = false;
    if (iends_with(header, ";base64")) {
        is_base64 = true;
        header = trim(header.substr(0, header.size() - 7));
    }
    if (header.empty()) {
        header = kDefaultMediaType;
    } else if (header[0] == ';') {
        header = "text/plain" + header;
    }

    MimeData result;
    result.mime_type = MimeType::Parse(header);
    if (!result.mime_type) {
        Logger::Log(LogLevel::Debug, "Invalid media type '" + header + "' in data URL, using " + kDefaultMediaType);
        result.mime_type = MimeType::Parse(kDefaultMediaType);
    }

    if (is_base64) {
        auto decoded = DataUrlUtil::DecodeBase64(payload);
        if (!decoded) {
            return ResourceError{ResourceErrorKind::InvalidData, "Invalid base64 payload in data URL"};
        }
        result.data = std::move(*decoded);
    } else {
        result.data.assign(payload.begin(), payload.end());
    }

    return ReadResult(std::move(result));
}

}
