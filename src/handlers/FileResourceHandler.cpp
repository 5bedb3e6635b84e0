#include "FileResourceHandler.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>
#include "../resources/FilterSchemes.hpp"
#include "../utils/Logger.hpp"

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

MdResource::ResourceErrorKind KindFromErrno(int err) {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return MdResource::ResourceErrorKind::NotFound;
        case EACCES:
        case EPERM:
            return MdResource::ResourceErrorKind::PermissionDenied;
        default:
            return MdResource::ResourceErrorKind::Io;
    }
}

} // anonymous namespace

namespace MdResource {

FileResourceHandler::FileResourceHandler(std::uint64_t read_limit) : read_limit_(read_limit) {}

ReadResult FileResourceHandler::ReadResource(const Url& url) const {
    if (auto rejected = FilterSchemes({"file"}, url)) {
        return *rejected;
    }

    auto path = url.ToFilePath();
    if (!path) {
        return ResourceError{ResourceErrorKind::InvalidData, "Cannot convert URL " + url.ToString() + " to file path"};
    }

    Logger::Log(LogLevel::Debug, "Reading from resource file " + path->string());

    // Check the type before opening: opening a FIFO would block until a writer appears.
    std::error_code ec;
    auto status = std::filesystem::status(*path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return ResourceError{ResourceErrorKind::NotFound, "No such file " + path->string()};
    }
    if (ec) {
        auto kind = ec == std::errc::permission_denied ? ResourceErrorKind::PermissionDenied : ResourceErrorKind::Io;
        return ResourceError{kind, "Failed to stat " + path->string() + ": " + ec.message()};
    }
    if (status.type() != std::filesystem::file_type::regular) {
        return ResourceError{ResourceErrorKind::Io, path->string() + " is not a regular file"};
    }
    auto size = std::filesystem::file_size(*path, ec);
    if (ec) {
        return ResourceError{ResourceErrorKind::Io, "Failed to stat " + path->string() + ": " + ec.message()};
    }
    if (size > read_limit_) {
        return ResourceError{ResourceErrorKind::TooLarge,
            "Contents of " + url.ToString() + " exceeded " + std::to_string(read_limit_) + " bytes, rejected"};
    }

    errno = 0;
    FilePtr file(std::fopen(path->c_str(), "rb"));
    if (!file) {
        int err = errno;
        return ResourceError{KindFromErrno(err), "Failed to open " + path->string() + ": " + std::strerror(err)};
    }

    MimeData result;
    result.mime_type = MimeUtil::GuessFromPath(*path);
    if (!result.mime_type) {
        Logger::Log(LogLevel::Debug, "Failed to guess mime type from " + path->string());
    }

    // The file may have grown since the size check.
    result.data.reserve(static_cast<size_t>(size));
    char buf[64 * 1024];
    while (true) {
        size_t n = std::fread(buf, 1, sizeof(buf), file.get());
        if (n > 0) {
            result.data.insert(result.data.end(), buf, buf + n);
            if (result.data.size() > read_limit_) {
                return ResourceError{ResourceErrorKind::TooLarge,
                    "Contents of " + url.ToString() + " exceeded " + std::to_string(read_limit_) + " bytes, rejected"};
            }
        }
        if (n < sizeof(buf)) {
            if (std::ferror(file.get())) {
                return ResourceError{ResourceErrorKind::Io, "Failed to read " + path->string()};
            }
            break;
        }
    }

    return ReadResult(std::move(result));
}

}
