#pragma once
#include <cstdint>
#include "../interfaces/IResourceUrlHandler.hpp"

namespace MdResource {

// Reads file: URLs from the local filesystem.
//
// Files larger than the read limit are rejected with TooLarge rather than
// truncated. The media type is guessed from the file extension.
class FileResourceHandler : public IResourceUrlHandler {
public:
    explicit FileResourceHandler(std::uint64_t read_limit);

    ReadResult ReadResource(const Url& url) const override;
    std::string Describe() const override { return "FileResourceHandler"; }

    std::uint64_t ReadLimit() const { return read_limit_; }

private:
    std::uint64_t read_limit_;
};

}
