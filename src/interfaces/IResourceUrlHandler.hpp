#pragma once
#include <string>
#include "../resources/ReadResult.hpp"
#include "../utils/Url.hpp"

namespace MdResource {

// Reads the resource behind a URL.
//
// ReadResource either returns the data, an error of kind Unsupported when the
// URL is outside what this handler deals with (so that a caller may try another
// handler), or any other error when the URL is recognised but reading failed.
//
// Implementations must be safe to call concurrently on the same instance.
class IResourceUrlHandler {
public:
    virtual ~IResourceUrlHandler() = default;
    virtual ReadResult ReadResource(const Url& url) const = 0;

    // Short name used in log messages.
    virtual std::string Describe() const = 0;
};

}
