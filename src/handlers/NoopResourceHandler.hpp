#pragma once
#include "../interfaces/IResourceUrlHandler.hpp"

namespace MdResource {

// Reads nothing: every URL is reported as Unsupported.
class NoopResourceHandler : public IResourceUrlHandler {
public:
    ReadResult ReadResource(const Url& url) const override;
    std::string Describe() const override { return "NoopResourceHandler"; }
};

}
