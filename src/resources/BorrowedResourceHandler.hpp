#pragma once
#include <string>
#include "../interfaces/IResourceUrlHandler.hpp"

namespace MdResource {

// Forwards to a handler owned elsewhere, so a borrowed handler can be placed
// wherever an owned one is expected. The target must outlive this object.
class BorrowedResourceHandler : public IResourceUrlHandler {
public:
    explicit BorrowedResourceHandler(const IResourceUrlHandler& target) : target_(target) {}

    ReadResult ReadResource(const Url& url) const override { return target_.ReadResource(url); }
    std::string Describe() const override { return target_.Describe(); }

private:
    const IResourceUrlHandler& target_;
};

}
