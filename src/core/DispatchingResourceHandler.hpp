#pragma once
#include <memory>
#include <vector>
#include "../interfaces/IResourceUrlHandler.hpp"

namespace MdResource {

// Tries a list of handlers in order until one of them claims the URL.
class DispatchingResourceHandler : public IResourceUrlHandler {
public:
    using HandlerList = std::vector<std::unique_ptr<IResourceUrlHandler>>;

    // Throws std::invalid_argument if the list contains a null handler.
    explicit DispatchingResourceHandler(HandlerList handlers);

    // Returns the first successful read, or the first error that is not
    // Unsupported. If every handler declines, returns Unsupported.
    ReadResult ReadResource(const Url& url) const override;
    std::string Describe() const override;

    size_t Size() const { return handlers_.size(); }

private:
    HandlerList handlers_;
};

}
