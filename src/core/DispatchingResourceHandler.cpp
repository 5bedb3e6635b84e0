#include "DispatchingResourceHandler.hpp"
#include <stdexcept>
#include "../utils/Logger.hpp"

namespace MdResource {

DispatchingResourceHandler::DispatchingResourceHandler(HandlerList handlers)
    : handlers_(std::move(handlers)) {
    for (const auto& handler : handlers_) {
        if (!handler) {
            throw std::invalid_argument("DispatchingResourceHandler: null handler in list");
        }
    }
}

ReadResult DispatchingResourceHandler::ReadResource(const Url& url) const {
    for (const auto& handler : handlers_) {
        ReadResult result = handler->ReadResource(url);
        if (result.Ok()) {
            return result;
        }
        if (!result.IsUnsupported()) {
            Logger::Log(LogLevel::Debug, handler->Describe() + " failed to read " + url.ToString() + ": " + result.Error().ToString());
            return result;
        }
        Logger::Log(LogLevel::Debug, handler->Describe() + " declined " + url.ToString());
    }
    return ResourceError::Unsupported("No handler supported reading from " + url.ToString());
}

std::string DispatchingResourceHandler::Describe() const {
    std::string out = "DispatchingResourceHandler[";
    for (size_t i = 0; i < handlers_.size(); ++i) {
        if (i > 0) out += ", ";
        out += handlers_[i]->Describe();
    }
    return out + "]";
}

}
