#include "HandlerFactory.hpp"
#include "../handlers/DataUrlHandler.hpp"
#include "../handlers/FileResourceHandler.hpp"
#include "../handlers/NoopResourceHandler.hpp"
#include "../utils/Logger.hpp"

namespace MdResource {

std::unique_ptr<DispatchingResourceHandler> BuildHandlerChain(const Config& config) {
    DispatchingResourceHandler::HandlerList handlers;

    if (config.strict_mode) {
        Logger::Log(LogLevel::Info, "Strict mode enabled, resources will not be read.");
        handlers.push_back(std::make_unique<NoopResourceHandler>());
        return std::make_unique<DispatchingResourceHandler>(std::move(handlers));
    }

    if (config.enable_file_resources) {
        handlers.push_back(std::make_unique<FileResourceHandler>(config.file_read_limit_bytes));
    }
    if (config.enable_data_resources) {
        handlers.push_back(std::make_unique<DataUrlHandler>());
    }

    auto chain = std::make_unique<DispatchingResourceHandler>(std::move(handlers));
    Logger::Log(LogLevel::Debug, "Resource handler chain: " + chain->Describe());
    return chain;
}

}
