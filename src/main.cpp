#include <iostream>
#include <filesystem>
#include <string>
#include <vector>
#include "../config/Config.hpp"
#include "core/HandlerFactory.hpp"
#include "utils/Logger.hpp"
#include "utils/Url.hpp"

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <path>] <url>" << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        MdResource::Logger::Log(MdResource::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }

    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    std::string config_path_str = (exe_dir / "config" / "config.json").string();
    std::string url_arg;

    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            config_path_str = args[++i];
        } else if (args[i] == "-h" || args[i] == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (url_arg.empty()) {
            url_arg = args[i];
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }
    if (url_arg.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    // Load Config
    try {
        MdResource::Config::GetInstance().Load(config_path_str);
        MdResource::Logger::Log(MdResource::LogLevel::Debug, "Configuration loaded from: " + config_path_str);
    } catch (const std::runtime_error& e) {
        MdResource::Logger::Log(MdResource::LogLevel::Warn, std::string(e.what()) + ". Creating a default one.");
        try {
            MdResource::Config::GetInstance().CreateDefault(config_path_str);
        } catch (const std::exception& create_e) {
            MdResource::Logger::Log(MdResource::LogLevel::Warn, "Failed to create default config, continuing with defaults: " + std::string(create_e.what()));
        }
    } catch (const nlohmann::json::exception& e) {
        MdResource::Logger::Log(MdResource::LogLevel::Error, "Failed to parse config " + config_path_str + ": " + e.what());
        return 1;
    }
    const auto& config = MdResource::Config::GetInstance();
    MdResource::Logger::Init(config.logs_dir, MdResource::Logger::FromString(config.log_level));

    auto url = MdResource::Url::Parse(url_arg);
    if (!url) {
        // Accept plain local paths for convenience.
        std::error_code ec;
        auto absolute = std::filesystem::absolute(url_arg, ec);
        if (!ec) url = MdResource::Url::FromFilePath(absolute);
    }
    if (!url) {
        MdResource::Logger::Log(MdResource::LogLevel::Error, "Not an absolute URL: " + url_arg);
        return 1;
    }

    auto handler = MdResource::BuildHandlerChain(config);
    MdResource::ReadResult result = handler->ReadResource(*url);
    if (!result.Ok()) {
        MdResource::Logger::Log(MdResource::LogLevel::Error, "Failed to read " + url->ToString() + ": " + result.Error().ToString());
        return result.IsUnsupported() ? 2 : 1;
    }

    const auto& data = result.Data();
    MdResource::Logger::Log(MdResource::LogLevel::Info, "Read " + std::to_string(data.data.size()) + " bytes from " + url->ToString()
        + " (" + data.MimeTypeEssence().value_or("unknown type") + ")");
    std::cout.write(reinterpret_cast<const char*>(data.data.data()), static_cast<std::streamsize>(data.data.size()));
    std::cout.flush();
    return std::cout.good() ? 0 : 1;
}
