#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace MdResource {

void Config::LoadFromJson(const nlohmann::json& data) {
    const Config defaults;
    log_level = data.value("log_level", defaults.log_level);
    logs_dir = data.value("logs_dir", defaults.logs_dir);
    file_read_limit_bytes = data.value("file_read_limit_bytes", defaults.file_read_limit_bytes);
    enable_file_resources = data.value("enable_file_resources", defaults.enable_file_resources);
    enable_data_resources = data.value("enable_data_resources", defaults.enable_data_resources);
    strict_mode = data.value("strict_mode", defaults.strict_mode);
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["log_level"] = log_level;
    data["logs_dir"] = logs_dir;
    data["file_read_limit_bytes"] = file_read_limit_bytes;
    data["enable_file_resources"] = enable_file_resources;
    data["enable_data_resources"] = enable_data_resources;
    data["strict_mode"] = strict_mode;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    f.close();
    LoadFromJson(data);

    // Write back missing keys so existing config.json reflects newly added options.
    // Unknown keys are preserved.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        try {
            std::filesystem::path p(path);
            std::filesystem::path bak = p;
            bak += ".bak";
            std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing);

            std::ofstream o(path, std::ios::trunc);
            o << std::setw(4) << data << std::endl;
            if (!o.good()) {
                Logger::Log(LogLevel::Warn, "Could not write missing keys back to " + path);
            }
        } catch (const std::filesystem::filesystem_error& e) {
            // Not fatal: the values are already loaded.
            Logger::Log(LogLevel::Warn, "Could not back up config before update: " + std::string(e.what()));
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    const Config defaults;
    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << defaults.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
