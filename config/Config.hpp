#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace MdResource {
    struct Config {
        std::string log_level = "info";
        std::string logs_dir = "";              // empty: console only
        std::uint64_t file_read_limit_bytes = 104857600; // 100MB
        bool enable_file_resources = true;
        bool enable_data_resources = true;
        bool strict_mode = false;               // read no resources at all

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        // Throws std::runtime_error if the file cannot be opened and
        // nlohmann::json::exception if it is not valid JSON.
        void Load(const std::string& path);
        void LoadFromJson(const nlohmann::json& data);
        nlohmann::json ToJson() const;
        void CreateDefault(const std::string& path);
    };
}
