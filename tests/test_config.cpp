#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include "../config/Config.hpp"
#include "core/HandlerFactory.hpp"
#include "utils/Logger.hpp"

using namespace MdResource;

namespace {

Url MustParse(const std::string& text) {
    auto url = Url::Parse(text);
    REQUIRE(url.has_value());
    return *url;
}

std::filesystem::path TempConfigPath() {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() / ("mdresource-config-" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir / "config.json";
}

} // anonymous namespace

TEST_CASE("Config falls back to defaults for missing keys") {
    Config config;
    config.LoadFromJson(nlohmann::json{{"log_level", "debug"}, {"strict_mode", true}});
    CHECK(config.log_level == "debug");
    CHECK(config.strict_mode);
    CHECK(config.enable_file_resources);
    CHECK(config.enable_data_resources);
    CHECK(config.file_read_limit_bytes == 104857600);
}

TEST_CASE("Config::Load writes missing keys back to the file") {
    auto path = TempConfigPath();
    {
        std::ofstream o(path);
        o << R"({"file_read_limit_bytes": 2048, "custom_key": 1})";
    }

    Config config;
    config.Load(path.string());
    CHECK(config.file_read_limit_bytes == 2048);

    std::ifstream f(path);
    auto written = nlohmann::json::parse(f);
    CHECK(written.contains("strict_mode"));
    CHECK(written.contains("enable_data_resources"));
    CHECK(written["custom_key"] == 1);
    CHECK(written["file_read_limit_bytes"] == 2048);

    std::error_code ec;
    std::filesystem::remove_all(path.parent_path(), ec);
}

TEST_CASE("Config::Load throws on a missing file") {
    Config config;
    CHECK_THROWS_AS(config.Load("/nonexistent/mdresource/config.json"), std::runtime_error);
}

TEST_CASE("Config::CreateDefault writes a loadable file") {
    auto path = TempConfigPath();
    Config().CreateDefault(path.string());

    Config config;
    config.strict_mode = true;
    config.Load(path.string());
    CHECK_FALSE(config.strict_mode);
    CHECK(config.log_level == "info");

    std::error_code ec;
    std::filesystem::remove_all(path.parent_path(), ec);
}

TEST_CASE("BuildHandlerChain follows the configuration") {
    Config config;

    SECTION("default chain reads file and data URLs") {
        auto chain = BuildHandlerChain(config);
        CHECK(chain->Size() == 2);
        CHECK(chain->Describe() == "DispatchingResourceHandler[FileResourceHandler, DataUrlHandler]");
        CHECK(chain->ReadResource(MustParse("data:,hi")).Ok());
        CHECK(chain->ReadResource(MustParse("https://example.com/x.png")).IsUnsupported());
    }

    SECTION("disabled data URLs are declined") {
        config.enable_data_resources = false;
        auto chain = BuildHandlerChain(config);
        CHECK(chain->Size() == 1);
        CHECK(chain->ReadResource(MustParse("data:,hi")).IsUnsupported());
    }

    SECTION("strict mode reads nothing") {
        config.strict_mode = true;
        auto chain = BuildHandlerChain(config);
        CHECK(chain->Describe() == "DispatchingResourceHandler[NoopResourceHandler]");
        CHECK(chain->ReadResource(MustParse("data:,hi")).IsUnsupported());
        CHECK(chain->ReadResource(MustParse("file:///etc/hosts")).IsUnsupported());
    }
}

TEST_CASE("Logger parses level names") {
    CHECK(Logger::FromString("DEBUG") == LogLevel::Debug);
    CHECK(Logger::FromString("warning") == LogLevel::Warn);
    CHECK(Logger::FromString("err") == LogLevel::Error);
    CHECK(Logger::FromString("bogus") == LogLevel::Info);
}
