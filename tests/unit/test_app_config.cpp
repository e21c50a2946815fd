#include <catch2/catch_test_macros.hpp>
#include "AppConfig.hpp"
#include "TestHelpers.hpp"

using flatsync::AppConfig;

TEST_CASE("defaults match the documented configuration") {
    EnvVarGuard data_guard("FLATSYNC_DATA_DIR", std::nullopt);
    const AppConfig config = AppConfig::defaults();

    CHECK(config.dataPath == (std::filesystem::current_path() / "data").string());
    CHECK(config.supportedExtensions == std::vector<std::string>{".php", ".js", ".jsx", ".ts", ".tsx", ".py"});
    CHECK(config.excludedDirs == std::vector<std::string>{"node_modules", "vendor", ".git", "dist", "build"});
    CHECK(config.excludedExtensions == std::vector<std::string>{".lock", ".pyc"});
    CHECK_FALSE(config.disambiguateCollisions);
}

TEST_CASE("FLATSYNC_DATA_DIR overrides the data path") {
    TempDir temp_dir;
    EnvVarGuard data_guard("FLATSYNC_DATA_DIR", temp_dir.path().string());

    CHECK(AppConfig::defaults().dataPath == temp_dir.path().string());

    const auto config_path = temp_dir.path() / "app.json";
    write_file(config_path, R"({"dataPath": "/somewhere/else"})");
    CHECK(AppConfig::load(config_path.string()).dataPath == temp_dir.path().string());
}

TEST_CASE("a missing config file yields defaults") {
    TempDir temp_dir;
    EnvVarGuard data_guard("FLATSYNC_DATA_DIR", std::nullopt);
    const AppConfig config = AppConfig::load((temp_dir.path() / "absent.json").string());
    CHECK(config.excludedDirs == AppConfig::defaults().excludedDirs);
}

TEST_CASE("a malformed config file yields defaults") {
    TempDir temp_dir;
    EnvVarGuard data_guard("FLATSYNC_DATA_DIR", std::nullopt);
    const auto config_path = temp_dir.path() / "app.json";

    write_file(config_path, "{ \"excludedDirs\": [");
    CHECK(AppConfig::load(config_path.string()).excludedDirs == AppConfig::defaults().excludedDirs);

    write_file(config_path, R"({"disambiguateCollisions": "yes", "excludedDirs": ["x"]})");
    const AppConfig config = AppConfig::load(config_path.string());
    CHECK(config.excludedDirs == AppConfig::defaults().excludedDirs);
    CHECK_FALSE(config.disambiguateCollisions);
}

TEST_CASE("config keys override defaults individually") {
    TempDir temp_dir;
    EnvVarGuard data_guard("FLATSYNC_DATA_DIR", std::nullopt);
    const auto config_path = temp_dir.path() / "app.json";
    write_file(config_path, R"({
        "dataPath": "/var/flatsync",
        "excludedDirs": ["target"],
        "disambiguateCollisions": true,
        "unknownKey": 1
    })");

    const AppConfig config = AppConfig::load(config_path.string());
    CHECK(config.dataPath == "/var/flatsync");
    CHECK(config.excludedDirs == std::vector<std::string>{"target"});
    CHECK(config.disambiguateCollisions);
    CHECK(config.supportedExtensions == AppConfig::defaults().supportedExtensions);
}

TEST_CASE("save writes a file that load reads back") {
    TempDir temp_dir;
    EnvVarGuard data_guard("FLATSYNC_DATA_DIR", std::nullopt);
    const auto config_path = temp_dir.path() / "config" / "app.json";

    AppConfig config = AppConfig::defaults();
    config.dataPath = (temp_dir.path() / "data").string();
    config.supportedExtensions = {".rs"};
    config.disambiguateCollisions = true;
    REQUIRE(config.save(config_path.string()));

    const AppConfig loaded = AppConfig::load(config_path.string());
    CHECK(loaded.dataPath == config.dataPath);
    CHECK(loaded.supportedExtensions == config.supportedExtensions);
    CHECK(loaded.disambiguateCollisions);
}

TEST_CASE("FLATSYNC_CONFIG selects the config path") {
    EnvVarGuard config_guard("FLATSYNC_CONFIG", std::string("/etc/flatsync/app.json"));
    CHECK(AppConfig::defaultConfigPath() == "/etc/flatsync/app.json");
}

TEST_CASE("default filter uses the configured lists") {
    EnvVarGuard data_guard("FLATSYNC_DATA_DIR", std::nullopt);
    const auto filter = AppConfig::defaults().defaultFilter();
    REQUIRE(filter.includeExtensions.has_value());
    CHECK(filter.includeExtensions->size() == 6);
    CHECK(filter.excludeDirNames.size() == 5);
}

TEST_CASE("extension groups cover the offered categories") {
    const auto& groups = flatsync::extensionGroups();
    CHECK(groups.size() == 8);
    REQUIRE(groups.count("JavaScript") == 1);
    CHECK(groups.at("JavaScript").front() == ".js");
    CHECK(groups.count("Shell") == 1);
}
