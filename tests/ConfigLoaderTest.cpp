#include <gtest/gtest.h>
#include "sheetdrop/config/ConfigLoader.hpp"
#include "test_support.hpp"
#include <limits>

using sheetdrop::ConfigLoader;
using sheetdrop::ServerConfig;
using namespace sheetdrop::test;

TEST(ConfigLoaderTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.storageRoot, ".");
    ASSERT_EQ(config.analyzerCommand.size(), 2u);
    EXPECT_EQ(config.analyzerCommand[0], "python3");
    EXPECT_EQ(config.analyzerTimeout, std::chrono::seconds(300));
}

TEST(ConfigLoaderTest, PortFallsBackWhenUnparseable) {
    EXPECT_EQ(ConfigLoader::parsePort("8001", 8000), 8001);
    EXPECT_EQ(ConfigLoader::parsePort("abc", 8000), 8000);
    EXPECT_EQ(ConfigLoader::parsePort("80a", 8000), 8000);
    EXPECT_EQ(ConfigLoader::parsePort("", 8000), 8000);
    EXPECT_EQ(ConfigLoader::parsePort("0", 8000), 8000);
    EXPECT_EQ(ConfigLoader::parsePort("65536", 8000), 8000);
    EXPECT_EQ(ConfigLoader::parsePort("99999999999", 8000), 8000);
}

TEST(ConfigLoaderTest, AppliesKnownSettings) {
    ServerConfig config;
    ConfigLoader::apply({
        {"storage_root", "/srv/sheets"},
        {"analyzer", nlohmann::json::array({"/usr/bin/analyze", "--json"})},
        {"analyzer_timeout_seconds", 0},
        {"max_body_bytes", 1024},
        {"unrelated", true},
    }, config);

    EXPECT_EQ(config.storageRoot, "/srv/sheets");
    EXPECT_EQ(config.analyzerCommand, (std::vector<std::string>{"/usr/bin/analyze", "--json"}));
    EXPECT_EQ(config.analyzerTimeout.count(), 0);
    EXPECT_EQ(config.maxBodyBytes, 1024u);
    EXPECT_EQ(config.port, 8000);
}

TEST(ConfigLoaderTest, RejectsEmptyAnalyzer) {
    ServerConfig config;
    EXPECT_THROW(ConfigLoader::apply({{"analyzer", nlohmann::json::array()}}, config), std::runtime_error);
}

TEST(ConfigLoaderTest, RejectsOutOfRangeNumbers) {
    ServerConfig config;
    EXPECT_THROW(ConfigLoader::apply({{"port", 70000}}, config), std::runtime_error);
    EXPECT_THROW(ConfigLoader::apply({{"port", 0}}, config), std::runtime_error);
    EXPECT_THROW(ConfigLoader::apply({{"port", -80}}, config), std::runtime_error);
    EXPECT_THROW(ConfigLoader::apply({{"port", 8080.5}}, config), std::runtime_error);
    EXPECT_THROW(ConfigLoader::apply({{"analyzer_timeout_seconds", -1}}, config), std::runtime_error);
    EXPECT_THROW(ConfigLoader::apply({{"max_body_bytes", 0}}, config), std::runtime_error);
    EXPECT_THROW(ConfigLoader::apply({{"max_body_bytes", std::numeric_limits<uint64_t>::max()}}, config),
                 std::runtime_error);
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.analyzerTimeout, std::chrono::seconds(300));

    ConfigLoader::apply({{"port", 65535}, {"analyzer_timeout_seconds", 5}}, config);
    EXPECT_EQ(config.port, 65535);
    EXPECT_EQ(config.analyzerTimeout, std::chrono::seconds(5));
}

TEST(ConfigLoaderTest, OutOfRangePortInFileKeepsDefaults) {
    TempDir dir;
    writeFile(dir / "settings.json", "{\"port\": 70000, \"storage_root\": \"elsewhere\"}");

    ServerConfig config;
    ConfigLoader::applyFile((dir / "settings.json").string(), config);
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.storageRoot, ".");
}

TEST(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    TempDir dir;
    writeFile(dir / "settings.json", "{\"storage_root\": \"elsewhere\", \"analyzer_timeout_seconds\": \"soon\"}");

    ServerConfig config;
    ConfigLoader::applyFile((dir / "settings.json").string(), config);
    EXPECT_EQ(config.storageRoot, ".");
    EXPECT_EQ(config.analyzerTimeout, std::chrono::seconds(300));

    writeFile(dir / "settings.json", "{ not json");
    ConfigLoader::applyFile((dir / "settings.json").string(), config);
    EXPECT_EQ(config.storageRoot, ".");
}

TEST(ConfigLoaderTest, MissingFileIsIgnored) {
    TempDir dir;
    ServerConfig config;
    ConfigLoader::applyFile((dir / "absent.json").string(), config);
    EXPECT_EQ(config.port, 8000);
}
