/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "sheetdrop/config/ConfigLoader.hpp"
#include "sheetdrop/config.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace sheetdrop {

namespace {
    // Whole number within [low, high]; nlohmann's get<> would wrap instead
    int64_t boundedInteger(const nlohmann::json& settings, const char* key, int64_t low, int64_t high) {
        const nlohmann::json& value = settings.at(key);
        if (!value.is_number_integer()) {
            throw std::runtime_error(std::string(key) + " must be a whole number");
        }
        int64_t number = value.is_number_unsigned()
            ? static_cast<int64_t>(std::min<uint64_t>(value.get<uint64_t>(), static_cast<uint64_t>(high) + 1))
            : value.get<int64_t>();
        if (number < low || number > high) {
            throw std::runtime_error(std::string(key) + " must be between " + std::to_string(low) +
                                     " and " + std::to_string(high));
        }
        return number;
    }
}

ServerConfig::ServerConfig()
    : port(SHEETDROP_DEFAULT_PORT),
      storageRoot("."),
      analyzerCommand{SHEETDROP_DEFAULT_ANALYZER_PROGRAM, SHEETDROP_DEFAULT_ANALYZER_SCRIPT},
      analyzerTimeout(SHEETDROP_DEFAULT_ANALYZER_TIMEOUT_SECONDS),
      maxBodyBytes(SHEETDROP_DEFAULT_MAX_BODY_BYTES),
      maxHeaderBytes(SHEETDROP_DEFAULT_MAX_HEADER_BYTES) {}

uint16_t ConfigLoader::parsePort(const std::string& text, uint16_t fallback) {
    if (text.empty() || text.size() > 5) return fallback;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return fallback;
    }
    unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535) return fallback;
    return static_cast<uint16_t>(value);
}

void ConfigLoader::apply(const nlohmann::json& settings, ServerConfig& config) {
    if (!settings.is_object()) {
        throw std::runtime_error("settings must be a JSON object");
    }

    if (settings.contains("port")) {
        config.port = static_cast<uint16_t>(boundedInteger(settings, "port", 1, 65535));
    }
    if (settings.contains("storage_root")) {
        config.storageRoot = settings["storage_root"].get<std::string>();
    }
    if (settings.contains("analyzer")) {
        auto command = settings["analyzer"].get<std::vector<std::string>>();
        if (command.empty() || command.front().empty()) {
            throw std::runtime_error("analyzer must name a program");
        }
        config.analyzerCommand = std::move(command);
    }
    if (settings.contains("analyzer_timeout_seconds")) {
        config.analyzerTimeout = std::chrono::seconds(
            boundedInteger(settings, "analyzer_timeout_seconds", 0, 7 * 24 * 3600));
    }
    if (settings.contains("max_body_bytes")) {
        config.maxBodyBytes = static_cast<size_t>(
            boundedInteger(settings, "max_body_bytes", 1, std::numeric_limits<int64_t>::max() - 1));
    }
    if (settings.contains("max_header_bytes")) {
        config.maxHeaderBytes = static_cast<size_t>(
            boundedInteger(settings, "max_header_bytes", 256, 16 * 1024 * 1024));
    }
}

void ConfigLoader::applyFile(const std::string& path, ServerConfig& config) {
    if (!std::filesystem::exists(path)) {
        return;
    }

    // Apply onto a copy so a bad key leaves every default in place
    ServerConfig candidate = config;
    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        apply(j, candidate);
        config = candidate;
        std::cout << "[config] Loaded " << path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[config] Ignoring " << path << ": " << e.what() << std::endl;
    }
}

ServerConfig ConfigLoader::load(int argc, char** argv) {
    ServerConfig config;
    applyFile(SHEETDROP_SETTINGS_FILE, config);

    if (argc > 1) {
        uint16_t port = parsePort(argv[1], 0);
        if (port != 0) {
            config.port = port;
        } else {
            std::cerr << "[config] Invalid port '" << argv[1] << "', using " << config.port << std::endl;
        }
    }
    return config;
}

} // namespace sheetdrop
