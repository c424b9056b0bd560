/**
 * @file ConfigLoader.hpp
 * @brief Server configuration: compiled defaults, optional settings.json, CLI port.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sheetdrop {

struct ServerConfig {
    uint16_t port;
    std::string storageRoot;                 // Directory holding uploads, results and history
    std::vector<std::string> analyzerCommand; // argv prefix; the saved file path is appended
    std::chrono::seconds analyzerTimeout;    // zero disables the timeout
    size_t maxBodyBytes;
    size_t maxHeaderBytes;

    ServerConfig();
};

class ConfigLoader {
public:
    /**
     * @brief Builds the configuration for a process started as `sheetdrop [port]`.
     *
     * Reads settings.json from the working directory when present. The port
     * argument, when valid, overrides the file.
     */
    static ServerConfig load(int argc, char** argv);

    /**
     * @brief Applies recognised keys of a settings object onto config.
     * @throws nlohmann::json::exception when a known key has the wrong type
     */
    static void apply(const nlohmann::json& settings, ServerConfig& config);

    /**
     * @brief Reads settings from a file. Missing file leaves config untouched;
     * a malformed file is logged and ignored.
     */
    static void applyFile(const std::string& path, ServerConfig& config);

    // Returns fallback unless text is a whole number in 1..65535
    static uint16_t parsePort(const std::string& text, uint16_t fallback);
};

} // namespace sheetdrop
