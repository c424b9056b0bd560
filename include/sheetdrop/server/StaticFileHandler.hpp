#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include "sheetdrop/http/Request.hpp"
#include "sheetdrop/server/FileStorage.hpp"

namespace sheetdrop {

/**
 * GET/HEAD fallback: serves files and directory listings below the storage root.
 */
class StaticFileHandler {
public:
    explicit StaticFileHandler(const FileStorage& storage);

    http::Response handle(const http::Request& request) const;

    static std::string guessContentType(const std::filesystem::path& file);

    // Decoded URL path to a path relative to the root, nullopt if it would leave the root
    static std::optional<std::filesystem::path> translatePath(const std::string& urlPath);

private:
    const FileStorage& storage_;

    http::Response serveFile(const std::filesystem::path& file) const;
    http::Response listDirectory(const std::filesystem::path& dir, const std::string& urlPath) const;

    static std::string toLower(std::string s);
    static std::string htmlEscape(const std::string& s);
    static std::string urlEncode(const std::string& s);
};

} // namespace sheetdrop
