#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <stdexcept>

namespace sheetdrop {

/**
 * Storage root for uploads, the analyzer mailbox file and history snapshots.
 * All relative paths given to FileStorage are resolved against this root.
 */
class FileStorage {
public:
    explicit FileStorage(const std::string& basePath = ".");

    // Saves binary content under the root (create or truncate) and returns the absolute path
    std::filesystem::path saveFile(const std::string& filename, const std::vector<uint8_t>& content);

    // Reads file content from storage
    std::string readFile(const std::string& filepath) const;

    // Byte copy between two paths below the root, overwriting the destination
    void copyFile(const std::string& from, const std::string& to) const;

    bool exists(const std::string& filepath) const;

    // Gets the full path for a stored file
    std::filesystem::path getFullPath(const std::string& filepath) const;

    // Creates a directory below the root if absent
    void ensureDirectory(const std::string& relative) const;

    const std::filesystem::path& root() const { return basePath_; }

    // Reduces a client supplied name to a single safe path component
    static std::string sanitizeFilename(const std::string& filename);

    // Names owned by the server itself, which uploads must not replace
    static bool isReserved(const std::string& filename);

private:
    std::filesystem::path basePath_;

    // Ensures the storage directory exists
    void ensureStorageDirectory() const;
};

} // namespace sheetdrop
