#include "sheetdrop/server/FileStorage.hpp"
#include "sheetdrop/config.hpp"
#include <fstream>
#include <iostream>
#include <cstring>
#include <cerrno>
#include <cctype>

namespace sheetdrop {

FileStorage::FileStorage(const std::string& basePath)
    : basePath_(std::filesystem::absolute(basePath).lexically_normal()) {
    ensureStorageDirectory();
}

std::filesystem::path FileStorage::saveFile(const std::string& filename, const std::vector<uint8_t>& content) {
    std::filesystem::path fullPath = getFullPath(filename);

    std::ofstream outFile(fullPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        std::string error = "Failed to create file: " + fullPath.string() + " (" + strerror(errno) + ")";
        std::cerr << "[storage] " << error << std::endl;
        throw std::runtime_error(error);
    }

    outFile.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    outFile.close();
    if (!outFile) {
        throw std::runtime_error("Failed to write file: " + fullPath.string());
    }

    std::cout << "[storage] Saved " << fullPath.string() << " (" << content.size() << " bytes)" << std::endl;
    return fullPath;
}

std::string FileStorage::readFile(const std::string& filepath) const {
    std::ifstream inFile(getFullPath(filepath), std::ios::binary);
    if (!inFile) {
        throw std::runtime_error("File not found: " + filepath);
    }

    std::string content((std::istreambuf_iterator<char>(inFile)),
                        std::istreambuf_iterator<char>());
    return content;
}

void FileStorage::copyFile(const std::string& from, const std::string& to) const {
    std::string content = readFile(from);

    std::filesystem::path target = getFullPath(to);
    std::ofstream outFile(target, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw std::runtime_error("Failed to create file: " + target.string() + " (" + strerror(errno) + ")");
    }
    outFile.write(content.data(), static_cast<std::streamsize>(content.size()));
    outFile.close();
    if (!outFile) {
        throw std::runtime_error("Failed to write file: " + target.string());
    }
}

bool FileStorage::exists(const std::string& filepath) const {
    std::error_code ec;
    return std::filesystem::exists(getFullPath(filepath), ec);
}

std::filesystem::path FileStorage::getFullPath(const std::string& filepath) const {
    return basePath_ / filepath;
}

void FileStorage::ensureDirectory(const std::string& relative) const {
    std::filesystem::create_directories(getFullPath(relative));
}

void FileStorage::ensureStorageDirectory() const {
    std::filesystem::create_directories(basePath_);
}

std::string FileStorage::sanitizeFilename(const std::string& filename) {
    // Drop any directory part, whichever separator the client used
    std::string name = filename;
    size_t lastSlash = name.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        name = name.substr(lastSlash + 1);
    }

    std::string safe;
    safe.reserve(name.size());
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80 || std::isalnum(u) || c == '.' || c == '-' || c == '_' ||
            c == ' ' || c == '(' || c == ')') {
            safe.push_back(c);
        } else {
            safe.push_back('_');
        }
    }

    size_t firstKept = safe.find_first_not_of(". ");
    safe = firstKept == std::string::npos ? "" : safe.substr(firstKept);
    while (!safe.empty() && safe.back() == ' ') safe.pop_back();

    if (safe.empty()) {
        return SHEETDROP_DEFAULT_UPLOAD_NAME;
    }
    return safe;
}

bool FileStorage::isReserved(const std::string& filename) {
    return filename == SHEETDROP_RESULT_FILE ||
           filename == SHEETDROP_SETTINGS_FILE ||
           filename == SHEETDROP_HISTORY_DIR;
}

} // namespace sheetdrop
