#include "sheetdrop/server/HistoryIndex.hpp"
#include "sheetdrop/config.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <cerrno>
#include <sys/stat.h>

namespace sheetdrop {

namespace {
    std::string formatLocal(std::time_t t, const char* format) {
        std::tm tm = *std::localtime(&t);
        std::ostringstream ss;
        ss << std::put_time(&tm, format);
        return ss.str();
    }

    bool newerThan(const struct timespec& a, const struct timespec& b) {
        if (a.tv_sec != b.tv_sec) return a.tv_sec > b.tv_sec;
        return a.tv_nsec > b.tv_nsec;
    }
}

nlohmann::json HistoryItem::to_json() const {
    return {{"name", name}, {"url", url}, {"timestamp", timestamp}};
}

HistoryIndex::HistoryIndex(const FileStorage& storage) : storage_(storage) {}

std::string HistoryIndex::compactTimestamp(std::time_t t) {
    return formatLocal(t, "%Y%m%d-%H%M%S");
}

std::string HistoryIndex::displayTimestamp(std::time_t t) {
    return formatLocal(t, "%Y-%m-%d %H:%M:%S");
}

std::string HistoryIndex::entryName(const std::string& uploadedFilename, const std::string& compactTimestamp) {
    std::string base = std::filesystem::path(uploadedFilename).stem().string();
    return base + "_" + compactTimestamp + ".json";
}

std::string HistoryIndex::urlFor(const std::string& entryName) {
    return std::string("/") + SHEETDROP_HISTORY_DIR + "/" + entryName;
}

StepOutcome HistoryIndex::ensureDirectory() const {
    try {
        storage_.ensureDirectory(SHEETDROP_HISTORY_DIR);
        if (!std::filesystem::is_directory(storage_.getFullPath(SHEETDROP_HISTORY_DIR))) {
            return StepOutcome::failure("Cannot create history directory: a file is in the way");
        }
        return StepOutcome::success();
    } catch (const std::filesystem::filesystem_error& e) {
        return StepOutcome::failure(std::string("Cannot create history directory: ") + e.what());
    }
}

StepOutcome HistoryIndex::record(const std::string& resultFile, const std::string& entryName) const {
    if (!storage_.exists(resultFile)) {
        return StepOutcome::failure("No " + resultFile + " to archive");
    }
    try {
        storage_.copyFile(resultFile, std::string(SHEETDROP_HISTORY_DIR) + "/" + entryName);
    } catch (const std::runtime_error& e) {
        return StepOutcome::failure(std::string("Cannot write history entry: ") + e.what());
    }
    std::cout << "[history] Recorded " << entryName << std::endl;
    return StepOutcome::success();
}

std::vector<HistoryItem> HistoryIndex::list() const {
    std::vector<HistoryItem> items;

    std::filesystem::path dir = storage_.getFullPath(SHEETDROP_HISTORY_DIR);
    if (!std::filesystem::is_directory(dir)) {
        return items;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;

        struct stat st;
        if (::stat(entry.path().c_str(), &st) != 0) {
            throw std::filesystem::filesystem_error("stat failed", entry.path(),
                                                    std::error_code(errno, std::generic_category()));
        }

        HistoryItem item;
        item.name = entry.path().filename().string();
        item.url = urlFor(item.name);
        item.modified = st.st_mtim;
        item.timestamp = displayTimestamp(st.st_mtim.tv_sec);
        items.push_back(std::move(item));
    }

    std::sort(items.begin(), items.end(), [](const HistoryItem& a, const HistoryItem& b) {
        if (newerThan(a.modified, b.modified)) return true;
        if (newerThan(b.modified, a.modified)) return false;
        return a.name < b.name;
    });

    return items;
}

} // namespace sheetdrop
