#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <nlohmann/json.hpp>
#include "sheetdrop/server/FileStorage.hpp"

namespace sheetdrop {

struct HistoryItem {
    std::string name;
    std::string url;
    std::string timestamp;   // YYYY-MM-DD HH:MM:SS, local time
    struct timespec modified{};

    nlohmann::json to_json() const;
};

// Result of one optional workflow step
struct StepOutcome {
    bool ok = true;
    std::string reason;

    static StepOutcome success() { return {true, ""}; }
    static StepOutcome failure(const std::string& reason) { return {false, reason}; }
};

/**
 * Archived copies of the analysis result document, kept under history/
 * below the storage root.
 */
class HistoryIndex {
public:
    explicit HistoryIndex(const FileStorage& storage);

    // Idempotently creates the history directory
    StepOutcome ensureDirectory() const;

    // `<stem of uploaded name>_<YYYYMMDD-HHMMSS>.json`
    static std::string entryName(const std::string& uploadedFilename, const std::string& compactTimestamp);

    // Byte copy of the result document into history/<entryName>
    StepOutcome record(const std::string& resultFile, const std::string& entryName) const;

    // *.json files in history/, newest first; throws std::filesystem::filesystem_error
    std::vector<HistoryItem> list() const;

    static std::string urlFor(const std::string& entryName);

    static std::string compactTimestamp(std::time_t t);   // YYYYMMDD-HHMMSS
    static std::string displayTimestamp(std::time_t t);   // YYYY-MM-DD HH:MM:SS

private:
    const FileStorage& storage_;
};

} // namespace sheetdrop
