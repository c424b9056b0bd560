#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <ctime>
#include <functional>
#include <optional>
#include <nlohmann/json.hpp>
#include "sheetdrop/http/Request.hpp"
#include "sheetdrop/server/FileStorage.hpp"
#include "sheetdrop/server/AnalyzerRunner.hpp"
#include "sheetdrop/server/HistoryIndex.hpp"

namespace sheetdrop {

/**
 * POST /upload: saves the multipart `file` field, runs the analyzer on it,
 * archives the analysis result into history and answers with a JSON summary.
 */
class UploadHandler {
public:
    using Clock = std::function<std::time_t()>;

    UploadHandler(FileStorage& storage, const AnalyzerRunner& analyzer, const HistoryIndex& history);

    // Never throws; unexpected errors become a 500 envelope
    http::Response handleUpload(const http::Request& request);

    // 400 for a head that can never carry an upload, before its body is read
    std::optional<http::Response> screenHead(const http::Request& request) const;

    // Source of the history timestamp, std::time by default
    void setClock(Clock clock) { clock_ = std::move(clock); }

private:
    FileStorage& storage_;
    const AnalyzerRunner& analyzer_;
    const HistoryIndex& history_;
    Clock clock_;

    // Serializes analyze -> read result -> archive, the result file being shared
    std::mutex analysisMutex_;

    http::Response processUpload(const http::Request& request);

    // data_summary of the result document, {} when absent
    StepOutcome readSummary(nlohmann::json& summary) const;

    static http::Response analysisFailed(const AnalyzerResult& result);
};

} // namespace sheetdrop
