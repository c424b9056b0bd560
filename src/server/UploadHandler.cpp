#include "sheetdrop/server/UploadHandler.hpp"
#include "sheetdrop/http/MultipartParser.hpp"
#include "sheetdrop/config.hpp"
#include <iostream>

namespace sheetdrop {

using http::MultipartParser;
using http::MultipartPart;
using http::Request;
using http::Response;

UploadHandler::UploadHandler(FileStorage& storage, const AnalyzerRunner& analyzer, const HistoryIndex& history)
    : storage_(storage), analyzer_(analyzer), history_(history),
      clock_([] { return std::time(nullptr); }) {}

Response UploadHandler::handleUpload(const Request& request) {
    try {
        return processUpload(request);
    } catch (const std::exception& e) {
        std::cerr << "[upload] Failed: " << e.what() << std::endl;
        return Response::error(std::string("upload or analysis failed: ") + e.what());
    }
}

std::optional<Response> UploadHandler::screenHead(const Request& request) const {
    std::string contentType = request.getHeader("content-type");
    if (!MultipartParser::isMultipartFormData(contentType)) {
        std::cerr << "[upload] Rejected content type '" << contentType << "'" << std::endl;
        return Response::badRequest("Invalid content type");
    }
    return std::nullopt;
}

Response UploadHandler::processUpload(const Request& request) {
    if (std::optional<Response> rejected = screenHead(request)) {
        return *rejected;
    }
    std::string contentType = request.getHeader("content-type");

    std::vector<MultipartPart> parts =
        MultipartParser::parse(request.rawBody, MultipartParser::extractBoundary(contentType));
    const MultipartPart* field = MultipartParser::findField(parts, "file");
    if (field == nullptr) {
        std::cerr << "[upload] No 'file' field among " << parts.size() << " parts" << std::endl;
        return Response::badRequest("Missing file field");
    }

    std::string filename = field->filename.empty()
        ? std::string(SHEETDROP_DEFAULT_UPLOAD_NAME)
        : FileStorage::sanitizeFilename(field->filename);
    if (filename != field->filename && !field->filename.empty()) {
        std::cout << "[upload] Renamed '" << field->filename << "' to '" << filename << "'" << std::endl;
    }
    if (FileStorage::isReserved(filename) || analyzer_.refersTo(filename, storage_.root())) {
        std::cerr << "[upload] Refused reserved name '" << filename << "'" << std::endl;
        return Response::badRequest("Reserved filename");
    }

    std::filesystem::path savedPath = storage_.saveFile(filename, field->data);

    std::lock_guard<std::mutex> lock(analysisMutex_);

    AnalyzerResult analysis = analyzer_.run(savedPath, storage_.root());
    if (!analysis.ok()) {
        return analysisFailed(analysis);
    }

    std::vector<std::string> warnings;
    auto note = [&warnings](const StepOutcome& outcome) {
        if (!outcome.ok) {
            std::cerr << "[upload] " << outcome.reason << std::endl;
            warnings.push_back(outcome.reason);
        }
    };

    nlohmann::json summary = nlohmann::json::object();
    note(readSummary(summary));

    std::string timestamp = HistoryIndex::compactTimestamp(clock_());
    std::string historyName = HistoryIndex::entryName(filename, timestamp);

    StepOutcome dir = history_.ensureDirectory();
    note(dir);
    if (dir.ok) {
        note(history_.record(SHEETDROP_RESULT_FILE, historyName));
    }

    nlohmann::json response = {
        {"success", true},
        {"message", "upload and analysis complete"},
        {"filename", filename},
        {"size", field->data.size()},
        {"summary", summary},
        {"history_file", HistoryIndex::urlFor(historyName)},
        {"history_timestamp", timestamp},
    };
    if (!warnings.empty()) {
        response["warnings"] = warnings;
    }

    std::cout << "[upload] Analyzed " << filename << " (" << field->data.size() << " bytes)" << std::endl;
    return Response::ok(response);
}

StepOutcome UploadHandler::readSummary(nlohmann::json& summary) const {
    if (!storage_.exists(SHEETDROP_RESULT_FILE)) {
        return StepOutcome::failure(std::string("Analyzer left no ") + SHEETDROP_RESULT_FILE);
    }
    try {
        nlohmann::json document = nlohmann::json::parse(storage_.readFile(SHEETDROP_RESULT_FILE));
        if (document.is_object() && document.contains("data_summary")) {
            summary = document["data_summary"];
        }
        return StepOutcome::success();
    } catch (const std::exception& e) {
        return StepOutcome::failure(std::string("Unreadable ") + SHEETDROP_RESULT_FILE + ": " + e.what());
    }
}

Response UploadHandler::analysisFailed(const AnalyzerResult& result) {
    std::cerr << "[upload] Analysis failed (" << to_string(result.outcome) << "): " << result.message << std::endl;

    nlohmann::json body = {
        {"success", false},
        {"message", "analysis failed"},
        {"stderr", result.stderrText},
        {"stdout", result.stdoutText},
        {"reason", to_string(result.outcome)},
        {"detail", result.message},
    };
    if (result.outcome == AnalyzerOutcome::NonZeroExit && result.exitCode >= 0) {
        body["exit_code"] = result.exitCode;
    } else {
        body["exit_code"] = nullptr;
    }
    return Response::json(500, body);
}

} // namespace sheetdrop
