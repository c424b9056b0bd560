#include "sheetdrop/server/routes.hpp"
#include <iostream>

namespace sheetdrop {

http::Response list_history(const HistoryIndex& history)
{
    try {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& item : history.list()) {
            items.push_back(item.to_json());
        }
        return http::Response::ok(items);
    }
    catch (const std::exception& e) {
        std::cerr << "[history] Listing failed: " << e.what() << std::endl;
        return http::Response::json(500, {{"error", e.what()}});
    }
}

void register_routes(wServer& server, UploadHandler& upload,
                     const HistoryIndex& history, const StaticFileHandler& files)
{
    server.add_endpoint(endpoint(
        [&upload](const http::Request& request) { return upload.handleUpload(request); },
        HttpRequest::POST,
        "/upload",
        [&upload](const http::Request& request) { return upload.screenHead(request); }
    ));

    server.add_endpoint(endpoint(
        [&history](const http::Request&) { return list_history(history); },
        HttpRequest::GET,
        "/history"
    ));

    server.set_fallback([&files](const http::Request& request) { return files.handle(request); });
}

} // namespace sheetdrop
