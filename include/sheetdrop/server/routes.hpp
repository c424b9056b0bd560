#pragma once

#include "sheetdrop/server/wserver.hpp"
#include "sheetdrop/server/UploadHandler.hpp"
#include "sheetdrop/server/HistoryIndex.hpp"
#include "sheetdrop/server/StaticFileHandler.hpp"

namespace sheetdrop {

// GET /history: JSON array of {name, url, timestamp}, or 500 {error}
http::Response list_history(const HistoryIndex& history);

// POST /upload, GET /history and the static file fallback.
// The components must outlive the server.
void register_routes(wServer& server, UploadHandler& upload,
                     const HistoryIndex& history, const StaticFileHandler& files);

} // namespace sheetdrop
