#include "sheetdrop/server/StaticFileHandler.hpp"
#include "sheetdrop/http/RequestParser.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace sheetdrop {

using http::Request;
using http::Response;

StaticFileHandler::StaticFileHandler(const FileStorage& storage) : storage_(storage) {}

std::string StaticFileHandler::guessContentType(const std::filesystem::path& file) {
    static const std::unordered_map<std::string, std::string> types = {
        {".html", "text/html; charset=utf-8"},
        {".htm", "text/html; charset=utf-8"},
        {".json", "application/json"},
        {".js", "text/javascript"},
        {".css", "text/css"},
        {".txt", "text/plain; charset=utf-8"},
        {".csv", "text/csv"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".xls", "application/vnd.ms-excel"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".svg", "image/svg+xml"},
        {".ico", "image/x-icon"},
    };

    std::string ext = file.extension().string();
    ext = toLower(ext);
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string StaticFileHandler::toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string StaticFileHandler::htmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string StaticFileHandler::urlEncode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(u);
        }
    }
    return out.str();
}

std::optional<std::filesystem::path> StaticFileHandler::translatePath(const std::string& urlPath) {
    // Rebuilt from plain segments only, so no root or drive survives
    std::filesystem::path relative;
    std::istringstream segments(urlPath);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == ".") continue;
        if (segment == ".." || segment.find('\\') != std::string::npos) {
            return std::nullopt;
        }
        relative /= segment;
    }
    return relative;
}

Response StaticFileHandler::handle(const Request& request) const {
    std::string urlPath = http::RequestParser::percentDecode(request.path);
    if (urlPath.empty() || urlPath.front() != '/' || urlPath.find('\0') != std::string::npos) {
        return Response::notFound("File not found");
    }

    std::optional<std::filesystem::path> relative = translatePath(urlPath);
    if (!relative) {
        return Response::notFound("File not found");
    }

    std::filesystem::path target = storage_.root() / *relative;
    std::error_code ec;

    if (std::filesystem::is_directory(target, ec)) {
        if (urlPath.back() != '/') {
            Response redirect = Response::failure(301, "Moved Permanently");
            redirect.withHeader("Location", request.path + "/");
            return redirect;
        }
        std::filesystem::path index = target / "index.html";
        if (std::filesystem::is_regular_file(index, ec)) {
            return serveFile(index);
        }
        return listDirectory(target, urlPath);
    }

    if (std::filesystem::is_regular_file(target, ec)) {
        return serveFile(target);
    }

    return Response::notFound("File not found");
}

Response StaticFileHandler::serveFile(const std::filesystem::path& file) const {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        std::cerr << "[static] Cannot open " << file.string() << std::endl;
        return Response::notFound("File not found");
    }

    Response response;
    response.status = 200;
    response.contentType = guessContentType(file);
    response.body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return response;
}

Response StaticFileHandler::listDirectory(const std::filesystem::path& dir, const std::string& urlPath) const {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (entry.is_directory()) name += "/";
        names.push_back(std::move(name));
    }
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return toLower(a) < toLower(b);
    });

    std::string title = "Directory listing for " + htmlEscape(urlPath);
    std::ostringstream html;
    html << "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>" << title << "</title>\n</head>\n<body>\n"
         << "<h1>" << title << "</h1>\n<hr>\n<ul>\n";
    for (const auto& name : names) {
        html << "<li><a href=\"" << urlEncode(name) << "\">" << htmlEscape(name) << "</a></li>\n";
    }
    html << "</ul>\n<hr>\n</body>\n</html>\n";

    Response response;
    response.status = 200;
    response.contentType = "text/html; charset=utf-8";
    response.body = html.str();
    return response;
}

} // namespace sheetdrop
