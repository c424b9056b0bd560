#include "sheetdrop/http/RequestParser.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace sheetdrop {
namespace http {

void RequestParser::trim(std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
    s = s.substr(a, b - a);
}

std::string RequestParser::percentDecode(const std::string& s) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex(s[i + 1]);
            int lo = hex(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::unordered_map<std::string, std::string> RequestParser::parseQuery(const std::string& query) {
    std::unordered_map<std::string, std::string> result;
    std::stringstream ss(query);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        std::string key = percentDecode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : percentDecode(pair.substr(eq + 1));
        result.emplace(std::move(key), std::move(value));
    }
    return result;
}

Request RequestParser::parseHead(const std::string& head) {
    std::istringstream request_stream(head);

    std::string request_line;
    std::getline(request_stream, request_line);
    if (!request_line.empty() && request_line.back() == '\r') request_line.pop_back();

    std::istringstream line_stream(request_line);
    std::string method, target, version;
    line_stream >> method >> target >> version;
    if (method.empty() || target.empty()) {
        throw std::runtime_error("Malformed request line");
    }
    if (!version.empty() && version.rfind("HTTP/", 0) != 0) {
        throw std::runtime_error("Malformed HTTP version: " + version);
    }

    Request request;
    request.method = from_string(method);
    request.target = target;

    std::string clean_path = target;
    auto qm = target.find('?');
    if (qm != std::string::npos) {
        clean_path = target.substr(0, qm);
        request.query = parseQuery(target.substr(qm + 1));
    }
    auto hash = clean_path.find('#');
    if (hash != std::string::npos) clean_path.resize(hash);
    request.path = clean_path;

    std::string header_line;
    while (std::getline(request_stream, header_line)) {
        if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
        if (header_line.empty()) break;

        auto colon = header_line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = header_line.substr(0, colon);
        std::string value = header_line.substr(colon + 1);
        trim(name);
        trim(value);
        for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        // First occurrence wins
        request.headers.emplace(std::move(name), std::move(value));
    }

    return request;
}

std::optional<size_t> RequestParser::contentLength(const Request& request) {
    std::string value = request.getHeader("content-length");
    if (value.empty()) return std::nullopt;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace http
} // namespace sheetdrop
