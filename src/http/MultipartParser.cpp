#include "sheetdrop/http/MultipartParser.hpp"
#include <cctype>
#include <algorithm>

namespace sheetdrop {
namespace http {

void MultipartParser::trim(std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                            s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
    s = s.substr(start, end - start);
}

void MultipartParser::toLower(std::string& s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

void MultipartParser::parseContentDisposition(const std::string& value, MultipartPart& part) {
    size_t pos = 0;
    while (pos < value.size()) {
        // A quoted filename may itself contain ';'
        size_t next = pos;
        bool quoted = false;
        while (next < value.size() && (quoted || value[next] != ';')) {
            if (value[next] == '"') quoted = !quoted;
            ++next;
        }
        std::string token = value.substr(pos, next - pos);
        pos = (next >= value.size() ? value.size() : next + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "name") {
            part.name = val;
        } else if (key == "filename") {
            part.filename = val;
        }
    }
}

std::string MultipartParser::extractBoundary(const std::string& content_type) {
    std::string boundary;

    auto semicolon = content_type.find(';');
    if (semicolon == std::string::npos) {
        return boundary;
    }

    std::string params = content_type.substr(semicolon + 1);

    while (!params.empty()) {
        auto next_semi = params.find(';');
        std::string token = (next_semi == std::string::npos) ? params : params.substr(0, next_semi);
        params = (next_semi == std::string::npos) ? "" : params.substr(next_semi + 1);

        trim(token);
        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) continue;

        std::string key = token.substr(0, eq);
        std::string val = token.substr(eq + 1);
        trim(key);
        trim(val);
        toLower(key);

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }

        if (key == "boundary") {
            boundary = val;
            break;
        }
    }

    return boundary;
}

bool MultipartParser::isMultipartFormData(const std::string& content_type) {
    std::string media = content_type.substr(0, content_type.find(';'));
    trim(media);
    toLower(media);
    return media == "multipart/form-data";
}

const MultipartPart* MultipartParser::findField(const std::vector<MultipartPart>& parts,
                                                const std::string& name) {
    auto it = std::find_if(parts.begin(), parts.end(),
                           [&name](const MultipartPart& p) { return p.name == name; });
    return it == parts.end() ? nullptr : &*it;
}

std::vector<MultipartPart> MultipartParser::parse(const std::string& body,
                                                   const std::string& boundary) {
    std::vector<MultipartPart> parts;
    if (boundary.empty()) return parts;

    const std::string dash = "--" + boundary;

    // Find first boundary, skipping any preamble
    size_t bline;
    if (body.rfind(dash, 0) == 0) {
        bline = 0;
    } else {
        size_t m = body.find("\r\n" + dash, 0);
        if (m == std::string::npos) return parts;
        bline = m + 2;
    }

    while (true) {
        // Final boundary (--) closes the body
        const size_t after = bline + dash.size();
        if (after + 2 <= body.size() && body.compare(after, 2, "--") == 0) break;

        size_t line_end = body.find("\r\n", bline);
        if (line_end == std::string::npos) break;

        size_t headers_start = line_end + 2;
        size_t headers_end;
        if (body.compare(headers_start, 2, "\r\n") == 0) {
            headers_end = headers_start - 2;   // part without headers
        } else {
            headers_end = body.find("\r\n\r\n", headers_start);
            if (headers_end == std::string::npos) break;
        }

        MultipartPart part;

        size_t hpos = headers_start;
        while (hpos < headers_end) {
            size_t eol = body.find("\r\n", hpos);
            if (eol == std::string::npos || eol > headers_end) eol = headers_end;

            std::string hline = body.substr(hpos, eol - hpos);
            hpos = eol + 2;

            auto colon = hline.find(':');
            if (colon == std::string::npos) continue;

            std::string hname = hline.substr(0, colon);
            std::string hvalue = hline.substr(colon + 1);
            trim(hname);
            trim(hvalue);
            toLower(hname);

            if (hname == "content-disposition") {
                parseContentDisposition(hvalue, part);
            } else if (hname == "content-type") {
                part.content_type = hvalue;
            }
        }

        size_t content_start = headers_end + 4;
        size_t next_marker = body.find("\r\n" + dash, content_start);
        size_t content_end = (next_marker == std::string::npos) ? body.size() : next_marker;

        const char* data_ptr = body.data() + content_start;
        part.data = std::vector<uint8_t>(data_ptr, data_ptr + (content_end - content_start));

        parts.push_back(std::move(part));

        if (next_marker == std::string::npos) break;
        bline = next_marker + 2;
    }

    return parts;
}

} // namespace http
} // namespace sheetdrop
