#pragma once

#include <string>
#include <optional>
#include <unordered_map>
#include "sheetdrop/http/Request.hpp"

namespace sheetdrop {
namespace http {

/**
 * Parses the head of an HTTP/1.x request (request line + header block).
 * The body is read separately by the server using contentLength().
 */
class RequestParser {
public:
    /**
     * @param head Everything up to, but excluding, the blank line
     * @throws std::invalid_argument on an unsupported method (message names it)
     * @throws std::runtime_error on a malformed request line
     */
    static Request parseHead(const std::string& head);

    // Declared Content-Length, nullopt if absent or not a number
    static std::optional<size_t> contentLength(const Request& request);

    // Decodes %XX escapes; '+' is kept literally
    static std::string percentDecode(const std::string& s);

    static std::unordered_map<std::string, std::string> parseQuery(const std::string& query);

private:
    static void trim(std::string& s);
};

} // namespace http
} // namespace sheetdrop
