#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace sheetdrop {
namespace http {

/**
 * Represents a single part of a multipart/form-data request
 */
struct MultipartPart {
    std::string name;           // form field name
    std::string filename;       // declared filename (empty if not a file)
    std::string content_type;   // MIME type of the content
    std::vector<uint8_t> data;  // binary content

    bool isFile() const { return !filename.empty(); }
    std::string dataAsString() const {
        return std::string(data.begin(), data.end());
    }
};

/**
 * Parser for multipart/form-data HTTP requests
 */
class MultipartParser {
public:
    /**
     * Parse multipart body into structured parts
     * @param body Raw HTTP body
     * @param boundary Multipart boundary string (without --)
     * @return Vector of parsed parts, empty if the boundary never occurs
     */
    static std::vector<MultipartPart> parse(const std::string& body, const std::string& boundary);

    /**
     * Extract boundary from Content-Type header value
     * @param content_type Full Content-Type header value
     * @return Boundary string or empty if not found
     */
    static std::string extractBoundary(const std::string& content_type);

    /**
     * Find the first part with the given form field name
     * @return Pointer into parts, or nullptr
     */
    static const MultipartPart* findField(const std::vector<MultipartPart>& parts, const std::string& name);

    // Case-insensitive check of the media type, ignoring parameters
    static bool isMultipartFormData(const std::string& content_type);

private:
    static void trim(std::string& s);
    static void toLower(std::string& s);
    static void parseContentDisposition(const std::string& value, MultipartPart& part);
};

} // namespace http
} // namespace sheetdrop
