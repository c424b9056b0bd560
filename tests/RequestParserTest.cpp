#include <gtest/gtest.h>
#include <stdexcept>
#include "sheetdrop/http/RequestParser.hpp"

using sheetdrop::http::Request;
using sheetdrop::http::RequestParser;

TEST(RequestParserTest, ParsesRequestLineHeadersAndQuery) {
    Request request = RequestParser::parseHead(
        "POST /upload?lang=zh&x=a%20b HTTP/1.1\r\n"
        "Host: localhost:8000\r\n"
        "Content-Type: multipart/form-data; boundary=xyz\r\n"
        "content-length:  42 \r\n"
        "\r\n");

    EXPECT_EQ(request.method, HttpRequest::POST);
    EXPECT_EQ(request.target, "/upload?lang=zh&x=a%20b");
    EXPECT_EQ(request.path, "/upload");
    EXPECT_EQ(request.getQuery("lang"), "zh");
    EXPECT_EQ(request.getQuery("x"), "a b");
    EXPECT_EQ(request.getHeader("content-type"), "multipart/form-data; boundary=xyz");
    EXPECT_EQ(RequestParser::contentLength(request).value_or(0), 42u);
}

TEST(RequestParserTest, MissingOrInvalidContentLength) {
    Request none = RequestParser::parseHead("GET / HTTP/1.1\r\n\r\n");
    EXPECT_FALSE(RequestParser::contentLength(none).has_value());

    Request bad = RequestParser::parseHead("POST / HTTP/1.1\r\nContent-Length: -5\r\n\r\n");
    EXPECT_FALSE(RequestParser::contentLength(bad).has_value());
}

TEST(RequestParserTest, UnsupportedMethodIsInvalidArgument) {
    EXPECT_THROW(RequestParser::parseHead("DELETE /x HTTP/1.1\r\n\r\n"), std::invalid_argument);
}

TEST(RequestParserTest, MalformedRequestLineIsRuntimeError) {
    EXPECT_THROW(RequestParser::parseHead("\r\n\r\n"), std::runtime_error);
    EXPECT_THROW(RequestParser::parseHead("GET\r\n\r\n"), std::runtime_error);
    EXPECT_THROW(RequestParser::parseHead("GET / SPDY/3\r\n\r\n"), std::runtime_error);
}

TEST(RequestParserTest, PercentDecodeLeavesBrokenEscapes) {
    EXPECT_EQ(RequestParser::percentDecode("/history/%E6%8A%A5%E8%A1%A8.json"), "/history/\xE6\x8A\xA5\xE8\xA1\xA8.json");
    EXPECT_EQ(RequestParser::percentDecode("100%"), "100%");
    EXPECT_EQ(RequestParser::percentDecode("%zz"), "%zz");
    EXPECT_EQ(RequestParser::percentDecode("a+b"), "a+b");
}
