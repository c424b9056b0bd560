#include "sheetdrop/server/wserver.hpp"
#include "sheetdrop/http/RequestParser.hpp"
#include "sheetdrop/config.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace asio = boost::asio;
using asio::ip::tcp;

namespace sheetdrop {

using http::Request;
using http::RequestParser;
using http::Response;

namespace {
    const char* status_text(int s) {
        switch (s) {
            case 200: return "OK";
            case 204: return "No Content";
            case 301: return "Moved Permanently";
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 413: return "Payload Too Large";
            case 431: return "Request Header Fields Too Large";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            default:  return "Unknown";
        }
    }

    bool iequals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    }
}

wServer::wServer()
    : acceptor_(io_context_),
      max_header_bytes_(SHEETDROP_DEFAULT_MAX_HEADER_BYTES),
      max_body_bytes_(SHEETDROP_DEFAULT_MAX_BODY_BYTES) {}

void wServer::add_endpoint(const endpoint& ep)
{
    handlers_.insert_or_assign(ep.get_path(), ep);
}

void wServer::set_fallback(Handler handler)
{
    fallback_ = std::move(handler);
}

void wServer::set_limits(size_t max_header_bytes, size_t max_body_bytes)
{
    max_header_bytes_ = max_header_bytes;
    max_body_bytes_ = max_body_bytes;
}

Response wServer::dispatch(const Request& request) const
{
    if (request.method == HttpRequest::OPTIONS) {
        Response response = Response::noContent();
        response.withHeader("Access-Control-Allow-Methods", "POST, GET, OPTIONS");
        response.withHeader("Access-Control-Allow-Headers", "Content-Type");
        return response;
    }

    const Handler* handler = nullptr;
    auto it = handlers_.find(request.path);
    if (it != handlers_.end() && it->second.accepts(request.method)) {
        handler = &it->second.get_handler();
    } else if (request.method == HttpRequest::POST) {
        return Response::notFound("Unknown POST endpoint");
    } else if (fallback_) {
        handler = &fallback_;
    } else {
        return Response::notFound("File not found");
    }

    try {
        return (*handler)(request);
    }
    catch (const std::exception& e) {
        std::cerr << "[http] Handler for " << request.path << " threw: " << e.what() << std::endl;
        return Response::error(e.what());
    }
}

std::optional<Response> wServer::screen(const Request& request) const
{
    if (request.method == HttpRequest::OPTIONS) {
        return dispatch(request);
    }

    auto it = handlers_.find(request.path);
    if (it == handlers_.end() || !it->second.accepts(request.method)) {
        if (request.method == HttpRequest::POST) {
            return dispatch(request);
        }
        return std::nullopt;
    }

    const Screen& check = it->second.get_screen();
    if (!check) {
        return std::nullopt;
    }
    try {
        return check(request);
    }
    catch (const std::exception& e) {
        std::cerr << "[http] Screen for " << request.path << " threw: " << e.what() << std::endl;
        return Response::error(e.what());
    }
}

std::string wServer::serialize(const Response& response, bool include_body)
{
    const bool no_content = response.status == 204;

    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
    if (!no_content) {
        if (!response.contentType.empty()) {
            out << "Content-Type: " << response.contentType << "\r\n";
        }
        out << "Content-Length: " << response.body.size() << "\r\n";
    }
    for (const auto& header : response.headers) {
        if (iequals(header.first, "Access-Control-Allow-Origin")) continue;
        out << header.first << ": " << header.second << "\r\n";
    }
    out << "Access-Control-Allow-Origin: *\r\n";
    out << "Connection: close\r\n\r\n";
    if (include_body && !no_content) {
        out << response.body;
    }
    return out.str();
}

void wServer::send(tcp::socket& socket, const Response& response, bool include_body)
{
    asio::write(socket, asio::buffer(serialize(response, include_body)));
}

void wServer::serve_connection(tcp::socket& socket)
{
    asio::streambuf buf(max_header_bytes_);

    boost::system::error_code ec;
    size_t head_size = asio::read_until(socket, buf, "\r\n\r\n", ec);
    if (ec == asio::error::not_found) {
        send(socket, Response::failure(431, "Request header too large"));
        return;
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }

    std::string data(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
    std::string head = data.substr(0, head_size);
    std::string body = data.substr(head_size);

    Request request;
    try {
        request = RequestParser::parseHead(head);
    }
    catch (const std::invalid_argument& e) {
        send(socket, Response::notImplemented(e.what()));
        return;
    }
    catch (const std::runtime_error& e) {
        send(socket, Response::badRequest(e.what()));
        return;
    }

    const bool include_body = request.method != HttpRequest::HEAD;

    if (std::optional<Response> early = screen(request)) {
        std::cout << "[http] " << to_string(request.method) << " " << request.target
                  << " -> " << early->status << " (body not read)" << std::endl;
        send(socket, *early, include_body);
        return;
    }

    size_t content_length = RequestParser::contentLength(request).value_or(0);
    if (content_length > max_body_bytes_) {
        std::cerr << "[http] " << to_string(request.method) << " " << request.path
                  << " body of " << content_length << " bytes refused" << std::endl;
        send(socket, Response::failure(413, "Request body too large"), include_body);
        return;
    }

    if (body.size() < content_length) {
        if (iequals(request.getHeader("expect"), "100-continue")) {
            asio::write(socket, asio::buffer(std::string("HTTP/1.1 100 Continue\r\n\r\n")));
        }
        size_t already = body.size();
        body.resize(content_length);
        asio::read(socket, asio::buffer(&body[already], content_length - already));
    } else if (body.size() > content_length) {
        body.resize(content_length);
    }
    request.rawBody = std::move(body);

    Response response = dispatch(request);
    std::cout << "[http] " << to_string(request.method) << " " << request.target
              << " -> " << response.status << std::endl;
    send(socket, response, include_body);
}

uint16_t wServer::listen(uint16_t port)
{
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    return acceptor_.local_endpoint().port();
}

void wServer::accept_once()
{
    tcp::socket socket(io_context_);
    acceptor_.accept(socket);

    try {
        serve_connection(socket);
    }
    catch (const std::exception& e) {
        std::cerr << "[http] Connection error: " << e.what() << std::endl;
    }

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

void wServer::run(uint16_t port)
{
    uint16_t bound = listen(port);
    std::cout << "Serving at http://localhost:" << bound << "/" << std::endl;

    while (true)
    {
        accept_once();
    }
}

} // namespace sheetdrop
