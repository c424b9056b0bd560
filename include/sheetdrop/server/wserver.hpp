#pragma once
#include <boost/asio.hpp>
#include <unordered_map>
#include <iostream>
#include <optional>
#include <string>
#include "sheetdrop/const/rest_enums.hpp"
#include "sheetdrop/http/Request.hpp"
#include "sheetdrop/server/endpoint.hpp"

namespace sheetdrop {

/**
 * Blocking HTTP/1.1 server: one connection at a time, one request per
 * connection. Every response carries `Access-Control-Allow-Origin: *`.
 */
class wServer
{
  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::unordered_map<std::string, endpoint> handlers_;
  Handler fallback_;
  size_t max_header_bytes_;
  size_t max_body_bytes_;
public:
    wServer();
    void add_endpoint(const endpoint& ep);

    // Serves GET/HEAD requests that match no endpoint
    void set_fallback(Handler handler);

    void set_limits(size_t max_header_bytes, size_t max_body_bytes);

    // Routes one parsed request; handler exceptions become 500 responses
    http::Response dispatch(const http::Request& request) const;

    // Answer decided from the head alone (OPTIONS, unknown POST, endpoint screen)
    std::optional<http::Response> screen(const http::Request& request) const;

    // Wire form of a response, body omitted for HEAD and 204
    static std::string serialize(const http::Response& response, bool include_body = true);

    // Binds and listens; port 0 picks a free one. Returns the bound port.
    uint16_t listen(uint16_t port);

    // Serves a single connection; connection errors are logged, not thrown
    void accept_once();

    void run(uint16_t port);

private:
    void serve_connection(boost::asio::ip::tcp::socket& socket);
    void send(boost::asio::ip::tcp::socket& socket, const http::Response& response, bool include_body = true);
};

} // namespace sheetdrop
