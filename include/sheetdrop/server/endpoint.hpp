#pragma once

#include <string>
#include <functional>
#include <optional>
#include "sheetdrop/const/rest_enums.hpp"
#include "sheetdrop/http/Request.hpp"

namespace sheetdrop {

using Handler = std::function<http::Response(const http::Request&)>;

// Looks at the request head only; a response means the body is never read
using Screen = std::function<std::optional<http::Response>(const http::Request&)>;

class endpoint
{
    Handler handler;
    HttpRequest rest_type;
    std::string path;
    Screen screen;

public:
    endpoint(Handler handler,
             HttpRequest rest_type,
             const std::string& path,
             Screen screen = nullptr)
        : handler(std::move(handler)), rest_type(rest_type), path(path), screen(std::move(screen)) {}

    std::string get_path() const { return path; }
    const Handler& get_handler() const { return handler; }
    HttpRequest get_rest_type() const { return rest_type; }
    const Screen& get_screen() const { return screen; }

    // HEAD is answered by the GET handler
    bool accepts(HttpRequest method) const {
        return method == rest_type || (method == HttpRequest::HEAD && rest_type == HttpRequest::GET);
    }
};

} // namespace sheetdrop
