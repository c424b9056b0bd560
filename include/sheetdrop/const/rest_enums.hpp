#pragma once

#include <string>
#include <stdexcept>

enum class HttpRequest {
    GET,
    HEAD,
    POST,
    OPTIONS,
};


inline const char* to_string(HttpRequest method) {
    switch(method) {
        case HttpRequest::GET: return "GET";
        case HttpRequest::HEAD: return "HEAD";
        case HttpRequest::POST: return "POST";
        case HttpRequest::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}


inline HttpRequest from_string(const std::string& method) {
    if (method == "GET") return HttpRequest::GET;
    else if (method == "HEAD") return HttpRequest::HEAD;
    else if (method == "POST") return HttpRequest::POST;
    else if (method == "OPTIONS") return HttpRequest::OPTIONS;
    else throw std::invalid_argument("Unsupported method (" + method + ")");
}
