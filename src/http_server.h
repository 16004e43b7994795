#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>

namespace malsand {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty if absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP server - no external dependencies.
// Paths registered with a trailing '/' also match everything below them
// (/status/{job_id}); the longest registered prefix wins.
class HttpServer {
public:
    HttpServer(int port = 8443, size_t max_request_size = 0);
    ~HttpServer();

    // Register route handlers
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks)
    void start();

    // Stop server
    void stop();

    // Route a parsed request to its handler (404 when nothing matches)
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    int port_;
    size_t max_request_size_;
    int server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace malsand
