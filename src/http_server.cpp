#include "http_server.h"
#include "constants.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace malsand {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = write(fd, data.data() + sent, data.size() - sent);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

std::string error_body(const std::string& message) {
    std::string escaped;
    for (char c : message) {
        if (c == '"' || c == '\\') escaped += '\\';
        if (static_cast<unsigned char>(c) < 0x20) continue;
        escaped += c;
    }
    return "{\"error\":\"" + escaped + "\"}";
}

HttpResponse payload_too_large(size_t limit) {
    HttpResponse resp;
    resp.status_code = 413;
    resp.body = error_body("Request exceeds " + std::to_string(limit / (1024 * 1024)) + "MB limit");
    return resp;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return "";
}

HttpServer::HttpServer(int port, size_t max_request_size)
    : port_(port),
      max_request_size_(max_request_size ? max_request_size : MAX_REQUEST_SIZE),
      server_fd_(-1),
      running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::start() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    running_ = true;
    std::cout << "[HTTP] Listening on port " << port_ << std::endl;

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        char ip_buffer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buffer, sizeof(ip_buffer));
        std::string client_ip = ip_buffer;

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        if (request_data.size() + bytes_read > max_request_size_) {
            write_all(client_fd, build_response(payload_too_large(max_request_size_)));
            return;
        }
        request_data.append(buffer, bytes_read);

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        std::string length_str = parse_request(request_data.substr(0, header_end + 4))
                                     .header("Content-Length");
        if (length_str.empty()) break;  // No body

        size_t content_length = 0;
        try {
            content_length = std::stoul(length_str);
        } catch (const std::exception&) {
            HttpResponse resp;
            resp.status_code = 400;
            resp.body = error_body("Invalid Content-Length");
            write_all(client_fd, build_response(resp));
            return;
        }

        size_t expected_size = header_end + 4 + content_length;
        if (expected_size > max_request_size_) {
            write_all(client_fd, build_response(payload_too_large(max_request_size_)));
            return;
        }

        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                              std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        break;
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);
    std::cout << "[HTTP] " << client_ip << " " << req.method << " " << req.path
              << " -> " << resp.status_code << std::endl;
    write_all(client_fd, build_response(resp));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    const HandlerFunc* handler = nullptr;

    auto exact = routes_.find(req.method + " " + req.path);
    if (exact != routes_.end()) {
        handler = &exact->second;
    } else {
        size_t best_length = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string prefix = pattern.substr(space_pos + 1);
            if (method != req.method || prefix.size() < 2 || prefix.back() != '/') continue;
            if (req.path.compare(0, prefix.size(), prefix) == 0 && prefix.size() > best_length) {
                handler = &candidate;
                best_length = prefix.size();
            }
        }
    }

    HttpResponse resp;
    if (!handler) {
        resp.status_code = 404;
        resp.body = error_body("Not found");
        return resp;
    }
    try {
        resp = (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[HTTP] Handler error for " << req.path << ": " << e.what() << std::endl;
        resp = HttpResponse();
        resp.status_code = 500;
        resp.body = error_body(e.what());
    }
    return resp;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, header_end);
    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
        size_t query = req.path.find('?');
        if (query != std::string::npos) req.path.erase(query);
    }

    // Parse headers
    while (std::getline(stream, line) && line != "\r" && !line.empty()) {
        if (line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    // Body bytes are kept exactly
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    out << resp.body;

    return out.str();
}

} // namespace malsand
