#include "http_server.h"
#include "websocket.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <strings.h>

namespace cloudrun {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return strcasecmp(a.c_str(), b.c_str()) < 0;
}

bool send_all(int fd, const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t sent = send(fd, p, len, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += sent;
        len -= static_cast<size_t>(sent);
    }
    return true;
}

namespace {

HttpResponse error_response(int status, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = "{\"error\":\"" + message + "\"}";
    return resp;
}

} // namespace

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::websocket_route(const std::string& path, WebSocketHandler handler) {
    websocket_routes_[path] = handler;
}

void HttpServer::start() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[Server] SO_REUSEADDR failed: " << strerror(errno) << std::endl;
    }

    // Bind
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

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    running_ = true;
    std::cout << "[Server] Listening on port " << port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        // Accepted sockets must not leak into docker client processes
        int client_fd = accept4(server_fd_, (struct sockaddr*)&client_addr, &client_len,
                                SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        // Get client IP
        char ip_buffer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buffer, sizeof(ip_buffer));
        std::string client_ip = ip_buffer;

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            try {
                handle_client(client_fd, client_ip);
            } catch (const std::exception& e) {
                std::cerr << "[Server] Connection from " << client_ip << " failed: "
                          << e.what() << std::endl;
            }
            close(client_fd);
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
}

bool HttpServer::read_request(int client_fd, std::string& request_data) {
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    // Headers first
    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read <= 0) {
            return false;
        }
        if (request_data.size() + static_cast<size_t>(bytes_read) > MAX_REQUEST_SIZE) {
            std::string resp = build_response(error_response(413, "Request too large"));
            send_all(client_fd, resp.data(), resp.size());
            return false;
        }
        request_data.append(buffer, static_cast<size_t>(bytes_read));
        header_end = request_data.find("\r\n\r\n");
    }

    // Then the body, if one is announced
    HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
    auto length_it = head.headers.find("Content-Length");
    if (length_it == head.headers.end()) {
        return true;
    }

    size_t content_length = 0;
    try {
        content_length = std::stoul(length_it->second);
    } catch (const std::exception&) {
        std::string resp = build_response(error_response(400, "Invalid Content-Length"));
        send_all(client_fd, resp.data(), resp.size());
        return false;
    }

    size_t expected_size = header_end + 4 + content_length;
    if (expected_size > MAX_REQUEST_SIZE) {
        std::string resp = build_response(error_response(413, "Request too large"));
        send_all(client_fd, resp.data(), resp.size());
        return false;
    }

    while (request_data.size() < expected_size) {
        bytes_read = read(client_fd, buffer,
                          std::min(sizeof(buffer), expected_size - request_data.size()));
        if (bytes_read <= 0) break;
        request_data.append(buffer, static_cast<size_t>(bytes_read));
    }
    return true;
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    if (!read_request(client_fd, request_data)) {
        return;
    }

    // Parse request
    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    if (req.method == "GET") {
        auto ws = websocket_routes_.find(req.path);
        if (ws != websocket_routes_.end()) {
            upgrade(client_fd, req, ws->second);
            return;
        }
    }

    HttpResponse resp = dispatch(req);

    // Send response
    std::string response_str = build_response(resp);
    if (!send_all(client_fd, response_str.data(), response_str.size())) {
        std::cerr << "[Server] Failed to send response to " << client_ip << std::endl;
    }
}

void HttpServer::upgrade(int client_fd, const HttpRequest& req, const WebSocketHandler& handler) {
    auto key = req.headers.find("Sec-WebSocket-Key");
    if (!WebSocketManager::is_websocket_upgrade(req.headers) || key == req.headers.end() ||
        key->second.empty()) {
        HttpResponse resp = error_response(426, "WebSocket upgrade required");
        resp.headers["Upgrade"] = "websocket";
        std::string out = build_response(resp);
        send_all(client_fd, out.data(), out.size());
        return;
    }

    std::string handshake = WebSocketManager::create_handshake_response(key->second);
    if (!send_all(client_fd, handshake.data(), handshake.size())) {
        return;
    }
    handler(client_fd, req);
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    // Check for exact match
    auto it = routes_.find(req.method + " " + req.path);
    const HandlerFunc* handler = it != routes_.end() ? &it->second : nullptr;

    // Longest prefix match otherwise
    if (!handler) {
        size_t best = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);
            if (method == req.method && path_pattern.size() > best &&
                path_pattern.back() == '/' && req.path.compare(0, path_pattern.size(), path_pattern) == 0) {
                best = path_pattern.size();
                handler = &candidate;
            }
        }
    }

    if (!handler) {
        return error_response(404, "Not found");
    }

    try {
        return (*handler)(req);
    } catch (const std::exception& e) {
        // Exception text may carry internals; log it, do not return it
        std::cerr << "[Server] Handler for " << req.method << " " << req.path << " failed: "
                  << e.what() << std::endl;
        return error_response(500, "Internal server error");
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;
    std::istringstream stream(raw);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t question = target.find('?');
        req.path = target.substr(0, question);
        if (question != std::string::npos) {
            req.query = target.substr(question + 1);
        }
    }

    // Parse headers
    while (std::getline(stream, line) && line != "\r" && !line.empty()) {
        if (line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
            req.headers[key] = value;
        }
    }

    // Rest is body
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    } else {
        size_t lf_end = raw.find("\n\n");
        if (lf_end != std::string::npos) {
            req.body = raw.substr(lf_end + 2);
        }
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 426: return "Upgrade Required";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace cloudrun
