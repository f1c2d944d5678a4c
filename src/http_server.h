#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>
#include "constants.h"

namespace cloudrun {

// Header names compare case-insensitively
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;     // Without the query string
    std::string query;    // After '?', may be empty
    HttpHeaders headers;
    std::string body;
    std::string client_ip;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    HttpHeaders headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Takes over a connection after the WebSocket handshake. The server closes
// the socket once the handler returns.
using WebSocketHandler = std::function<void(int client_fd, const HttpRequest&)>;

// Minimal HTTP/1.1 server with WebSocket upgrade, one thread per connection
class HttpServer {
public:
    explicit HttpServer(int port = DEFAULT_PORT);
    ~HttpServer();

    // Register route handlers
    void route(const std::string& method, const std::string& path, HandlerFunc handler);
    void websocket_route(const std::string& path, WebSocketHandler handler);

    // Start server (blocks until stop())
    void start();

    // Stop server
    void stop();

    // Route a parsed request to its handler
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;
    std::map<std::string, WebSocketHandler> websocket_routes_;

    void handle_client(int client_fd, const std::string& client_ip);
    bool read_request(int client_fd, std::string& request_data);
    void upgrade(int client_fd, const HttpRequest& req, const WebSocketHandler& handler);
};

// Write the whole buffer to a socket; false on error or peer gone
bool send_all(int fd, const void* data, size_t len);

} // namespace cloudrun
