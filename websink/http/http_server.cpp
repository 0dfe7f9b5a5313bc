/*
 * HTTP Server Module
 *
 * Request parsing, response serialization and the accept/worker threads
 */

#include "http_server.h"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <errno.h>

namespace http {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string Request::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// Response implementation
Response::Response()
    : status_code_(200)
    , status_message_("OK")
    , content_type_("text/plain")
{}

static const char* status_text(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

void Response::set_status(int code, const std::string& message) {
    status_code_ = code;
    status_message_ = message.empty() ? status_text(code) : message;
}

void Response::set_content_type(const std::string& content_type) {
    content_type_ = content_type;
}

void Response::set_body(const std::string& body) {
    body_ = body;
}

void Response::add_header(const std::string& name, const std::string& value) {
    extra_headers_ += name + ": " + value + "\r\n";
}

std::string Response::build() const {
    std::string response = "HTTP/1.1 " + std::to_string(status_code_) + " " + status_message_ + "\r\n";
    response += "Content-Type: " + content_type_ + "\r\n";
    response += "Content-Length: " + std::to_string(body_.size()) + "\r\n";
    response += "Connection: close\r\n";
    if (!extra_headers_.empty()) {
        response += extra_headers_;
    }
    response += "\r\n";
    response += body_;
    return response;
}

Response Response::json(const std::string& json_body, int status) {
    Response resp;
    resp.set_status(status);
    resp.set_content_type("application/json");
    resp.set_body(json_body);
    return resp;
}

Response Response::text(const std::string& text, int status) {
    Response resp;
    resp.set_status(status);
    resp.set_content_type("text/plain");
    resp.set_body(text);
    return resp;
}

Response Response::not_found() {
    return text("Not Found", 404);
}

bool parse_request(const std::string& request, Request& req) {
    // Parse request line: METHOD PATH HTTP/1.1
    size_t line_end = request.find("\r\n");
    if (line_end == std::string::npos) return false;

    size_t method_end = request.find(' ');
    if (method_end == std::string::npos || method_end > line_end) return false;

    req.method = request.substr(0, method_end);

    size_t path_start = method_end + 1;
    size_t path_end = request.find(' ', path_start);
    if (path_end == std::string::npos || path_end > line_end) return false;

    req.path = request.substr(path_start, path_end - path_start);
    if (req.method.empty() || req.path.empty()) return false;

    // Strip query string from path
    size_t query_pos = req.path.find('?');
    if (query_pos != std::string::npos) {
        req.path = req.path.substr(0, query_pos);
    }

    // Headers up to the blank line
    size_t headers_end = request.find("\r\n\r\n");
    size_t pos = line_end + 2;
    size_t limit = headers_end != std::string::npos ? headers_end : request.size();
    while (pos < limit) {
        size_t end = request.find("\r\n", pos);
        if (end == std::string::npos || end > limit) end = limit;
        std::string line = request.substr(pos, end - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        pos = end + 2;
    }

    // Extract body (after \r\n\r\n)
    if (headers_end != std::string::npos) {
        req.body = request.substr(headers_end + 4);
    }

    return true;
}

// Server implementation
Server::Server()
    : port_(0)
    , server_fd_(-1)
    , running_(false)
{}

Server::~Server() {
    stop();
}

// Bind and listen on port (0 = kernel's choice); returns the fd or -1
static int open_listener(int port, int* bound_port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        fprintf(stderr, "HTTP: Failed to create socket: %s\n", strerror(errno));
        return -1;
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        fprintf(stderr, "HTTP: Warning: Failed to set SO_REUSEADDR: %s\n", strerror(errno));
    }

    // The accept loop polls, so the listener must never block
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        fprintf(stderr, "HTTP: Failed to set non-blocking mode: %s\n", strerror(errno));
        close(fd);
        return -1;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        fprintf(stderr, "HTTP: Failed to bind port %d: %s\n", port, strerror(errno));
        close(fd);
        return -1;
    }
    if (listen(fd, 16) < 0) {
        fprintf(stderr, "HTTP: Failed to listen on port %d: %s\n", port, strerror(errno));
        close(fd);
        return -1;
    }

    socklen_t len = sizeof(addr);
    *bound_port = getsockname(fd, (struct sockaddr*)&addr, &len) == 0 ? ntohs(addr.sin_port) : port;
    return fd;
}

bool Server::start(int port, RequestHandler handler) {
    if (running_) {
        fprintf(stderr, "HTTP: Server already running on port %d\n", port_);
        return false;
    }

    int bound_port = 0;
    server_fd_ = open_listener(port, &bound_port);
    if (server_fd_ < 0) {
        return false;
    }

    port_ = bound_port;
    handler_ = std::move(handler);
    running_ = true;
    thread_ = std::thread(&Server::run, this);

    fprintf(stderr, "HTTP: Listening on port %d\n", port_);
    return true;
}

void Server::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
    reap_workers(true);
}

void Server::run() {
    while (running_) {
        reap_workers(false);

        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 100);
        if (ret <= 0) continue;

        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) continue;

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{
            std::thread([this, client_fd, done]() {
                handle_client(client_fd);
                close(client_fd);
                done->store(true);
            }),
            done
        });
    }
}

void Server::reap_workers(bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (all || it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

Server::ReadResult Server::read_request(int client_fd, std::string& raw) {
    // Blocking reads with a timeout so a stalled client cannot pin a worker
    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        fprintf(stderr, "HTTP: Warning: Failed to set receive timeout: %s\n", strerror(errno));
    }

    char buffer[8192];
    size_t expected = std::string::npos;

    while (true) {
        ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            // Peer closed or timed out before the header block (or the body
            // it announced) was complete
            return ReadResult::Malformed;
        }
        raw.append(buffer, static_cast<size_t>(n));

        size_t headers_end = raw.find("\r\n\r\n");
        if (headers_end == std::string::npos) {
            if (raw.size() > MAX_BODY_SIZE) return ReadResult::TooLarge;
            continue;
        }

        if (expected == std::string::npos) {
            Request head;
            if (!parse_request(raw, head)) return ReadResult::Malformed;
            std::string length = head.header("content-length");
            size_t body_size = length.empty() ? 0 : std::strtoul(length.c_str(), nullptr, 10);
            if (body_size > MAX_BODY_SIZE) return ReadResult::TooLarge;
            expected = headers_end + 4 + body_size;
        }

        if (raw.size() >= expected) {
            raw.resize(expected);
            return ReadResult::Ok;
        }
    }
}

void Server::send_response(int client_fd, const Response& resp) {
    std::string response_str = resp.build();
    size_t sent = 0;
    while (sent < response_str.size()) {
        ssize_t n = send(client_fd, response_str.data() + sent, response_str.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            fprintf(stderr, "HTTP: Failed to send response: %s\n", strerror(errno));
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

void Server::handle_client(int client_fd) {
    std::string raw;
    Request req;
    ReadResult result = read_request(client_fd, raw);
    if (result == ReadResult::TooLarge) {
        send_response(client_fd, Response::text("Payload Too Large", 413));
        return;
    }
    if (result != ReadResult::Ok || !parse_request(raw, req)) {
        send_response(client_fd, Response::text("Bad Request", 400));
        return;
    }

    // Call handler
    Response resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        fprintf(stderr, "HTTP: Handler error for %s %s: %s\n", req.method.c_str(), req.path.c_str(), e.what());
        resp = Response::text("Internal Server Error", 500);
    }
    send_response(client_fd, resp);
}

} // namespace http
