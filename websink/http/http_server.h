/*
 * HTTP Server Module
 *
 * Small HTTP/1.1 server hosting the signaling endpoint.
 * Non-blocking listen socket with polling; every accepted connection is
 * served on its own thread (one request per connection) so a slow
 * negotiation never holds up other requests.
 */

#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include <string>
#include <map>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>

namespace http {

// Largest request body accepted
constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

/**
 * HTTP Request Information
 */
struct Request {
    std::string method;      // GET, POST, etc.
    std::string path;        // URL path without query string
    std::map<std::string, std::string> headers;  // Lower-cased names
    std::string body;        // Request body content

    std::string header(const std::string& name) const;
};

/**
 * HTTP Response Builder
 */
class Response {
public:
    Response();

    void set_status(int code, const std::string& message = "");
    void set_content_type(const std::string& content_type);
    void set_body(const std::string& body);
    void add_header(const std::string& name, const std::string& value);

    int status() const { return status_code_; }
    const std::string& content_type() const { return content_type_; }
    const std::string& body() const { return body_; }

    std::string build() const;

    // Convenience methods
    static Response json(const std::string& json_body, int status = 200);
    static Response text(const std::string& text, int status = 200);
    static Response not_found();

private:
    int status_code_;
    std::string status_message_;
    std::string content_type_;
    std::string body_;
    std::string extra_headers_;
};

/**
 * Parse a raw request (request line, headers, body)
 * @return false if the request line is malformed
 */
bool parse_request(const std::string& raw, Request& req);

/**
 * HTTP Server
 *
 * Listens on a port and handles HTTP requests.
 * Uses a callback for request routing/handling.
 */
class Server {
public:
    // Request handler callback: receives request, returns response
    using RequestHandler = std::function<Response(const Request&)>;

    Server();
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Start server on specified port (0 = any free port)
    bool start(int port, RequestHandler handler);

    // Stop accepting, wait for in-flight requests to finish
    void stop();

    // Check if server is running
    bool is_running() const { return running_; }

    // Port actually bound (valid after start)
    int port() const { return port_; }

private:
    enum class ReadResult { Ok, Malformed, TooLarge };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run();
    void handle_client(int client_fd);
    ReadResult read_request(int client_fd, std::string& raw);
    void send_response(int client_fd, const Response& resp);
    void reap_workers(bool all);

    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::thread thread_;
    RequestHandler handler_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace http

#endif // HTTP_SERVER_H
