/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: http.h

    Description:
        Minimal HTTP/1.1 over POSIX sockets for the inter-instance channel,
        the administrative endpoints and the anonymizer client.

        Server:
        - One accept thread; one detached handler thread per connection
        - One request per connection, Content-Length bodies only,
          "Connection: close" on every reply
        - Handlers registered by (method, path); query strings are parsed
          into HttpRequest::query
        - Port 0 binds an ephemeral port, readable through port()

        Client:
        - http_request() resolves with getaddrinfo, connects with a timeout
          and applies the same timeout to every send/recv (SO_SNDTIMEO /
          SO_RCVTIMEO), so an unreachable peer costs at most that long
        - Only plain "http://host[:port]/path" URLs

    Error Handling:
        The client throws HttpError on resolution, connection, timeout or
        protocol failures. The server answers 400/404/500 itself and never
        lets a handler exception escape its connection thread.

*******************************************************************************/

#ifndef HTTP_H
#define HTTP_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace dss {

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what) : std::runtime_error(what) {}
};

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string body;

    // Empty when absent. `name` is matched case-insensitively.
    std::string header(const std::string& name) const;
    std::string query_param(const std::string& name) const;
};

struct HttpResponse {
    int status;
    std::string content_type;
    std::string body;

    HttpResponse() : status(200), content_type("application/json") {}
    HttpResponse(int code, std::string payload)
        : status(code), content_type("application/json"), body(std::move(payload)) {}
};

struct Url {
    std::string host;
    uint16_t port;
    std::string path;

    Url() : port(80) {}
};

// Accepts "http://host[:port][/path]" and bare "host[:port][/path]".
// Throws HttpError.
Url parse_url(const std::string& url);

std::string url_decode(const std::string& value);
std::string to_lower(std::string value);

HttpResponse http_request(const std::string& method,
                          const std::string& url,
                          const std::map<std::string, std::string>& headers,
                          const std::string& body,
                          int timeout_ms);

//==============================================================================
// SERVER
//==============================================================================

class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

private:
    uint16_t requested_port_;
    std::atomic<uint16_t> bound_port_;
    int server_socket_;
    std::atomic<bool> running_;
    std::thread accept_thread_;

    std::map<std::pair<std::string, std::string>, Handler> handlers_;

    // Connection threads are detached; stop() waits for them to drain.
    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    int active_connections_;

    bool setup_server_socket();
    void accept_connections();
    void handle_connection(int client_socket);
    HttpResponse dispatch(const HttpRequest& request) const;

public:
    explicit HttpServer(uint16_t port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Register before start().
    void add_handler(const std::string& method, const std::string& path, Handler handler);

    bool start();
    void stop();

    bool is_running() const { return running_; }
    uint16_t port() const { return bound_port_; }
};

} // namespace dss

#endif // HTTP_H
