/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: http.cpp

    Description:
        HTTP/1.1 server and client over POSIX sockets.

        Limits:
        - Request/response head: 64 KB
        - Body: 16 MB
        - Server-side socket timeouts: 10 s per send/recv

*******************************************************************************/

#include "transfer/http.h"
#include "common/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace dss {

namespace {

constexpr size_t kMaxHeadBytes = 64 * 1024;
constexpr size_t kMaxBodyBytes = 16 * 1024 * 1024;
constexpr int kServerSocketTimeoutMs = 10000;
constexpr int kAcceptPollMs = 200;

void close_socket(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Closes the descriptor when the scope ends.
class SocketGuard {
private:
    int fd_;

public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { close_socket(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }
};

void set_socket_timeouts(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw HttpError("Timed out sending data");
            }
            throw HttpError("Send failed: " + std::string(strerror(errno)));
        }
        sent += static_cast<size_t>(n);
    }
}

// Returns bytes read; 0 on orderly close. Throws on error or timeout.
size_t recv_some(int fd, std::string& buffer) {
    char chunk[4096];
    while (true) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n >= 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw HttpError("Timed out waiting for data");
        }
        throw HttpError("Receive failed: " + std::string(strerror(errno)));
    }
}

// Reads until the blank line ending the head. Returns the offset of the
// body within `buffer`.
size_t read_head(int fd, std::string& buffer) {
    while (true) {
        size_t end = buffer.find("\r\n\r\n");
        if (end != std::string::npos) return end + 4;
        if (buffer.size() > kMaxHeadBytes) {
            throw HttpError("Message head too large");
        }
        if (recv_some(fd, buffer) == 0) {
            throw HttpError("Connection closed before end of message head");
        }
    }
}

std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

// Parses "Name: value" lines after the first line of `head`.
std::map<std::string, std::string> parse_headers(const std::string& head) {
    std::map<std::string, std::string> headers;
    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);  // start line
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            throw HttpError("Malformed header line");
        }
        headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return headers;
}

size_t content_length(const std::map<std::string, std::string>& headers, bool& present) {
    auto it = headers.find("content-length");
    present = it != headers.end();
    if (!present) return 0;

    const std::string& value = it->second;
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw HttpError("Invalid Content-Length");
    }
    unsigned long long length = std::stoull(value);
    if (length > kMaxBodyBytes) {
        throw HttpError("Body too large");
    }
    return static_cast<size_t>(length);
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            params[url_decode(pair)] = "";
        } else {
            params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
    }
    return params;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

HttpRequest read_request(int fd) {
    std::string buffer;
    size_t body_start = read_head(fd, buffer);
    std::string head = buffer.substr(0, body_start);

    HttpRequest request;
    std::string start_line = head.substr(0, head.find("\r\n"));
    std::istringstream start(start_line);
    std::string target;
    std::string version;
    if (!(start >> request.method >> target >> version) || version.rfind("HTTP/1.", 0) != 0) {
        throw HttpError("Malformed request line");
    }

    size_t question = target.find('?');
    request.path = url_decode(target.substr(0, question));
    if (question != std::string::npos) {
        request.query = parse_query(target.substr(question + 1));
    }
    request.headers = parse_headers(head);

    bool has_length = false;
    size_t length = content_length(request.headers, has_length);
    request.body = buffer.substr(body_start);
    while (request.body.size() < length) {
        if (recv_some(fd, request.body) == 0) {
            throw HttpError("Connection closed before end of body");
        }
    }
    request.body.resize(length);
    return request;
}

std::string format_response(const HttpResponse& response) {
    std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " +
                      reason_phrase(response.status) + "\r\n";
    out += "Content-Type: " + response.content_type + "\r\n";
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += response.body;
    return out;
}

int connect_with_timeout(const struct addrinfo* ai, int timeout_ms) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) return -1;

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno != EINPROGRESS) {
        close_socket(fd);
        return -1;
    }
    if (rc != 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ready;
        do {
            ready = ::poll(&pfd, 1, timeout_ms);
        } while (ready < 0 && errno == EINTR);

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (ready <= 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            close_socket(fd);
            return -1;
        }
    }

    fcntl(fd, F_SETFL, flags);
    return fd;
}

} // namespace

//==============================================================================
// HELPERS
//==============================================================================

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string url_decode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::query_param(const std::string& name) const {
    auto it = query.find(name);
    return it == query.end() ? std::string() : it->second;
}

Url parse_url(const std::string& url) {
    std::string rest = url;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    } else if (rest.find("://") != std::string::npos) {
        throw HttpError("Unsupported URL scheme");
    }

    Url parsed;
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parsed.path = slash == std::string::npos ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        std::string port = authority.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw HttpError("Invalid port in URL");
        }
        int value = std::stoi(port);
        if (value <= 0 || value > 65535) {
            throw HttpError("Invalid port in URL");
        }
        parsed.port = static_cast<uint16_t>(value);
    } else {
        parsed.host = authority;
    }

    if (parsed.host.empty()) {
        throw HttpError("URL has no host");
    }
    return parsed;
}

//==============================================================================
// CLIENT
//==============================================================================

HttpResponse http_request(const std::string& method,
                          const std::string& url,
                          const std::map<std::string, std::string>& headers,
                          const std::string& body,
                          int timeout_ms) {
    Url target = parse_url(url);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string port = std::to_string(target.port);
    int rc = getaddrinfo(target.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw HttpError("Cannot resolve " + target.host + ": " + gai_strerror(rc));
    }

    int fd = -1;
    for (struct addrinfo* ai = results; ai != nullptr && fd < 0; ai = ai->ai_next) {
        fd = connect_with_timeout(ai, timeout_ms);
    }
    freeaddrinfo(results);
    if (fd < 0) {
        throw HttpError("Cannot connect to " + target.host + ":" + port);
    }

    SocketGuard guard(fd);
    set_socket_timeouts(fd, timeout_ms);

    std::string request = method + " " + target.path + " HTTP/1.1\r\n";
    request += "Host: " + target.host + ":" + port + "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += "Connection: close\r\n";
    for (const auto& [name, value] : headers) {
        request += name + ": " + value + "\r\n";
    }
    request += "\r\n";
    request += body;
    send_all(fd, request);

    std::string buffer;
    size_t body_start = read_head(fd, buffer);
    std::string head = buffer.substr(0, body_start);

    HttpResponse response;
    std::istringstream status_line(head.substr(0, head.find("\r\n")));
    std::string version;
    if (!(status_line >> version >> response.status) || version.rfind("HTTP/1.", 0) != 0) {
        throw HttpError("Malformed status line");
    }

    auto response_headers = parse_headers(head);
    auto type = response_headers.find("content-type");
    response.content_type = type == response_headers.end() ? "" : type->second;

    bool has_length = false;
    size_t length = content_length(response_headers, has_length);
    response.body = buffer.substr(body_start);
    if (has_length) {
        while (response.body.size() < length) {
            if (recv_some(fd, response.body) == 0) {
                throw HttpError("Connection closed before end of body");
            }
        }
        response.body.resize(length);
    } else {
        while (recv_some(fd, response.body) > 0) {
            if (response.body.size() > kMaxBodyBytes) {
                throw HttpError("Body too large");
            }
        }
    }
    return response;
}

//==============================================================================
// SERVER
//==============================================================================

HttpServer::HttpServer(uint16_t port)
    : requested_port_(port),
      bound_port_(0),
      server_socket_(-1),
      running_(false),
      active_connections_(0) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::add_handler(const std::string& method, const std::string& path, Handler handler) {
    handlers_[std::make_pair(method, path)] = std::move(handler);
}

bool HttpServer::setup_server_socket() {
    server_socket_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_socket_ < 0) {
        Logger::error("Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        Logger::warning("Failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(requested_port_);

    if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        Logger::error("Failed to bind port " + std::to_string(requested_port_) + ": " +
                      std::string(strerror(errno)));
        close_socket(server_socket_);
        return false;
    }

    if (listen(server_socket_, 64) < 0) {
        Logger::error("Failed to listen: " + std::string(strerror(errno)));
        close_socket(server_socket_);
        return false;
    }

    socklen_t len = sizeof(address);
    if (getsockname(server_socket_, reinterpret_cast<struct sockaddr*>(&address), &len) == 0) {
        bound_port_ = ntohs(address.sin_port);
    } else {
        bound_port_ = requested_port_;
    }

    Logger::info("HTTP server bound to port " + std::to_string(bound_port_));
    return true;
}

bool HttpServer::start() {
    if (running_) return true;
    if (!setup_server_socket()) {
        return false;
    }
    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_connections, this);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close_socket(server_socket_);

    std::unique_lock<std::mutex> lock(connections_mutex_);
    connections_cv_.wait(lock, [this] { return active_connections_ == 0; });
    Logger::info("HTTP server on port " + std::to_string(bound_port_) + " stopped");
}

void HttpServer::accept_connections() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = server_socket_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready <= 0) continue;

        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int client_socket = accept(server_socket_,
                                   reinterpret_cast<struct sockaddr*>(&client_addr),
                                   &addr_len);
        if (client_socket < 0) {
            if (running_ && errno != EINTR && errno != EAGAIN) {
                Logger::error("Accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }

        set_socket_timeouts(client_socket, kServerSocketTimeoutMs);

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            active_connections_++;
        }
        std::thread(&HttpServer::handle_connection, this, client_socket).detach();
    }
}

void HttpServer::handle_connection(int client_socket) {
    HttpResponse response;
    try {
        HttpRequest request = read_request(client_socket);
        response = dispatch(request);
    } catch (const HttpError& e) {
        Logger::debug("Rejected malformed HTTP request: " + std::string(e.what()));
        response = HttpResponse(400, "{\"successful\":false,\"message\":\"Bad request\",\"data\":null}");
    } catch (const std::exception& e) {
        Logger::debug("Rejected HTTP request: " + std::string(e.what()));
        response = HttpResponse(400, "{\"successful\":false,\"message\":\"Bad request\",\"data\":null}");
    }

    try {
        send_all(client_socket, format_response(response));
    } catch (const HttpError& e) {
        Logger::debug("Failed to send HTTP response: " + std::string(e.what()));
    }

    ::shutdown(client_socket, SHUT_RDWR);
    close_socket(client_socket);

    // Notify under the lock: stop() may destroy the server once it sees zero.
    std::lock_guard<std::mutex> lock(connections_mutex_);
    active_connections_--;
    connections_cv_.notify_all();
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) const {
    auto it = handlers_.find(std::make_pair(request.method, request.path));
    if (it == handlers_.end()) {
        bool path_known = std::any_of(handlers_.begin(), handlers_.end(),
            [&request](const auto& entry) { return entry.first.second == request.path; });
        if (path_known) {
            return HttpResponse(405, "{\"successful\":false,\"message\":\"Method not allowed\",\"data\":null}");
        }
        return HttpResponse(404, "{\"successful\":false,\"message\":\"Not found\",\"data\":null}");
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        Logger::error("Handler for " + request.method + " " + request.path + " failed: " + e.what());
        return HttpResponse(500, "{\"successful\":false,\"message\":\"Internal server error\",\"data\":null}");
    }
}

} // namespace dss
